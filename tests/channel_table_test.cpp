#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>
#include "errors.h"
#include "table/channel_table.h"

using table::ChannelTable;

TEST(ChannelTable, FromRowsKeepsColumnOrder) {
    const auto t = ChannelTable::from_rows({"KP_0_x", "KP_0_y"}, {{1.0, 2.0}, {3.0, 4.0}, {5.0, 6.0}});

    EXPECT_EQ(t.rows(), 3);
    EXPECT_EQ(t.cols(), 2);
    EXPECT_EQ(t.channel_index("KP_0_y"), 1);
    EXPECT_DOUBLE_EQ(t.at(2, "KP_0_x"), 5.0);
    EXPECT_EQ(t.column("KP_0_y"), (std::vector<double>{2.0, 4.0, 6.0}));
}

TEST(ChannelTable, FromColumnsMatchesFromRows) {
    const auto by_rows = ChannelTable::from_rows({"a", "b"}, {{1.0, 2.0}, {3.0, 4.0}});
    const auto by_cols = ChannelTable::from_columns({"a", "b"}, {{1.0, 3.0}, {2.0, 4.0}});

    ASSERT_EQ(by_cols.rows(), 2);
    for (int r = 0; r < 2; ++r) {
        for (int c = 0; c < 2; ++c) {
            EXPECT_DOUBLE_EQ(by_rows.at(r, c), by_cols.at(r, c));
        }
    }
}

TEST(ChannelTable, MissingChannelThrows) {
    const auto t = ChannelTable::from_rows({"a"}, {{1.0}});
    EXPECT_FALSE(t.has_channel("b"));
    EXPECT_THROW(t.channel_index("b"), MissingChannelError);
    EXPECT_THROW(t.column("b"), MissingChannelError);
}

TEST(ChannelTable, RejectsMalformedInput) {
    EXPECT_THROW(ChannelTable({"a", "a"}, 1), std::invalid_argument);
    EXPECT_THROW(ChannelTable({"a", ""}, 1), std::invalid_argument);
    EXPECT_THROW(ChannelTable::from_rows({"a", "b"}, {{1.0, 2.0}, {3.0}}), std::invalid_argument);
    EXPECT_THROW(ChannelTable::from_columns({"a", "b"}, {{1.0, 2.0}, {3.0}}), std::invalid_argument);
    EXPECT_THROW(ChannelTable({"a", "b"}, cv::Mat1d(2, 3, 0.0)), std::invalid_argument);
}

TEST(ChannelTable, OutOfRangeCellThrows) {
    const auto t = ChannelTable::from_rows({"a"}, {{1.0}});
    EXPECT_THROW(t.at(1, 0), std::out_of_range);
    EXPECT_THROW(t.at(0, 1), std::out_of_range);
    EXPECT_THROW(t.column(3), std::out_of_range);
}

TEST(ChannelTable, CopiesSourceMatrix) {
    cv::Mat1d values(2, 1, 1.0);
    const ChannelTable t({"a"}, values);
    values(0, 0) = 42.0;
    EXPECT_DOUBLE_EQ(t.at(0, 0), 1.0);
}

TEST(ChannelTable, ZeroRowTableKeepsChannels) {
    const ChannelTable t({"a", "b", "c"}, cv::Mat1d());
    EXPECT_TRUE(t.empty());
    EXPECT_EQ(t.cols(), 3);
    EXPECT_TRUE(t.column("c").empty());
}
