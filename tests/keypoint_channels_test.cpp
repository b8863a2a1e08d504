#include <gtest/gtest.h>

#include <stdexcept>
#include "util/keypoint_channels.h"

TEST(KeypointChannels, NamesFollowKpScheme) {
    EXPECT_EQ(util::keypoint_channel(0, 'x'), "KP_0_x");
    EXPECT_EQ(util::keypoint_channel(17, 'y'), "KP_17_y");
    EXPECT_EQ(util::make_keypoint_channels(2),
              (std::vector<std::string>{"KP_0_x", "KP_0_y", "KP_1_x", "KP_1_y"}));
    EXPECT_TRUE(util::make_keypoint_channels(0).empty());
}

TEST(KeypointChannels, RejectsBadArguments) {
    EXPECT_THROW(util::keypoint_channel(-1, 'x'), std::invalid_argument);
    EXPECT_THROW(util::keypoint_channel(0, 'z'), std::invalid_argument);
}
