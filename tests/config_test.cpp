#include <gtest/gtest.h>

#include "config.h"

namespace {

    constexpr const char *FULL_CONFIG = R"(
        [analysis]
        threshold = 12.5
        max_window = 20
        reference_keypoint = 4
        range_policy = "first_window"
        clip_to_table = true
        aggregation_key = "start_end"
        leading_gap_policy = "strict"
        parallel_channels = false

        [logging]
        delta_level_logger = true
        segmenter_level_logger = false
        aggregator_level_logger = true
    )";

}

TEST(Config, LoadsAnalysisTable) {
    const auto tbl = toml::parse(FULL_CONFIG);
    AnalysisConfig cfg;

    ASSERT_TRUE(load_analysis_config(tbl, cfg));
    EXPECT_DOUBLE_EQ(cfg.threshold, 12.5);
    EXPECT_EQ(cfg.max_window, 20);
    EXPECT_EQ(cfg.reference_keypoint, 4);
    EXPECT_EQ(cfg.range_policy, RangePolicy::FirstWindow);
    EXPECT_TRUE(cfg.clip_to_table);
    EXPECT_EQ(cfg.aggregation_key, AggregationKey::StartEnd);
    EXPECT_EQ(cfg.leading_gap_policy, LeadingGapPolicy::Strict);
    EXPECT_FALSE(cfg.parallel_channels);
}

TEST(Config, LoadsLoggingTable) {
    const auto tbl = toml::parse(FULL_CONFIG);
    LoggingConfig cfg;

    ASSERT_TRUE(load_logging_config(tbl, cfg));
    EXPECT_TRUE(cfg.delta_level_logger);
    EXPECT_FALSE(cfg.segmenter_level_logger);
    EXPECT_TRUE(cfg.aggregator_level_logger);
}

TEST(Config, IntegerThresholdIsAccepted) {
    const auto tbl = toml::parse(R"(
        [analysis]
        threshold = 10
        max_window = 30
        reference_keypoint = 0
        range_policy = "all_windows"
        aggregation_key = "start_index"
        leading_gap_policy = "use_first_row"
        parallel_channels = true
    )");
    AnalysisConfig cfg;
    ASSERT_TRUE(load_analysis_config(tbl, cfg));
    EXPECT_DOUBLE_EQ(cfg.threshold, 10.0);
    // clip_to_table необязателен
    EXPECT_FALSE(cfg.clip_to_table);
}

TEST(Config, MissingKeyKeepsDefaults) {
    const auto tbl = toml::parse(R"(
        [analysis]
        threshold = 7.0
    )");
    AnalysisConfig cfg;

    EXPECT_FALSE(load_analysis_config(tbl, cfg));
    EXPECT_DOUBLE_EQ(cfg.threshold, 0.0);
    EXPECT_EQ(cfg.max_window, 30);
}

TEST(Config, MissingTablesFail) {
    const auto tbl = toml::parse("title = \"empty\"");
    AnalysisConfig analysis;
    LoggingConfig logging;
    EXPECT_FALSE(load_analysis_config(tbl, analysis));
    EXPECT_FALSE(load_logging_config(tbl, logging));
}

TEST(Config, UnknownPolicyFails) {
    const auto tbl = toml::parse(R"(
        [analysis]
        threshold = 1.0
        max_window = 30
        reference_keypoint = 0
        range_policy = "greedy"
        aggregation_key = "start_index"
        leading_gap_policy = "use_first_row"
        parallel_channels = true
    )");
    AnalysisConfig cfg;
    EXPECT_FALSE(load_analysis_config(tbl, cfg));
    EXPECT_EQ(cfg.range_policy, RangePolicy::AllWindows);
    EXPECT_DOUBLE_EQ(cfg.threshold, 0.0);
}

TEST(Config, NegativeThresholdFails) {
    const auto tbl = toml::parse(R"(
        [analysis]
        threshold = -1.0
        max_window = 30
        reference_keypoint = 0
        range_policy = "all_windows"
        aggregation_key = "start_index"
        leading_gap_policy = "use_first_row"
        parallel_channels = true
    )");
    AnalysisConfig cfg;
    EXPECT_FALSE(load_analysis_config(tbl, cfg));
}

TEST(Config, ShippedConfigFileLoads) {
    const auto tbl = toml::parse_file(KPDELTA_CONFIG_PATH);
    AnalysisConfig analysis;
    LoggingConfig logging;
    EXPECT_TRUE(load_analysis_config(tbl, analysis));
    EXPECT_TRUE(load_logging_config(tbl, logging));
    EXPECT_EQ(analysis.max_window, 30);
}

TEST(Config, PolicyNamesRoundTrip) {
    RangePolicy range = RangePolicy::AllWindows;
    ASSERT_TRUE(parse_range_policy(to_string(RangePolicy::FirstWindow), range));
    EXPECT_EQ(range, RangePolicy::FirstWindow);

    AggregationKey key = AggregationKey::StartIndex;
    ASSERT_TRUE(parse_aggregation_key(to_string(AggregationKey::StartEnd), key));
    EXPECT_EQ(key, AggregationKey::StartEnd);

    LeadingGapPolicy gap = LeadingGapPolicy::UseFirstRow;
    ASSERT_TRUE(parse_leading_gap_policy(to_string(LeadingGapPolicy::Strict), gap));
    EXPECT_EQ(gap, LeadingGapPolicy::Strict);
    EXPECT_FALSE(parse_leading_gap_policy("lenient", gap));
}
