#include <toml++/toml.h>   // ДОЛЖНО БЫТЬ ПЕРВЫМ
#include "config.h"
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>


// ============================================================================
// Реализация загрузки config.toml
//
// Важно:
//  - Любая ошибка парсинга не должна "убивать" вызывающий код.
//  - В случае ошибки оставляем дефолты и возвращаем false.
//  - Все имена ключей должны соответствовать config.toml.
// ============================================================================


bool parse_leading_gap_policy(std::string_view text, LeadingGapPolicy &out) {
    if (text == "use_first_row") {
        out = LeadingGapPolicy::UseFirstRow;
        return true;
    }
    if (text == "strict") {
        out = LeadingGapPolicy::Strict;
        return true;
    }
    return false;
}

bool parse_range_policy(std::string_view text, RangePolicy &out) {
    if (text == "all_windows") {
        out = RangePolicy::AllWindows;
        return true;
    }
    if (text == "first_window") {
        out = RangePolicy::FirstWindow;
        return true;
    }
    return false;
}

bool parse_aggregation_key(std::string_view text, AggregationKey &out) {
    if (text == "start_index") {
        out = AggregationKey::StartIndex;
        return true;
    }
    if (text == "start_end") {
        out = AggregationKey::StartEnd;
        return true;
    }
    return false;
}

const char *to_string(LeadingGapPolicy policy) {
    return policy == LeadingGapPolicy::Strict ? "strict" : "use_first_row";
}

const char *to_string(RangePolicy policy) {
    return policy == RangePolicy::FirstWindow ? "first_window" : "all_windows";
}

const char *to_string(AggregationKey key) {
    return key == AggregationKey::StartEnd ? "start_end" : "start_index";
}


bool load_logging_config(const toml::table &tbl, LoggingConfig &cfg) {
// ---------------------------- [logging] ---------------------------
    try {
        const auto *logging = tbl["logging"].as_table();
        if (!logging) {
            throw std::runtime_error("missing [logging] table");
        }
        LoggingConfig loaded;
        loaded.delta_level_logger = read_required<bool>(*logging, "delta_level_logger");
        loaded.segmenter_level_logger = read_required<bool>(*logging, "segmenter_level_logger");
        loaded.aggregator_level_logger = read_required<bool>(*logging, "aggregator_level_logger");
        cfg = loaded;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "logging config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_analysis_config(const toml::table &tbl, AnalysisConfig &cfg) {
// ---------------------------- [analysis] --------------------------
    try {
        const auto *analysis = tbl["analysis"].as_table();
        if (!analysis) {
            throw std::runtime_error("missing [analysis] table");
        }
        AnalysisConfig loaded;
        loaded.threshold = read_required<double>(*analysis, "threshold");
        loaded.max_window = read_required<int>(*analysis, "max_window");
        loaded.reference_keypoint = read_required<int>(*analysis, "reference_keypoint");
        loaded.parallel_channels = read_required<bool>(*analysis, "parallel_channels");
        loaded.clip_to_table = (*analysis)["clip_to_table"].value_or(false); // необязательный

        const auto range_policy = read_required<std::string>(*analysis, "range_policy");
        if (!parse_range_policy(range_policy, loaded.range_policy)) {
            throw std::runtime_error("unknown range_policy '" + range_policy + "'");
        }
        const auto aggregation_key = read_required<std::string>(*analysis, "aggregation_key");
        if (!parse_aggregation_key(aggregation_key, loaded.aggregation_key)) {
            throw std::runtime_error("unknown aggregation_key '" + aggregation_key + "'");
        }
        const auto leading_gap = read_required<std::string>(*analysis, "leading_gap_policy");
        if (!parse_leading_gap_policy(leading_gap, loaded.leading_gap_policy)) {
            throw std::runtime_error("unknown leading_gap_policy '" + leading_gap + "'");
        }

        if (loaded.threshold < 0.0) {
            throw std::runtime_error("threshold must be >= 0");
        }
        if (loaded.max_window < 1) {
            throw std::runtime_error("max_window must be >= 1");
        }
        if (loaded.reference_keypoint < 0) {
            throw std::runtime_error("reference_keypoint must be >= 0");
        }

        cfg = loaded;
        std::cout << "[CFG] analysis: threshold=" << cfg.threshold
                  << " max_window=" << cfg.max_window
                  << " reference_keypoint=" << cfg.reference_keypoint
                  << " range_policy=" << to_string(cfg.range_policy)
                  << " clip_to_table=" << (cfg.clip_to_table ? "true" : "false")
                  << " aggregation_key=" << to_string(cfg.aggregation_key)
                  << " leading_gap_policy=" << to_string(cfg.leading_gap_policy)
                  << " parallel_channels=" << (cfg.parallel_channels ? "true" : "false")
                  << std::endl;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "analysis config load failed  " << e.what() << std::endl;
        return false;
    }
}
