#include "segment/threshold_segmenter.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace segment {

    std::string range_label(const SegmentRange &range) {
        return std::to_string(range.start) + "-" + std::to_string(range.end);
    }

    ThresholdSegmenter::ThresholdSegmenter(Config cfg, LoggingConfig log_cfg)
            : cfg_(cfg), log_cfg_(log_cfg) {
        if (!(cfg_.threshold >= 0.0)) {
            throw std::invalid_argument("ThresholdSegmenter: threshold must be >= 0");
        }
        if (cfg_.max_window < 1) {
            throw std::invalid_argument("ThresholdSegmenter: max_window must be >= 1");
        }
    }

    std::vector<double> ThresholdSegmenter::prefix_sums(const std::vector<double> &values) {
        std::vector<double> prefix(values.size() + 1, 0.0);
        for (size_t k = 0; k < values.size(); ++k) {
            prefix[k + 1] = prefix[k] + values[k];
        }
        return prefix;
    }

    std::vector<SegmentRange> ThresholdSegmenter::find_ranges(const std::vector<double> &ref_x,
                                                              const std::vector<double> &ref_y) const {
        if (ref_x.size() != ref_y.size()) {
            throw std::invalid_argument("ThresholdSegmenter: reference channels differ in length (" +
                                        std::to_string(ref_x.size()) + " vs " +
                                        std::to_string(ref_y.size()) + ")");
        }

        const int n = static_cast<int>(ref_x.size());
        const std::vector<double> px = prefix_sums(ref_x);
        const std::vector<double> py = prefix_sums(ref_y);

        std::vector<SegmentRange> ranges;
        for (int i = 0; i < n; ++i) {
            const int last_j = cfg_.clip_to_table ? std::min(cfg_.max_window - 1, n - i)
                                                  : cfg_.max_window - 1;
            for (int j = 0; j <= last_j; ++j) {
                // хвост окна за концом таблицы просто обрезается
                const auto end = static_cast<size_t>(std::min(i + j, n));
                const double sum_x = px[end] - px[static_cast<size_t>(i)];
                const double sum_y = py[end] - py[static_cast<size_t>(i)];
                if (sum_x > cfg_.threshold || sum_y > cfg_.threshold) {
                    ranges.push_back(SegmentRange{i, i + j});
                    if (cfg_.range_policy == RangePolicy::FirstWindow) {
                        break;
                    }
                }
            }
        }

        if (log_cfg_.segmenter_level_logger) {
            std::cout << "[SEG] find_ranges: n=" << n
                      << " threshold=" << cfg_.threshold
                      << " max_window=" << cfg_.max_window
                      << " policy=" << to_string(cfg_.range_policy)
                      << " clip_to_table=" << (cfg_.clip_to_table ? "true" : "false")
                      << " ranges=" << ranges.size()
                      << std::endl;
        }
        return ranges;
    }

} // namespace segment
