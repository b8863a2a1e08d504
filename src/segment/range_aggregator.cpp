#include "segment/range_aggregator.h"
#include "errors.h"

#include <algorithm>
#include <iostream>
#include <limits>
#include <opencv2/core.hpp>
#include <stdexcept>

/*
  RangeAggregator: суммы дельт каждого канала по диапазонам от ThresholdSegmenter.

  При AggregationKey::StartIndex строка идентифицируется только start:
  если несколько диапазонов начинаются с одного индекса, каждый следующий
  перезаписывает метку и суммы предыдущего (строка остаётся на своём месте).
  Т.к. сегментатор выдаёт окна по возрастанию end, выживает самое длинное.
 */

namespace segment {

    SummaryTable::SummaryTable(std::vector<std::string> channels)
            : channels_(std::move(channels)) {
        for (size_t c = 0; c < channels_.size(); ++c) {
            index_.emplace(channels_[c], static_cast<int>(c));
        }
    }

    std::vector<std::string> SummaryTable::columns() const {
        std::vector<std::string> out;
        out.reserve(channels_.size() + 1);
        out.emplace_back(LABEL_COLUMN);
        out.insert(out.end(), channels_.begin(), channels_.end());
        return out;
    }

    const SummaryTable::Row &SummaryTable::row(int r) const {
        if (r < 0 || r >= rows()) {
            throw std::out_of_range("SummaryTable: row " + std::to_string(r) + " out of range");
        }
        return rows_[static_cast<size_t>(r)];
    }

    int SummaryTable::channel_index(const std::string &channel) const {
        const auto it = index_.find(channel);
        if (it == index_.end()) {
            throw MissingChannelError(channel);
        }
        return it->second;
    }

    double SummaryTable::sum(int r, const std::string &channel) const {
        const int c = channel_index(channel);
        return row(r).sums[static_cast<size_t>(c)];
    }

    int SummaryTable::find_row(int start) const {
        const auto it = keys_.lower_bound({start, std::numeric_limits<int>::min()});
        if (it == keys_.end() || it->first.first != start) {
            return -1;
        }
        return it->second;
    }

    std::vector<double> SummaryTable::column(const std::string &channel) const {
        const auto c = static_cast<size_t>(channel_index(channel));
        std::vector<double> out;
        out.reserve(rows_.size());
        for (const auto &r : rows_) {
            out.push_back(r.sums[c]);
        }
        return out;
    }


    RangeAggregator::RangeAggregator(AggregationKey key, LoggingConfig log_cfg)
            : key_(key), log_cfg_(log_cfg) {}

    SummaryTable RangeAggregator::aggregate(const table::DeltaTable &deltas,
                                            const std::vector<SegmentRange> &ranges) const {
        const int n = deltas.rows();
        for (const auto &range : ranges) {
            if (range.start < 0 || range.start > range.end || range.start > n) {
                throw std::out_of_range("RangeAggregator: range " + range_label(range) +
                                        " outside delta table of " + std::to_string(n) + " rows");
            }
        }

        SummaryTable out(deltas.channels());
        const cv::Mat1d &values = deltas.values();
        const int width = deltas.cols();
        int overwritten = 0;

        for (const auto &range : ranges) {
            std::vector<double> sums(static_cast<size_t>(width), 0.0);
            // окно может заканчиваться за последней строкой: суммируем то, что есть
            const int end = std::min(range.end, n);
            if (end > range.start && width > 0) {
                cv::Mat1d total;
                cv::reduce(values.rowRange(range.start, end), total, 0, cv::REDUCE_SUM);
                sums.assign(total.begin(), total.end());
            }

            const std::pair<int, int> key(range.start,
                                          key_ == AggregationKey::StartEnd ? range.end : 0);
            SummaryTable::Row row{range, range_label(range), std::move(sums)};

            const auto it = out.keys_.find(key);
            if (it == out.keys_.end()) {
                out.keys_.emplace(key, out.rows());
                out.rows_.push_back(std::move(row));
            } else {
                out.rows_[static_cast<size_t>(it->second)] = std::move(row);
                ++overwritten;
            }
        }

        if (log_cfg_.aggregator_level_logger) {
            std::cout << "[AGG] aggregate: ranges=" << ranges.size()
                      << " rows=" << out.rows()
                      << " overwritten=" << overwritten
                      << " key=" << to_string(key_)
                      << std::endl;
        }
        return out;
    }

} // namespace segment
