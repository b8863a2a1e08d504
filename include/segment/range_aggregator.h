#pragma once

#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "config.h"
#include "segment/threshold_segmenter.h"
#include "table/channel_table.h"

namespace segment {

    // Суммы дельт всех каналов по диапазонам.
    // Столбцы: timestamps ("start-end") + каналы таблицы дельт.
    class SummaryTable {
    public:
        static constexpr const char *LABEL_COLUMN = "timestamps";

        struct Row {
            SegmentRange range; // - диапазон, давший строку (последний записанный).
            std::string label; // - "start-end".
            std::vector<double> sums; // - по одному значению на канал.
        };

        SummaryTable() = default;
        explicit SummaryTable(std::vector<std::string> channels);

        int rows() const { return static_cast<int>(rows_.size()); }
        bool empty() const { return rows_.empty(); }

        const std::vector<std::string> &channels() const { return channels_; }
        // LABEL_COLUMN, затем каналы.
        std::vector<std::string> columns() const;

        const Row &row(int r) const;
        const std::string &label(int r) const { return row(r).label; }
        double sum(int r, const std::string &channel) const;

        // Номер первой строки с данным start, -1 если нет.
        int find_row(int start) const;

        std::vector<double> column(const std::string &channel) const;

    private:
        friend class RangeAggregator;

        int channel_index(const std::string &channel) const;

        std::vector<std::string> channels_; // - каналы в порядке столбцов таблицы дельт.
        std::unordered_map<std::string, int> index_; // - имя канала -> номер суммы в строке.
        std::vector<Row> rows_; // - строки в порядке первой вставки ключа.
        std::map<std::pair<int, int>, int> keys_; // - ключ строки -> номер строки.
    };

    class RangeAggregator {
    public:
        explicit RangeAggregator(AggregationKey key = AggregationKey::StartIndex, LoggingConfig log_cfg = {});

        // Суммы берутся по строкам [start, min(end, N)), метка - по исходному end.
        // Бросает std::out_of_range для start < 0, start > end или start > N.
        SummaryTable aggregate(const table::DeltaTable &deltas,
                               const std::vector<SegmentRange> &ranges) const;

    private:
        AggregationKey key_; // - ключ строк: start или (start, end).
        LoggingConfig log_cfg_; // - настройки логирования.
    };

} // namespace segment
