#pragma once

#include <string>
#include <vector>
#include "config.h"

namespace segment {

    constexpr int DEFAULT_MAX_WINDOW = 30;

    // Диапазон строк таблицы дельт [start, end); end может быть больше числа строк.
    struct SegmentRange {
        int start = 0;
        int end = 0;

        int length() const { return end - start; }
    };

    inline bool operator==(const SegmentRange &a, const SegmentRange &b) {
        return a.start == b.start && a.end == b.end;
    }

    inline bool operator!=(const SegmentRange &a, const SegmentRange &b) {
        return !(a == b);
    }

    // "start-end", как в столбце timestamps итоговой таблицы.
    std::string range_label(const SegmentRange &range);

    // Ищет окна, в которых накопленное смещение опорной точки
    // (по x или по y) строго больше порога.
    class ThresholdSegmenter {
    public:
        struct Config {
            double threshold = 0.0; // - порог суммы дельт, >= 0.
            int max_window = DEFAULT_MAX_WINDOW; // - окна длиной до max_window - 1.
            RangePolicy range_policy = RangePolicy::AllWindows;
            bool clip_to_table = false; // - не выдавать окна с end > N.
        };

        // Бросает std::invalid_argument для threshold < 0 или max_window < 1.
        explicit ThresholdSegmenter(Config cfg, LoggingConfig log_cfg = {});

        // ref_x и ref_y - дельты опорной точки одинаковой длины N.
        // Окно (i, i+j) для j < max_window суммируется по строкам [i, min(i+j, N));
        // без clip_to_table end может быть больше N.
        // Результат упорядочен по start, затем по end.
        std::vector<SegmentRange> find_ranges(const std::vector<double> &ref_x,
                                              const std::vector<double> &ref_y) const;

        const Config &config() const { return cfg_; }

    private:
        // prefix[k] = values[0] + ... + values[k-1], prefix.size() == values.size() + 1.
        static std::vector<double> prefix_sums(const std::vector<double> &values);

        Config cfg_; // - параметры поиска окон.
        LoggingConfig log_cfg_; // - настройки логирования.
    };

} // namespace segment
