#pragma once

#include <string>
#include <vector>
#include "config.h"
#include "motion/delta_computer.h"
#include "segment/range_aggregator.h"
#include "segment/threshold_segmenter.h"
#include "table/channel_table.h"

// Пара каналов опорной точки, по которой режутся окна.
struct ReferencePair {
    std::string x_channel; // - например KP_0_x.
    std::string y_channel; // - например KP_0_y.

    static ReferencePair for_keypoint(int keypoint);
};

struct ThresholdSumsOptions {
    int max_window = segment::DEFAULT_MAX_WINDOW;
    RangePolicy range_policy = RangePolicy::AllWindows;
    bool clip_to_table = false;
    AggregationKey aggregation_key = AggregationKey::StartIndex;
};

// ThresholdSegmenter по опорной паре + RangeAggregator по всей таблице.
// Бросает MissingChannelError, если опорного канала нет в deltas.
segment::SummaryTable compute_threshold_sums(const table::DeltaTable &deltas,
                                             double threshold,
                                             const ReferencePair &reference = ReferencePair::for_keypoint(0),
                                             const ThresholdSumsOptions &options = ThresholdSumsOptions());

// Полный проход: координаты -> дельты -> диапазоны -> суммы, с настройками из config.toml.
class KeypointAnalyzer {
public:
    struct Result {
        table::DeltaTable deltas; // - таблица дельт.
        std::vector<segment::SegmentRange> ranges; // - все найденные диапазоны (до перезаписи).
        segment::SummaryTable summary; // - итоговые суммы.
        std::vector<std::vector<motion::GapRecord>> gaps; // - диагностика пропусков по каналам.
    };

    // Загружает [analysis] и [logging]; при ошибке остаются значения по умолчанию.
    explicit KeypointAnalyzer(const toml::table &tbl);
    explicit KeypointAnalyzer(AnalysisConfig cfg, LoggingConfig log_cfg = {});

    Result run(const table::TrajectoryTable &trajectory) const;

    const AnalysisConfig &config() const { return cfg_; }
    const LoggingConfig &logging() const { return log_cfg_; }
    ReferencePair reference() const { return ReferencePair::for_keypoint(cfg_.reference_keypoint); }

private:
    AnalysisConfig cfg_; // - параметры анализа.
    LoggingConfig log_cfg_; // - настройки логирования.
};
