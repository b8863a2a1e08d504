#include "keypoint_analyzer.h"
#include "errors.h"
#include "util/keypoint_channels.h"

#include <iostream>
#include <utility>

/*
  Порядок вызовов:
  1) DeltaComputer::compute(trajectory)        - дельты по всем каналам
  2) ThresholdSegmenter::find_ranges(x, y)     - только опорная пара каналов
  3) RangeAggregator::aggregate(deltas, ranges) - суммы по всем каналам

  Все проверки аргументов (опорные каналы, порог, окно) выполняются до
  вычислений: либо полный результат, либо исключение без частичного вывода.
 */

namespace {

    segment::SummaryTable threshold_sums(const table::DeltaTable &deltas,
                                         const segment::ThresholdSegmenter &segmenter,
                                         const segment::RangeAggregator &aggregator,
                                         const ReferencePair &reference,
                                         std::vector<segment::SegmentRange> &ranges) {
        const std::vector<double> ref_x = deltas.column(reference.x_channel);
        const std::vector<double> ref_y = deltas.column(reference.y_channel);
        ranges = segmenter.find_ranges(ref_x, ref_y);
        return aggregator.aggregate(deltas, ranges);
    }

    void require_reference(const table::ChannelTable &tbl, const ReferencePair &reference) {
        if (!tbl.has_channel(reference.x_channel)) {
            throw MissingChannelError(reference.x_channel);
        }
        if (!tbl.has_channel(reference.y_channel)) {
            throw MissingChannelError(reference.y_channel);
        }
    }

    segment::ThresholdSegmenter::Config segmenter_config(double threshold, int max_window,
                                                          RangePolicy policy, bool clip_to_table) {
        segment::ThresholdSegmenter::Config cfg;
        cfg.threshold = threshold;
        cfg.max_window = max_window;
        cfg.range_policy = policy;
        cfg.clip_to_table = clip_to_table;
        return cfg;
    }

}

ReferencePair ReferencePair::for_keypoint(int keypoint) {
    return ReferencePair{util::keypoint_channel(keypoint, 'x'), util::keypoint_channel(keypoint, 'y')};
}

segment::SummaryTable compute_threshold_sums(const table::DeltaTable &deltas,
                                             double threshold,
                                             const ReferencePair &reference,
                                             const ThresholdSumsOptions &options) {
    require_reference(deltas, reference);

    const segment::ThresholdSegmenter segmenter(
            segmenter_config(threshold, options.max_window, options.range_policy, options.clip_to_table));
    const segment::RangeAggregator aggregator(options.aggregation_key);

    std::vector<segment::SegmentRange> ranges;
    return threshold_sums(deltas, segmenter, aggregator, reference, ranges);
}


KeypointAnalyzer::KeypointAnalyzer(const toml::table &tbl) {
    load_logging_config(tbl, log_cfg_);
    load_analysis_config(tbl, cfg_);
}

KeypointAnalyzer::KeypointAnalyzer(AnalysisConfig cfg, LoggingConfig log_cfg)
        : cfg_(cfg), log_cfg_(log_cfg) {}

KeypointAnalyzer::Result KeypointAnalyzer::run(const table::TrajectoryTable &trajectory) const {
    const ReferencePair ref = reference();
    require_reference(trajectory, ref);

    const segment::ThresholdSegmenter segmenter(
            segmenter_config(cfg_.threshold, cfg_.max_window, cfg_.range_policy, cfg_.clip_to_table), log_cfg_);
    const segment::RangeAggregator aggregator(cfg_.aggregation_key, log_cfg_);

    motion::DeltaComputer::Config delta_cfg;
    delta_cfg.leading_gap_policy = cfg_.leading_gap_policy;
    delta_cfg.parallel_channels = cfg_.parallel_channels;
    motion::DeltaComputer computer(delta_cfg, log_cfg_);

    Result result;
    result.deltas = computer.compute(trajectory);
    result.summary = threshold_sums(result.deltas, segmenter, aggregator, ref, result.ranges);
    result.gaps = computer.diagnostics();

    std::cout << "[ANALYZER] run: steps=" << trajectory.rows()
              << " channels=" << trajectory.cols()
              << " reference=" << ref.x_channel << "/" << ref.y_channel
              << " ranges=" << result.ranges.size()
              << " summary_rows=" << result.summary.rows()
              << std::endl;
    return result;
}
