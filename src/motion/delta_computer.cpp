#include "motion/delta_computer.h"
#include <opencv2/core/utility.hpp>
#include "errors.h"

#include <algorithm>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

/*
  DeltaComputer: дельты координат между соседними шагами.

  Каналы независимы друг от друга, поэтому обходятся через cv::parallel_for_:
  каждый поток пишет только свой столбец deltas и свой элемент
  states/records/errors. Исключение канала сохраняется в errors[c] и
  пробрасывается после цикла (первое по номеру канала), чтобы результат
  не зависел от порядка потоков.
 */

namespace motion {

    namespace {
        // Координата допустима, если она >= 0 (NaN тоже отсекается).
        inline void check_coordinate(double v, const std::string &channel, int step) {
            if (!(v >= 0.0)) {
                throw std::invalid_argument("channel '" + channel + "' has invalid coordinate " +
                                            std::to_string(v) + " at step " + std::to_string(step));
            }
        }
    }

    DeltaComputer::DeltaComputer(Config cfg, LoggingConfig log_cfg)
            : cfg_(cfg), log_cfg_(log_cfg) {}

    void DeltaComputer::scan_channel(const cv::Mat1d &values, int col, const std::string &channel,
                                     LeadingGapPolicy policy, cv::Mat1d &deltas,
                                     GapState &state, std::vector<GapRecord> &records) {
        const int steps = values.rows;
        state = GapState{};
        records.clear();

        check_coordinate(values(0, col), channel, 0);
        state.has_detection = values(0, col) > 0.0;

        for (int i = 0; i + 1 < steps; ++i) {
            const double cur = values(i, col);
            const double next = values(i + 1, col);
            check_coordinate(next, channel, i + 1);

            if (cur > 0.0 && next > 0.0) {
                deltas(i, col) = next - cur;
            } else if (cur == 0.0 && next > 0.0) {
                // точка вернулась: меряем от последней реальной позиции, а не от нуля
                if (!state.has_detection && policy == LeadingGapPolicy::Strict) {
                    throw NoPriorDetectionError(channel, i);
                }
                deltas(i, col) = next - values(state.last_known_good_index, col);
                records.push_back(GapRecord{i, state.zero_run_length});
                state.zero_run_length = 0;
            } else if (cur == 0.0 && next == 0.0) {
                deltas(i, col) = 0.0;
                state.zero_run_length += 1;
            } else {
                // cur > 0, next == 0: точка пропала
                deltas(i, col) = 0.0;
                state.last_known_good_index = i;
                state.zero_run_length = 1;
            }

            if (next > 0.0) {
                state.has_detection = true;
            }
        }
    }

    table::DeltaTable DeltaComputer::compute(const table::TrajectoryTable &trajectory) {
        if (trajectory.empty()) {
            throw EmptyInputError("compute_deltas: input table has no rows");
        }

        const int steps = trajectory.rows();
        const int channels = trajectory.cols();
        const cv::Mat1d &values = trajectory.values();
        const auto &names = trajectory.channels();

        cv::Mat1d deltas(steps - 1, channels, 0.0);
        std::vector<GapState> states(static_cast<size_t>(channels));
        std::vector<std::vector<GapRecord>> records(static_cast<size_t>(channels));
        std::vector<std::exception_ptr> errors(static_cast<size_t>(channels));
        const LeadingGapPolicy policy = cfg_.leading_gap_policy;

        auto scan_range = [&](const cv::Range &range) {
            for (int c = range.start; c < range.end; ++c) {
                const auto idx = static_cast<size_t>(c);
                try {
                    scan_channel(values, c, names[idx], policy, deltas, states[idx], records[idx]);
                } catch (...) {
                    errors[idx] = std::current_exception();
                }
            }
        };

        if (cfg_.parallel_channels && channels > 1) {
            cv::parallel_for_(cv::Range(0, channels), scan_range);
        } else {
            scan_range(cv::Range(0, channels));
        }

        for (const auto &e : errors) {
            if (e) {
                std::rethrow_exception(e);
            }
        }

        gap_states_ = std::move(states);
        diagnostics_ = std::move(records);

        if (log_cfg_.delta_level_logger) {
            size_t bridged = 0;
            int longest_run = 0;
            for (const auto &channel_records : diagnostics_) {
                bridged += channel_records.size();
                for (const auto &r : channel_records) {
                    longest_run = std::max(longest_run, r.zero_run_length);
                }
            }
            std::cout << "[DELTA] compute: steps=" << steps
                      << " channels=" << channels
                      << " transitions=" << deltas.rows
                      << " bridged=" << bridged
                      << " longest_zero_run=" << longest_run
                      << " policy=" << to_string(policy)
                      << std::endl;
        }

        return table::DeltaTable(names, deltas);
    }

} // namespace motion

table::DeltaTable compute_deltas(const table::TrajectoryTable &trajectory, LeadingGapPolicy policy) {
    motion::DeltaComputer::Config cfg;
    cfg.leading_gap_policy = policy;
    motion::DeltaComputer computer(cfg);
    return computer.compute(trajectory);
}
