#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <vector>
#include "config.h"
#include "motion/gap_state.h"
#include "table/channel_table.h"

namespace motion {

    // Смещения между соседними шагами с "перешагиванием" через пропуски детекций.
    //
    // Ноль в таблице координат означает "точка не найдена". Для каждого канала
    // независимо, переход i -> i+1:
    //   оба > 0          : delta = v[i+1] - v[i]
    //   0 -> >0          : delta = v[i+1] - v[last_known_good_index]
    //   0 -> 0           : delta = 0, серия нулей растёт
    //   >0 -> 0          : delta = 0, last_known_good_index = i
    class DeltaComputer {
    public:
        struct Config {
            LeadingGapPolicy leading_gap_policy = LeadingGapPolicy::UseFirstRow;
            bool parallel_channels = true;
        };

        DeltaComputer() = default;
        explicit DeltaComputer(Config cfg, LoggingConfig log_cfg = {});

        // Бросает EmptyInputError для таблицы без строк,
        // NoPriorDetectionError при Strict, std::invalid_argument для отрицательных/NaN координат.
        table::DeltaTable compute(const table::TrajectoryTable &trajectory);

        // Результаты последнего успешного compute(), по одному элементу на канал.
        const std::vector<std::vector<GapRecord>> &diagnostics() const { return diagnostics_; }
        const std::vector<GapState> &gap_states() const { return gap_states_; }

    private:
        static void scan_channel(const cv::Mat1d &values, int col, const std::string &channel,
                                 LeadingGapPolicy policy, cv::Mat1d &deltas,
                                 GapState &state, std::vector<GapRecord> &records);

        Config cfg_; // - политика и режим обхода каналов.
        LoggingConfig log_cfg_; // - настройки логирования.
        std::vector<GapState> gap_states_; // - итоговое состояние по каналам.
        std::vector<std::vector<GapRecord>> diagnostics_; // - переходы после серий нулей по каналам.
    };

} // namespace motion

// Точка входа без сохранения диагностики.
table::DeltaTable compute_deltas(const table::TrajectoryTable &trajectory,
                                 LeadingGapPolicy policy = LeadingGapPolicy::UseFirstRow);
