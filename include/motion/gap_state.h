#pragma once

namespace motion {

    // Состояние сканирования одного канала (живёт только внутри DeltaComputer::compute).
    struct GapState {
        int last_known_good_index = 0; // - последний шаг с детекцией перед серией нулей.
        int zero_run_length = 0; // - длина текущей серии нулей.
        bool has_detection = false; // - была ли в канале хоть одна ненулевая точка.
    };

    // Диагностика: переход, на котором канал вернулся после нулей.
    struct GapRecord {
        int transition = -1; // - индекс перехода i -> i+1.
        int zero_run_length = 0; // - сколько нулей насчитано к этому моменту.
    };

} // namespace motion
