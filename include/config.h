#pragma once

#include <string>
#include <string_view>
#include <stdexcept>
#include <toml++/toml.h>   // ОБЯЗАТЕЛЬНО, forward-decl НЕЛЬЗЯ


template <typename T>
static T read_required(const toml::table &tbl, std::string_view key) {
    const auto *node = tbl.get(key);
    if (!node) {
        throw std::runtime_error("missing key " + std::string(key));
    }
    const auto value = node->value<T>();
    if (!value) {
        throw std::runtime_error("invalid value for key " + std::string(key));
    }
    return *value;
}


// Что делать, если канал "появляется" до первой реальной детекции
// (значение в строке 0 равно нулю, а потом приходит ненулевое).
enum class LeadingGapPolicy : int {
    UseFirstRow = 0, // вычитаем value[0] (он же 0), т.е. delta = новое значение
    Strict           // бросаем NoPriorDetectionError
};

// Какие окна отдаёт ThresholdSegmenter для одного стартового индекса.
enum class RangePolicy : int {
    AllWindows = 0, // все окна, прошедшие порог
    FirstWindow     // только самое короткое окно
};

// Ключ строки в итоговой таблице сумм.
enum class AggregationKey : int {
    StartIndex = 0, // ключ = start, последняя запись побеждает
    StartEnd        // ключ = (start, end), каждая пара своей строкой
};

struct LoggingConfig {
    bool delta_level_logger = false;
    bool segmenter_level_logger = false;
    bool aggregator_level_logger = false;
};

struct AnalysisConfig {
    // -------------------------- [analysis] ----------------------------
    double threshold = 0.0; // - порог накопленного смещения опорной точки.
    int max_window = 30; // - максимальная длина окна (в строках таблицы дельт).
    int reference_keypoint = 0; // - индекс опорной точки (KP_<n>_x / KP_<n>_y).
    RangePolicy range_policy = RangePolicy::AllWindows; // - политика выдачи окон.
    bool clip_to_table = false; // - не выдавать окна, заканчивающиеся за последней строкой.
    AggregationKey aggregation_key = AggregationKey::StartIndex; // - ключ строк итоговой таблицы.
    LeadingGapPolicy leading_gap_policy = LeadingGapPolicy::UseFirstRow; // - поведение до первой детекции.
    bool parallel_channels = true; // - считать дельты по каналам параллельно.
};

bool parse_leading_gap_policy(std::string_view text, LeadingGapPolicy &out);
bool parse_range_policy(std::string_view text, RangePolicy &out);
bool parse_aggregation_key(std::string_view text, AggregationKey &out);

const char *to_string(LeadingGapPolicy policy);
const char *to_string(RangePolicy policy);
const char *to_string(AggregationKey key);

// Загрузчики не бросают исключений: при ошибке печатают причину в stderr,
// оставляют cfg без изменений и возвращают false.
bool load_logging_config(const toml::table &tbl, LoggingConfig &cfg);
bool load_analysis_config(const toml::table &tbl, AnalysisConfig &cfg);
