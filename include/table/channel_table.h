#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace table {

    // Плотная таблица: строки = шаги времени, столбцы = именованные каналы
    // (например KP_0_x). Отображение имя -> столбец строится один раз.
    class ChannelTable {
    public:
        ChannelTable() = default;

        // Таблица rows x channels, заполненная нулями.
        explicit ChannelTable(std::vector<std::string> channels, int rows = 0);

        // values.cols должен совпадать с числом каналов (кроме values без строк).
        ChannelTable(std::vector<std::string> channels, cv::Mat1d values);

        static ChannelTable from_rows(std::vector<std::string> channels,
                                      const std::vector<std::vector<double>> &rows);

        static ChannelTable from_columns(std::vector<std::string> channels,
                                         const std::vector<std::vector<double>> &columns);

        int rows() const { return rows_; }
        int cols() const { return static_cast<int>(channels_.size()); }
        bool empty() const { return rows_ == 0; }

        const std::vector<std::string> &channels() const { return channels_; }
        bool has_channel(const std::string &name) const;

        // Бросает MissingChannelError.
        int channel_index(const std::string &name) const;

        double at(int row, int col) const;
        double at(int row, const std::string &channel) const;

        std::vector<double> column(int col) const;
        std::vector<double> column(const std::string &channel) const;

        const cv::Mat1d &values() const { return values_; }

    private:
        void build_index();

        std::vector<std::string> channels_; // - имена каналов в порядке столбцов.
        std::unordered_map<std::string, int> index_; // - имя канала -> номер столбца.
        cv::Mat1d values_; // - значения rows_ x channels_.size().
        int rows_ = 0; // - число строк (Mat без строк не хранит ширину надёжно).
    };

    // Сырые координаты, T строк.
    using TrajectoryTable = ChannelTable;
    // Дельты, T-1 строк; строка i = переход i -> i+1.
    using DeltaTable = ChannelTable;

} // namespace table
