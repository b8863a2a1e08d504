#include "table/channel_table.h"
#include "errors.h"

#include <stdexcept>
#include <utility>

namespace table {

    ChannelTable::ChannelTable(std::vector<std::string> channels, int rows)
            : channels_(std::move(channels)) {
        if (rows < 0) {
            throw std::invalid_argument("ChannelTable: negative row count");
        }
        build_index();
        rows_ = rows;
        values_ = cv::Mat1d(rows_, cols(), 0.0);
    }

    ChannelTable::ChannelTable(std::vector<std::string> channels, cv::Mat1d values)
            : channels_(std::move(channels)) {
        build_index();
        if (values.rows == 0) {
            rows_ = 0;
            values_ = cv::Mat1d(0, cols());
            return;
        }
        if (values.cols != cols()) {
            throw std::invalid_argument("ChannelTable: " + std::to_string(values.cols) +
                                        " value columns for " + std::to_string(cols()) + " channels");
        }
        rows_ = values.rows;
        // Таблица - значение: не делим буфер с вызывающим кодом.
        values_ = values.clone();
    }

    ChannelTable ChannelTable::from_rows(std::vector<std::string> channels,
                                         const std::vector<std::vector<double>> &rows) {
        const int width = static_cast<int>(channels.size());
        cv::Mat1d values(static_cast<int>(rows.size()), width, 0.0);
        for (size_t r = 0; r < rows.size(); ++r) {
            if (static_cast<int>(rows[r].size()) != width) {
                throw std::invalid_argument("ChannelTable: row " + std::to_string(r) + " has " +
                                            std::to_string(rows[r].size()) + " values, expected " +
                                            std::to_string(width));
            }
            for (int c = 0; c < width; ++c) {
                values(static_cast<int>(r), c) = rows[r][static_cast<size_t>(c)];
            }
        }
        ChannelTable t(std::move(channels), 0);
        t.rows_ = values.rows;
        t.values_ = values;
        return t;
    }

    ChannelTable ChannelTable::from_columns(std::vector<std::string> channels,
                                            const std::vector<std::vector<double>> &columns) {
        if (columns.size() != channels.size()) {
            throw std::invalid_argument("ChannelTable: " + std::to_string(columns.size()) +
                                        " columns for " + std::to_string(channels.size()) + " channels");
        }
        const int height = columns.empty() ? 0 : static_cast<int>(columns.front().size());
        cv::Mat1d values(height, static_cast<int>(columns.size()), 0.0);
        for (size_t c = 0; c < columns.size(); ++c) {
            if (static_cast<int>(columns[c].size()) != height) {
                throw std::invalid_argument("ChannelTable: column '" + channels[c] + "' has " +
                                            std::to_string(columns[c].size()) + " values, expected " +
                                            std::to_string(height));
            }
            for (int r = 0; r < height; ++r) {
                values(r, static_cast<int>(c)) = columns[c][static_cast<size_t>(r)];
            }
        }
        ChannelTable t(std::move(channels), 0);
        t.rows_ = height;
        t.values_ = values;
        return t;
    }

    void ChannelTable::build_index() {
        index_.clear();
        index_.reserve(channels_.size());
        for (size_t c = 0; c < channels_.size(); ++c) {
            if (channels_[c].empty()) {
                throw std::invalid_argument("ChannelTable: empty channel name at column " + std::to_string(c));
            }
            if (!index_.emplace(channels_[c], static_cast<int>(c)).second) {
                throw std::invalid_argument("ChannelTable: duplicate channel '" + channels_[c] + "'");
            }
        }
    }

    bool ChannelTable::has_channel(const std::string &name) const {
        return index_.find(name) != index_.end();
    }

    int ChannelTable::channel_index(const std::string &name) const {
        const auto it = index_.find(name);
        if (it == index_.end()) {
            throw MissingChannelError(name);
        }
        return it->second;
    }

    double ChannelTable::at(int row, int col) const {
        if (row < 0 || row >= rows_ || col < 0 || col >= cols()) {
            throw std::out_of_range("ChannelTable: cell (" + std::to_string(row) + ", " +
                                    std::to_string(col) + ") out of range");
        }
        return values_(row, col);
    }

    double ChannelTable::at(int row, const std::string &channel) const {
        return at(row, channel_index(channel));
    }

    std::vector<double> ChannelTable::column(int col) const {
        if (col < 0 || col >= cols()) {
            throw std::out_of_range("ChannelTable: column " + std::to_string(col) + " out of range");
        }
        std::vector<double> out;
        out.reserve(static_cast<size_t>(rows_));
        for (int r = 0; r < rows_; ++r) {
            out.push_back(values_(r, col));
        }
        return out;
    }

    std::vector<double> ChannelTable::column(const std::string &channel) const {
        return column(channel_index(channel));
    }

} // namespace table
