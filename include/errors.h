#pragma once

#include <stdexcept>
#include <string>

// Входная таблица без строк.
class EmptyInputError : public std::runtime_error {
public:
    explicit EmptyInputError(const std::string &what)
            : std::runtime_error(what) {}
};

// Запрошенный канал отсутствует в таблице.
class MissingChannelError : public std::runtime_error {
public:
    explicit MissingChannelError(const std::string &channel)
            : std::runtime_error("missing channel '" + channel + "'"),
              channel_(channel) {}

    const std::string &channel() const { return channel_; }

private:
    std::string channel_; // - имя отсутствующего канала.
};

// Канал возобновился после нулей, но реальной детекции до этого не было
// (только при LeadingGapPolicy::Strict).
class NoPriorDetectionError : public std::runtime_error {
public:
    NoPriorDetectionError(const std::string &channel, int transition)
            : std::runtime_error("no prior detection in channel '" + channel +
                                 "' at transition " + std::to_string(transition)),
              channel_(channel),
              transition_(transition) {}

    const std::string &channel() const { return channel_; }
    int transition() const { return transition_; }

private:
    std::string channel_; // - канал.
    int transition_ = -1; // - индекс перехода i -> i+1.
};
