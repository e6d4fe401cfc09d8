#ifndef CBZSAN_CONSOLE_LOG_SINK_HPP
#define CBZSAN_CONSOLE_LOG_SINK_HPP

#include "../../libcbzsan/include/log_sink.hpp"
#include "log_format.hpp"
#include <iostream>
#include <mutex>

/**
 * @brief Writes messages at or above log_level to the terminal.
 * Warnings and errors go to stderr, the rest to stdout.
 */
class ConsoleLogSink final : public ILogSink {
public:
    LogLevel log_level = LogLevel::Info;

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level == LogLevel::None || level < log_level) return;

        const std::string line = format_log_line(level, message, tag);
        std::lock_guard lock(mtx_);
        if (level >= LogLevel::Warning) {
            std::cerr << line << std::endl;
        } else {
            std::cout << line << std::endl;
        }
    }

private:
    std::mutex mtx_;
};

#endif // CBZSAN_CONSOLE_LOG_SINK_HPP
