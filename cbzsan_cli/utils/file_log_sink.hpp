#ifndef CBZSAN_FILE_LOG_SINK_HPP
#define CBZSAN_FILE_LOG_SINK_HPP

#include "../../libcbzsan/include/log_sink.hpp"
#include "log_format.hpp"
#include <filesystem>
#include <fstream>
#include <mutex>

/**
 * @brief Appends every message at or above log_level to a file.
 */
class FileLogSink final : public ILogSink {
public:
    explicit FileLogSink(const std::filesystem::path& filename,
                         const LogLevel level = LogLevel::Debug,
                         const bool append = true)
        : log_level(level), out_(filename, append ? std::ios::app : std::ios::trunc) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level == LogLevel::None || level < log_level) return;

        std::lock_guard lock(mtx_);
        if (!out_.is_open()) return;
        out_ << format_log_line(level, message, tag) << "\n";
        out_.flush();
    }

    LogLevel log_level;

private:
    std::ofstream out_;
    std::mutex mtx_;
};

#endif // CBZSAN_FILE_LOG_SINK_HPP
