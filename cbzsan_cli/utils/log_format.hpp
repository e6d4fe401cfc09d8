#ifndef CBZSAN_LOG_FORMAT_HPP
#define CBZSAN_LOG_FORMAT_HPP

#include "../../libcbzsan/include/logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

/**
 * @brief Formats one log line as "<timestamp>, <LEVEL>: [tag] message".
 *
 * The timestamp is local time with milliseconds ("2025-10-20 14:03:07,512")
 * and the level is right-aligned to eight columns.
 */
inline std::string format_log_line(const LogLevel level,
                                   const std::string_view message,
                                   const std::string_view tag) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &t);
#else
    localtime_r(&t, &local);
#endif

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << ','
        << std::setw(3) << std::setfill('0') << ms << std::setfill(' ')
        << ", " << std::setw(8) << Logger::level_to_string(level) << ": ";
    if (!tag.empty()) oss << "[" << tag << "] ";
    oss << message;
    return oss.str();
}

#endif // CBZSAN_LOG_FORMAT_HPP
