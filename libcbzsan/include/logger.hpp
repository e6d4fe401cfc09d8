/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade shared by the library and the CLI.
 */

#ifndef CBZSAN_LOGGER_HPP
#define CBZSAN_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Static logging facade for cbzsan.
 *
 * Every component logs through Logger::log() with a tag naming itself.
 * The CLI decides at startup which sinks are installed; library code never
 * touches the sink list.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /// @brief Remove all configured sinks.
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "cbzsan").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "cbzsan");

    /**
     * @brief Converts a LogLevel to the fixed-width label used in log lines.
     */
    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARNING";
            case LogLevel::Error:   return "ERROR";
            case LogLevel::None:    return "NONE";
        }
        return "";
    }

    /**
     * @brief Parses a level name as accepted by --log-level.
     *
     * Case-insensitive; "WARN" is accepted as an alias of "WARNING".
     * Unknown names map to LogLevel::Info.
     */
    static LogLevel string_to_level(std::string level);

private:
    ///< List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to the sinks_ vector.
    static std::mutex mtx_;
};

#endif // CBZSAN_LOGGER_HPP
