/**
 * @file log_sink.hpp
 * @brief Severity levels and the sink interface used by Logger.
 */

#ifndef CBZSAN_LOG_SINK_HPP
#define CBZSAN_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages, ordered from least to most severe.
 *
 * Sinks compare levels with the usual relational operators to implement
 * thresholds, so the declaration order matters.
 */
enum class LogLevel {
    Debug,   ///< Per-entry and per-file tracing
    Info,    ///< Normal progress, skipped duplicates, scanner findings
    Warning, ///< Invalid inputs, undecodable images
    Error,   ///< Path traversal, backup collisions, corrupt archives
    None     ///< Threshold value only: a sink set to None prints nothing
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where messages go (console, file). The Logger
 * forwards every message to all registered sinks, filtering is the
 * sink's own business.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that emitted the message.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // CBZSAN_LOG_SINK_HPP
