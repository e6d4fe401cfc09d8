#ifndef CBZSAN_EVENTS_HPP
#define CBZSAN_EVENTS_HPP

#include "archive_extractor.hpp"
#include "image_normalizer.hpp"
#include "sanitize_error.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace cbzsan {

/**
 * @brief Events published by the PipelineOrchestrator, one archive at a time.
 *
 * Plain data carriers for EventBus subscribers (console output, report).
 * Every archive produces exactly one start event and exactly one of the
 * complete, skipped or error events, except that a skipped archive has no
 * start event.
 */

/**
 * @brief Emitted when an archive passed the input check and extraction begins.
 */
struct ArchiveStartEvent {
    std::filesystem::path path;     ///< Archive being sanitized
    std::uintmax_t original_size = 0;
};

/**
 * @brief Emitted when an archive was repackaged successfully.
 */
struct ArchiveCompleteEvent {
    std::filesystem::path path;         ///< Path of the new archive
    std::filesystem::path backup_path;  ///< Where the original now lives
    std::uintmax_t original_size = 0;   ///< Size of the input archive in bytes
    std::uintmax_t new_size = 0;        ///< Size of the sanitized archive in bytes
    std::size_t entries_written = 0;
    ExtractionReport extraction;        ///< Duplicates and rejected names
    NormalizeStats normalize;           ///< Image counters
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted when an input is not an accessible regular file.
 */
struct ArchiveSkippedEvent {
    std::filesystem::path path;
    std::string reason;
};

/**
 * @brief Emitted when processing of an archive failed.
 */
struct ArchiveErrorEvent {
    std::filesystem::path path;
    ErrorKind kind = ErrorKind::CorruptArchive; ///< Classification of the failure
    bool classified = false;                    ///< false if an unexpected exception escaped a stage
    std::string error_message;
    std::uintmax_t original_size = 0;
};

} // namespace cbzsan

#endif // CBZSAN_EVENTS_HPP
