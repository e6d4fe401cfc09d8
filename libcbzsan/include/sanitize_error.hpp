/**
 * @file sanitize_error.hpp
 * @brief Error taxonomy of the sanitize pipeline.
 */

#ifndef CBZSAN_SANITIZE_ERROR_HPP
#define CBZSAN_SANITIZE_ERROR_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace cbzsan {

/**
 * @brief Classifies every failure the pipeline can contain.
 *
 * All of them are contained per archive or per entry; none aborts a batch.
 */
enum class ErrorKind {
    CorruptArchive,             ///< Zip cannot be opened or parsed; archive skipped
    PathTraversal,              ///< Entry name escapes the working tree; entry skipped
    UnreadableInput,            ///< Missing file or not a regular file; archive skipped
    UndecodableImage,           ///< Not an image or no codec able to re-emit it; file kept
    DestinationBackupCollision, ///< "-orig" backup already exists; original untouched
    ArchiveWriteFailed          ///< Backup rename or zip writing failed; backup kept
};

/// @return Stable name of an ErrorKind, used in logs and reports.
constexpr std::string_view error_kind_to_string(const ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::CorruptArchive:             return "CorruptArchive";
        case ErrorKind::PathTraversal:              return "PathTraversal";
        case ErrorKind::UnreadableInput:            return "UnreadableInput";
        case ErrorKind::UndecodableImage:           return "UndecodableImage";
        case ErrorKind::DestinationBackupCollision: return "DestinationBackupCollision";
        case ErrorKind::ArchiveWriteFailed:         return "ArchiveWriteFailed";
    }
    return "Unknown";
}

/**
 * @brief Exception carrying an ErrorKind.
 */
class SanitizeError : public std::runtime_error {
public:
    SanitizeError(const ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace cbzsan

#endif // CBZSAN_SANITIZE_ERROR_HPP
