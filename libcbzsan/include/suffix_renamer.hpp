/**
 * @file suffix_renamer.hpp
 * @brief Strips numeric download suffixes from archive file names.
 */

#ifndef CBZSAN_SUFFIX_RENAMER_HPP
#define CBZSAN_SUFFIX_RENAMER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace cbzsan {

enum class RenameOutcome {
    Renamed,
    DryRun,            ///< Would have been renamed
    WrongExtension,
    NotMatching,       ///< No "_<digits>" before the extension
    DestinationExists,
    Failed             ///< The rename itself failed
};

struct RenameResult {
    std::filesystem::path source;
    std::filesystem::path destination; ///< Empty unless a new name was derived
    RenameOutcome outcome = RenameOutcome::NotMatching;
};

/**
 * @brief Renames "<base>_<digits>.<ext>" to "<base>.<ext>" in the same directory.
 *
 * Only the file name is examined and rewritten; the directory part is kept
 * as given. An existing destination is never overwritten.
 */
class SuffixRenamer {
public:
    /**
     * @param extension Extension without the dot, matched case-sensitively.
     * @param dry_run Log the planned renames without performing them.
     */
    explicit SuffixRenamer(std::string extension = "cbz", bool dry_run = false);

    /**
     * @brief Handles one file and logs the outcome.
     */
    RenameResult rename(const std::filesystem::path& file) const;

    /**
     * @brief Derives the new name without touching the filesystem.
     * @return The destination path, or nullopt if the name does not match.
     */
    [[nodiscard]] std::optional<std::filesystem::path> stripped_name(const std::filesystem::path& file) const;

private:
    std::string extension_;
    bool dry_run_;
};

} // namespace cbzsan

#endif // CBZSAN_SUFFIX_RENAMER_HPP
