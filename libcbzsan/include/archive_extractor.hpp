/**
 * @file archive_extractor.hpp
 * @brief Secure zip extraction into a working directory.
 */

#ifndef CBZSAN_ARCHIVE_EXTRACTOR_HPP
#define CBZSAN_ARCHIVE_EXTRACTOR_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cbzsan {

/**
 * @brief What happened to the entries of one archive during extraction.
 */
struct ExtractionReport {
    std::size_t extracted = 0;            ///< Regular files written to disk
    std::uint64_t extracted_bytes = 0;    ///< Uncompressed bytes written
    std::vector<std::string> duplicates;  ///< Names dropped because an earlier entry already claimed them
    std::vector<std::string> rejected;    ///< Names escaping the working directory (PathTraversal)
    std::vector<std::string> skipped;     ///< Links and entries that could not be written
};

/**
 * @brief Extracts zip archives with path containment and first-writer-wins dedup.
 *
 * Entries are enumerated in archive order. A name that is absolute or
 * escapes the destination after normalization is rejected and recorded,
 * and extraction continues with the next entry. A name resolving to a path
 * that already exists is a duplicate: only the first occurrence is written.
 * Symbolic and hard links are never materialized.
 */
class ArchiveExtractor {
public:
    /**
     * @brief Extracts every acceptable entry of a zip into destination_dir.
     *
     * @param archive Path of the zip to read. It is never modified.
     * @param destination_dir Working directory; created if missing.
     * @return Counts and names of extracted, duplicate and rejected entries.
     * @throws SanitizeError with ErrorKind::CorruptArchive if the zip cannot
     *         be opened or parsed, or entry data cannot be read.
     * @throws std::runtime_error if an extracted file cannot be written in full.
     */
    ExtractionReport extract(const std::filesystem::path& archive,
                             const std::filesystem::path& destination_dir) const;

    /**
     * @brief Resolves an entry name below root, or rejects it.
     *
     * Backslashes count as separators. Rejects empty names, names with an
     * embedded NUL, absolute names (leading slash or drive letter), and
     * names whose normalized form starts with "..".
     *
     * @return The lexically normalized destination path, or nullopt.
     */
    static std::optional<std::filesystem::path> resolve_entry_path(std::string_view entry_name,
                                                                   const std::filesystem::path& root);
};

} // namespace cbzsan

#endif // CBZSAN_ARCHIVE_EXTRACTOR_HPP
