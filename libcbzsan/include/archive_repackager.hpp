/**
 * @file archive_repackager.hpp
 * @brief Backs up the original archive and writes the sanitized zip.
 */

#ifndef CBZSAN_ARCHIVE_REPACKAGER_HPP
#define CBZSAN_ARCHIVE_REPACKAGER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace cbzsan {

/**
 * @brief Result of a successful repackaging.
 */
struct RepackReport {
    std::filesystem::path backup_path;  ///< Where the original archive now lives
    std::size_t entries_written = 0;
    std::uintmax_t archive_size = 0;    ///< Size in bytes of the new archive
};

/**
 * @brief Writes a working tree back into a zip at the original archive's path.
 *
 * The original is first renamed to its "-orig" backup, which must not
 * exist yet. Entries are written depth-first with regular files before
 * subdirectories, each group in name order, so the same tree always yields
 * the same entry sequence.
 */
class ArchiveRepackager {
public:
    /**
     * @brief "<stem>-orig<ext>" in the directory of archive.
     */
    static std::filesystem::path backup_path_for(const std::filesystem::path& archive);

    /**
     * @brief Backs up output_archive and writes the tree as a new zip in its place.
     *
     * @param working_tree Root of the tree to pack; entry names are relative to it.
     * @param output_archive Path of the original archive, and of the new one.
     * @throws SanitizeError with ErrorKind::DestinationBackupCollision if the
     *         backup path is taken (nothing is changed).
     * @throws SanitizeError with ErrorKind::ArchiveWriteFailed if the rename
     *         or the zip writing fails. A partial output is left in place.
     */
    RepackReport repack(const std::filesystem::path& working_tree,
                        const std::filesystem::path& output_archive) const;
};

} // namespace cbzsan

#endif // CBZSAN_ARCHIVE_REPACKAGER_HPP
