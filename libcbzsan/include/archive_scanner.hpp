/**
 * @file archive_scanner.hpp
 * @brief Read-only report of oversized and duplicate zip entries.
 */

#ifndef CBZSAN_ARCHIVE_SCANNER_HPP
#define CBZSAN_ARCHIVE_SCANNER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cbzsan {

/**
 * @brief Findings for one archive.
 */
struct ScanReport {
    std::filesystem::path path;
    bool valid = true;                    ///< false if the zip could not be read
    std::vector<double> large_sizes_mb;   ///< Uncompressed sizes above the threshold, MB to 0.1, descending
    std::vector<std::string> duplicates;  ///< Names occurring more than once, in first-occurrence order
};

/**
 * @brief Lists the entries of zip archives that are larger than a threshold
 * or whose name occurs more than once. Never modifies anything.
 */
class ArchiveScanner {
public:
    /**
     * @param threshold_mb Entries strictly larger than this many megabytes
     *                     (10^6 bytes) are reported.
     */
    explicit ArchiveScanner(double threshold_mb = 1.5);

    /**
     * @brief Scans one archive.
     * @return nullopt if the path is not a regular file; otherwise the report,
     *         with valid == false if the zip cannot be opened or parsed.
     */
    [[nodiscard]] std::optional<ScanReport> scan(const std::filesystem::path& archive) const;

    /**
     * @brief Scans every path and logs the findings.
     *
     * Logs "Large files in: <path> [...]" and "Duplicate files in: <path> [...]"
     * at info level when there is something to report, and "Not a valid zip
     * file: <path>" at warning level for unreadable archives.
     */
    std::vector<ScanReport> scan_all(const std::vector<std::filesystem::path>& archives) const;

    /// @return "[12.3, 2.0]"
    static std::string format_sizes(const std::vector<double>& sizes);

    /// @return "['a.jpg', 'b.jpg']"
    static std::string format_names(const std::vector<std::string>& names);

private:
    double threshold_mb_;
};

} // namespace cbzsan

#endif // CBZSAN_ARCHIVE_SCANNER_HPP
