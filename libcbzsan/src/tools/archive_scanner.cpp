#include "../../include/archive_scanner.hpp"
#include "../../include/archive_handles.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <functional>
#include <system_error>
#include <unordered_map>
#include <utility>

namespace cbzsan {

namespace fs = std::filesystem;

static const char* scanner_tag() {
    return "find";
}

ArchiveScanner::ArchiveScanner(const double threshold_mb) : threshold_mb_(threshold_mb) {}

std::optional<ScanReport> ArchiveScanner::scan(const fs::path& archive) const {
    std::error_code ec;
    if (!fs::is_regular_file(archive, ec)) {
        return std::nullopt;
    }

    ScanReport report;
    report.path = archive;

    const ZipReader reader;
    if (!reader.a || reader.open(archive) < ARCHIVE_WARN) {
        report.valid = false;
        return report;
    }

    const double threshold_bytes = threshold_mb_ * 1e6;
    std::vector<std::string> names;
    std::unordered_map<std::string, std::size_t> counts;

    archive_entry* entry = nullptr;
    int r;
    while ((r = archive_read_next_header(reader.a, &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        const char* raw = archive_entry_pathname_utf8(entry);
        if (!raw) raw = archive_entry_pathname(entry);
        const std::string name = raw ? raw : "";

        if (archive_entry_size_is_set(entry)) {
            const auto size = static_cast<double>(archive_entry_size(entry));
            if (size > threshold_bytes) {
                report.large_sizes_mb.push_back(std::round(size / 1e5) / 10.0);
            }
        }
        if (counts[name]++ == 0) {
            names.push_back(name);
        }
        if (archive_read_data_skip(reader.a) == ARCHIVE_FATAL) {
            r = ARCHIVE_FATAL;
            break;
        }
    }
    if (r != ARCHIVE_EOF) {
        Logger::log(LogLevel::Debug, "Iteration of " + archive.string() + " failed: " + reader.error(), scanner_tag());
        report.valid = false;
        return report;
    }

    std::sort(report.large_sizes_mb.begin(), report.large_sizes_mb.end(), std::greater<>());
    for (const auto& name : names) {
        if (counts[name] > 1) {
            report.duplicates.push_back(name);
        }
    }
    return report;
}

std::vector<ScanReport> ArchiveScanner::scan_all(const std::vector<fs::path>& archives) const {
    std::vector<ScanReport> reports;
    for (const auto& archive : archives) {
        auto report = scan(archive);
        if (!report) {
            Logger::log(LogLevel::Debug, "Not a regular file, skipping: " + archive.string(), scanner_tag());
            continue;
        }
        Logger::log(LogLevel::Debug, "Checking file: " + archive.string(), scanner_tag());
        if (!report->valid) {
            Logger::log(LogLevel::Warning, "Not a valid zip file: " + archive.string(), scanner_tag());
        } else {
            if (!report->large_sizes_mb.empty()) {
                Logger::log(LogLevel::Info,
                            "Large files in: " + archive.string() + " " + format_sizes(report->large_sizes_mb),
                            scanner_tag());
            }
            if (!report->duplicates.empty()) {
                Logger::log(LogLevel::Info,
                            "Duplicate files in: " + archive.string() + " " + format_names(report->duplicates),
                            scanner_tag());
            }
        }
        reports.push_back(std::move(*report));
    }
    return reports;
}

std::string ArchiveScanner::format_sizes(const std::vector<double>& sizes) {
    std::string out = "[";
    char buf[32];
    for (std::size_t i = 0; i < sizes.size(); ++i) {
        if (i) out += ", ";
        std::snprintf(buf, sizeof(buf), "%.1f", sizes[i]);
        out += buf;
    }
    return out + "]";
}

std::string ArchiveScanner::format_names(const std::vector<std::string>& names) {
    std::string out = "[";
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i) out += ", ";
        out += "'" + names[i] + "'";
    }
    return out + "]";
}

} // namespace cbzsan
