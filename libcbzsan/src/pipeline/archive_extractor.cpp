#include "../../include/archive_extractor.hpp"
#include "../../include/archive_handles.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/sanitize_error.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace cbzsan {

namespace fs = std::filesystem;

static const char* extractor_tag() {
    return "ArchiveExtractor";
}

static void skip_entry_data(const ZipReader& reader, const std::string& name) {
    if (archive_read_data_skip(reader.a) == ARCHIVE_FATAL) {
        throw SanitizeError(ErrorKind::CorruptArchive,
                            "Cannot skip data of entry " + name + ": " + reader.error());
    }
}

static bool ensure_parent_dirs(const fs::path& p, std::error_code& ec) {
    const auto parent = p.parent_path();
    if (parent.empty()) return true;
    if (fs::is_directory(parent, ec)) return true;
    fs::create_directories(parent, ec);
    return !ec;
}

// streams the current entry's data to out_path, returns the byte count
static std::uint64_t write_entry_data(const ZipReader& reader,
                                      const fs::path& out_path,
                                      const std::string& name,
                                      std::vector<char>& buffer) {
    const unique_FILE out(open_file(out_path, "wb"));
    if (!out) {
        throw std::runtime_error("Can't open file in write mode: " + out_path.string());
    }

    std::uint64_t written = 0;
    la_ssize_t size_read = 0;
    while ((size_read = archive_read_data(reader.a, buffer.data(), buffer.size())) > 0) {
        const auto n = static_cast<std::size_t>(size_read);
        if (std::fwrite(buffer.data(), 1, n, out.get()) != n) {
            throw std::runtime_error("Short write while extracting: " + out_path.string());
        }
        written += n;
    }
    if (size_read < 0) {
        throw SanitizeError(ErrorKind::CorruptArchive,
                            "Error reading data of entry " + name + ": " + reader.error());
    }
    if (std::fflush(out.get()) != 0 || std::ferror(out.get())) {
        throw std::runtime_error("Write error while extracting: " + out_path.string());
    }
    return written;
}

std::optional<fs::path> ArchiveExtractor::resolve_entry_path(const std::string_view entry_name,
                                                             const fs::path& root) {
    if (entry_name.empty()) return std::nullopt;
    if (entry_name.find('\0') != std::string_view::npos) return std::nullopt;

    std::string s(entry_name);
    for (auto& c : s) { if (c == '\\') c = '/'; }

    if (s.front() == '/') return std::nullopt;
    if (s.size() >= 2 && std::isalpha(static_cast<unsigned char>(s[0])) && s[1] == ':') return std::nullopt;

    const fs::path rel = fs::path(s).lexically_normal();
    if (rel.empty() || rel == ".") return std::nullopt;
    if (rel.has_root_name() || rel.has_root_directory()) return std::nullopt;
    if (*rel.begin() == "..") return std::nullopt;

    return root / rel;
}

ExtractionReport ArchiveExtractor::extract(const fs::path& archive,
                                           const fs::path& destination_dir) const {
    Logger::log(LogLevel::Debug, "Extracting file: " + archive.string(), extractor_tag());

    const ZipReader reader;
    if (!reader.a) {
        throw SanitizeError(ErrorKind::CorruptArchive, "Cannot allocate archive reader");
    }

    int r = reader.open(archive);
    if (r == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + reader.error(), extractor_tag());
    } else if (r != ARCHIVE_OK) {
        Logger::log(LogLevel::Error, "Invalid CBZ zip file: " + archive.string() + " (" + reader.error() + ")", extractor_tag());
        throw SanitizeError(ErrorKind::CorruptArchive, "Cannot open zip " + archive.string() + ": " + reader.error());
    }

    std::error_code ec;
    fs::create_directories(destination_dir, ec);
    if (ec) {
        throw std::runtime_error("Can't create working directory " + destination_dir.string() + ": " + ec.message());
    }

    ExtractionReport report;
    std::vector<char> buffer(64 * 1024);
    archive_entry* entry = nullptr;

    while ((r = archive_read_next_header(reader.a, &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        if (r == ARCHIVE_WARN) {
            Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + reader.error(), extractor_tag());
        }

        const char* raw_name = archive_entry_pathname_utf8(entry);
        if (!raw_name) raw_name = archive_entry_pathname(entry);
        if (!raw_name) {
            skip_entry_data(reader, "<unnamed>");
            continue;
        }
        const std::string name(raw_name);

        const auto out_path = resolve_entry_path(name, destination_dir);
        if (!out_path) {
            Logger::log(LogLevel::Error, "Out of tmpdir write attempt, skipping entry: " + name, extractor_tag());
            report.rejected.push_back(name);
            skip_entry_data(reader, name);
            continue;
        }

        const auto type = archive_entry_filetype(entry);
        if (type == AE_IFDIR) {
            fs::create_directories(*out_path, ec);
            if (ec) {
                Logger::log(LogLevel::Warning, "Can't create folder " + name + ": " + ec.message(), extractor_tag());
            }
            skip_entry_data(reader, name);
            continue;
        }

        if (type == AE_IFLNK || archive_entry_hardlink(entry) != nullptr || (type != 0 && type != AE_IFREG)) {
            Logger::log(LogLevel::Warning, "Skipping link or special entry: " + name, extractor_tag());
            report.skipped.push_back(name);
            skip_entry_data(reader, name);
            continue;
        }

        if (fs::exists(fs::symlink_status(*out_path, ec))) {
            Logger::log(LogLevel::Info, "Skipping duplicate file: " + name, extractor_tag());
            report.duplicates.push_back(name);
            skip_entry_data(reader, name);
            continue;
        }

        if (!ensure_parent_dirs(*out_path, ec)) {
            Logger::log(LogLevel::Error, "Can't create folder for: " + name, extractor_tag());
            report.skipped.push_back(name);
            skip_entry_data(reader, name);
            continue;
        }

        Logger::log(LogLevel::Debug, "Extracting: " + out_path->string(), extractor_tag());
        report.extracted_bytes += write_entry_data(reader, *out_path, name, buffer);
        ++report.extracted;

        if (archive_entry_mtime_is_set(entry) &&
            !set_file_mtime(*out_path, static_cast<std::time_t>(archive_entry_mtime(entry)))) {
            Logger::log(LogLevel::Debug, "Can't restore modification time of " + name, extractor_tag());
        }
    }

    if (r != ARCHIVE_EOF) {
        Logger::log(LogLevel::Error, "Error during iteration of " + archive.string() + ": " + reader.error(), extractor_tag());
        throw SanitizeError(ErrorKind::CorruptArchive, "Error during iteration: " + reader.error());
    }

    Logger::log(LogLevel::Debug,
                "Extracted " + std::to_string(report.extracted) + " files, " +
                std::to_string(report.duplicates.size()) + " duplicates, " +
                std::to_string(report.rejected.size()) + " rejected",
                extractor_tag());
    return report;
}

} // namespace cbzsan
