#include "../../include/archive_repackager.hpp"
#include "../../include/archive_handles.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/sanitize_error.hpp"
#include <algorithm>
#include <cstdio>
#include <string>
#include <system_error>
#include <vector>

namespace cbzsan {

namespace fs = std::filesystem;

static const char* repackager_tag() {
    return "ArchiveRepackager";
}

namespace {

struct PackedFile {
    fs::path path;
    std::string name; ///< '/'-separated, relative to the tree root
};

// files of a directory in name order, then each subdirectory in name order
void collect_files(const fs::path& root, const fs::path& dir, std::vector<PackedFile>& out) {
    std::vector<fs::path> files;
    std::vector<fs::path> subdirs;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code sec;
        if (it->is_symlink(sec)) continue;
        if (it->is_directory(sec)) {
            subdirs.push_back(it->path());
        } else if (it->is_regular_file(sec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        throw SanitizeError(ErrorKind::ArchiveWriteFailed, "Can't list directory " + dir.string() + ": " + ec.message());
    }

    const auto by_name = [](const fs::path& a, const fs::path& b) { return a.filename() < b.filename(); };
    std::sort(files.begin(), files.end(), by_name);
    std::sort(subdirs.begin(), subdirs.end(), by_name);

    for (const auto& f : files) {
        out.push_back({f, f.lexically_relative(root).generic_string()});
    }
    for (const auto& d : subdirs) {
        collect_files(root, d, out);
    }
}

[[noreturn]] void write_failed(const ArchiveWriter& writer, const std::string& what) {
    const std::string msg = what + ": " + writer.error();
    Logger::log(LogLevel::Error, msg, repackager_tag());
    throw SanitizeError(ErrorKind::ArchiveWriteFailed, msg);
}

void write_entry(ArchiveWriter& writer, const PackedFile& file, std::vector<char>& buffer) {
    std::error_code ec;
    const auto size = fs::file_size(file.path, ec);
    if (ec) {
        throw SanitizeError(ErrorKind::ArchiveWriteFailed, "Can't stat " + file.path.string() + ": " + ec.message());
    }
    const unique_FILE in(open_file(file.path, "rb"));
    if (!in) {
        throw SanitizeError(ErrorKind::ArchiveWriteFailed, "Can't open file for reading: " + file.path.string());
    }

    const EntryGuard guard;
    archive_entry* entry = guard.entry;
    archive_entry_set_pathname(entry, file.name.c_str());
    archive_entry_set_filetype(entry, AE_IFREG);
    archive_entry_set_perm(entry, 0644);
    archive_entry_set_size(entry, static_cast<la_int64_t>(size));
    if (const auto mtime = file_mtime(file.path)) {
        archive_entry_set_mtime(entry, *mtime, 0);
    }

    const int r = archive_write_header(writer.a, entry);
    if (r == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + writer.error(), repackager_tag());
    } else if (r != ARCHIVE_OK) {
        write_failed(writer, "archive_write_header for " + file.name);
    }

    std::size_t got = 0;
    while ((got = std::fread(buffer.data(), 1, buffer.size(), in.get())) > 0) {
        if (archive_write_data(writer.a, buffer.data(), got) < 0) {
            write_failed(writer, "archive_write_data for " + file.name);
        }
    }
    if (std::ferror(in.get())) {
        throw SanitizeError(ErrorKind::ArchiveWriteFailed, "Read error on " + file.path.string());
    }
}

} // namespace

fs::path ArchiveRepackager::backup_path_for(const fs::path& archive) {
    return add_filename_suffix(archive, "orig");
}

RepackReport ArchiveRepackager::repack(const fs::path& working_tree, const fs::path& output_archive) const {
    RepackReport report;
    report.backup_path = backup_path_for(output_archive);

    std::error_code ec;
    if (fs::exists(fs::symlink_status(report.backup_path, ec))) {
        const std::string msg = "Backup already exists, leaving " + output_archive.string() +
                                " untouched: " + report.backup_path.string();
        Logger::log(LogLevel::Error, msg, repackager_tag());
        throw SanitizeError(ErrorKind::DestinationBackupCollision, msg);
    }

    std::vector<PackedFile> files;
    collect_files(working_tree, working_tree, files);

    fs::rename(output_archive, report.backup_path, ec);
    if (ec) {
        const std::string msg = "Can't rename " + output_archive.string() + " to " +
                                report.backup_path.string() + ": " + ec.message();
        Logger::log(LogLevel::Error, msg, repackager_tag());
        throw SanitizeError(ErrorKind::ArchiveWriteFailed, msg);
    }
    Logger::log(LogLevel::Debug, "Compressing to file: " + output_archive.string(), repackager_tag());

    ArchiveWriter writer;
    if (!writer.a) {
        throw SanitizeError(ErrorKind::ArchiveWriteFailed, "Cannot allocate archive writer");
    }
    if (archive_write_set_format_zip(writer.a) != ARCHIVE_OK) {
        write_failed(writer, "Setting zip format failed");
    }
    if (archive_write_set_format_option(writer.a, "zip", "compression", "deflate") != ARCHIVE_OK) {
        write_failed(writer, "Setting deflate compression failed");
    }
    if (archive_write_set_format_option(writer.a, "zip", "compression-level", "9") != ARCHIVE_OK) {
        Logger::log(LogLevel::Debug, "compression-level not supported, using the default", repackager_tag());
    }

    const int r = writer.open(output_archive);
    if (r == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + writer.error(), repackager_tag());
    } else if (r != ARCHIVE_OK) {
        write_failed(writer, "Can't open output " + output_archive.string());
    }

    std::vector<char> buffer(64 * 1024);
    for (const auto& file : files) {
        Logger::log(LogLevel::Debug, "Compressing: " + file.name, repackager_tag());
        write_entry(writer, file, buffer);
        ++report.entries_written;
    }

    if (writer.close() != ARCHIVE_OK) {
        write_failed(writer, "archive_write_close " + output_archive.string());
    }

    report.archive_size = fs::file_size(output_archive, ec);
    if (ec) {
        throw SanitizeError(ErrorKind::ArchiveWriteFailed, "Can't stat new archive " + output_archive.string() + ": " + ec.message());
    }
    return report;
}

} // namespace cbzsan
