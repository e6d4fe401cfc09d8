#ifndef CBZSAN_ARCHIVE_HANDLES_HPP
#define CBZSAN_ARCHIVE_HANDLES_HPP

#include <archive.h>
#include <archive_entry.h>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <filesystem>
#include <string>

namespace cbzsan {

    /**
     * @brief RAII wrapper for a libarchive zip reader.
     * Ensures archive_read_free is called even if exceptions occur.
     */
    struct ZipReader {
        archive* a = nullptr;

        ZipReader() : a(archive_read_new()) {
            if (a) {
                archive_read_support_format_zip(a);
            }
        }
        ~ZipReader() { if (a) archive_read_free(a); }

        ZipReader(const ZipReader&) = delete;
        ZipReader& operator=(const ZipReader&) = delete;

        /// @return ARCHIVE_OK on success, another libarchive status otherwise.
        int open(const std::filesystem::path& path) const {
            if (!a) return ARCHIVE_FATAL;
            return archive_read_open_filename(a, path.string().c_str(), 10240);
        }

        [[nodiscard]] std::string error() const {
            const char* msg = a ? archive_error_string(a) : nullptr;
            return msg ? msg : "unknown libarchive error";
        }
    };

    /**
     * @brief RAII wrapper for a libarchive writer.
     *
     * Only an explicit close() writes the zip trailer. A writer destroyed
     * without it (an exception mid-write) is marked failed first, so the
     * partial output never gets a central directory and cannot pass for
     * a complete archive. The output descriptor is owned here, since
     * libarchive does not close it on the failure path.
     */
    struct ArchiveWriter {
        archive* a = nullptr;
        int fd = -1;
        bool closed = false;

        ArchiveWriter() : a(archive_write_new()) {}
        ~ArchiveWriter() {
            if (a) {
                if (!closed) archive_write_fail(a);
                archive_write_free(a);
            }
            if (fd >= 0) ::close(fd);
        }

        ArchiveWriter(const ArchiveWriter&) = delete;
        ArchiveWriter& operator=(const ArchiveWriter&) = delete;

        /// Creates (or truncates) the output file and starts writing to it.
        /// @return ARCHIVE_OK on success, another libarchive status otherwise.
        int open(const std::filesystem::path& path) {
            if (!a) return ARCHIVE_FATAL;
            fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
            if (fd < 0) {
                archive_set_error(a, errno, "Can't open %s", path.c_str());
                return ARCHIVE_FATAL;
            }
            return archive_write_open_fd(a, fd);
        }

        /// @return ARCHIVE_OK when the trailer was written and the file closed.
        int close() {
            closed = true;
            int r = a ? archive_write_close(a) : ARCHIVE_FATAL;
            if (fd >= 0) {
                if (::close(fd) != 0 && r == ARCHIVE_OK) {
                    archive_set_error(a, errno, "close failed");
                    r = ARCHIVE_FATAL;
                }
                fd = -1;
            }
            return r;
        }

        [[nodiscard]] std::string error() const {
            const char* msg = a ? archive_error_string(a) : nullptr;
            return msg ? msg : "unknown libarchive error";
        }
    };

    /**
     * @brief RAII wrapper for archive_entry objects.
     */
    struct EntryGuard {
        archive_entry* entry = archive_entry_new();
        ~EntryGuard() { if (entry) archive_entry_free(entry); }

        EntryGuard() = default;
        EntryGuard(const EntryGuard&) = delete;
        EntryGuard& operator=(const EntryGuard&) = delete;
    };

} // namespace cbzsan

#endif // CBZSAN_ARCHIVE_HANDLES_HPP
