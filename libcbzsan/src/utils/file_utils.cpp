#include <filesystem>
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <stdexcept>
#include <system_error>
#include <sys/stat.h>
#ifndef _WIN32
#include <fcntl.h>
#else
#include <sys/utime.h>
#endif

namespace cbzsan {

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
        // _wfopen accepts UTF-16 paths, so non-ASCII archive names survive
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);
        return _wfopen(path.wstring().c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    std::filesystem::path add_filename_suffix(const std::filesystem::path& file,
                                              const std::string_view suffix) {
        std::string name = file.stem().string();
        name += '-';
        name += suffix;
        name += file.extension().string();
        return file.parent_path() / name;
    }

    std::filesystem::path make_temp_dir_in(const std::filesystem::path& base_dir, const std::string& prefix) {
        std::error_code ec;
        std::filesystem::create_directories(base_dir, ec);
        if (ec) {
            Logger::log(LogLevel::Error,
                "Failed to create temp root: " + base_dir.string() + " (" + ec.message() + ")",
                "file_utils");
            throw std::runtime_error("Cannot create temp root: " + base_dir.string());
        }

        // create_directory reports false when the name is taken, so retry a few times
        for (int attempt = 0; attempt < 8; ++attempt) {
            auto dir = base_dir / (prefix + "-" + RandomUtils::random_suffix());
            if (std::filesystem::create_directory(dir, ec) && !ec) {
                return dir;
            }
            if (ec) {
                Logger::log(LogLevel::Error,
                    "Failed to create temp dir: " + dir.string() + " (" + ec.message() + ")",
                    "file_utils");
                throw std::runtime_error("Cannot create temp dir under: " + base_dir.string());
            }
        }
        throw std::runtime_error("Cannot find a free temp dir name under: " + base_dir.string());
    }

    void cleanup_temp_dir(const std::filesystem::path& dir, const std::string_view tag) {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove temp dir: " + dir.string() + " (" + ec.message() + ")", tag);
        } else {
            Logger::log(LogLevel::Debug, "Removed temp dir: " + dir.string(), tag);
        }
    }

    std::optional<std::time_t> file_mtime(const std::filesystem::path& path) {
#ifndef _WIN32
        struct stat st{};
        if (::stat(path.c_str(), &st) != 0) {
            return std::nullopt;
        }
        return st.st_mtime;
#else
        struct _stat64 st{};
        if (_wstat64(path.wstring().c_str(), &st) != 0) {
            return std::nullopt;
        }
        return static_cast<std::time_t>(st.st_mtime);
#endif
    }

    bool set_file_mtime(const std::filesystem::path& path, const std::time_t mtime) {
#ifndef _WIN32
        timespec times[2]{};
        times[0].tv_sec = mtime;
        times[1].tv_sec = mtime;
        return ::utimensat(AT_FDCWD, path.c_str(), times, 0) == 0;
#else
        _utimbuf buf{mtime, mtime};
        return _wutime(path.wstring().c_str(), &buf) == 0;
#endif
    }

    ScopedTempDir::ScopedTempDir(const std::filesystem::path& base_dir, const std::string& prefix)
        : path_(make_temp_dir_in(base_dir, prefix)) {
        Logger::log(LogLevel::Debug, "Created working dir: " + path_.string(), "ScopedTempDir");
    }

    ScopedTempDir::~ScopedTempDir() {
        if (!path_.empty()) {
            cleanup_temp_dir(path_, "ScopedTempDir");
        }
    }

} // namespace cbzsan
