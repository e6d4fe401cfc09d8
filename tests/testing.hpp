#pragma once

#include "image.hpp"
#include "jpeg_codec.hpp"
#include "logger.hpp"
#include "png_codec.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/cbzsan_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::filesystem::path& Path() const { return path_; }

  private:
    std::filesystem::path path_;
};

// records every log line while alive; the Logger is global, so one at a time
class LogCapture {
  public:
    struct Line {
        LogLevel level;
        std::string message;
    };

    LogCapture() : lines_(std::make_shared<Buffer>()) {
        Logger::clear_sinks();
        Logger::add_sink(std::make_unique<Sink>(lines_));
    }

    ~LogCapture() { Logger::clear_sinks(); }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::vector<Line> Messages() const {
        std::lock_guard lock(lines_->mtx);
        return lines_->lines;
    }

    bool Contains(const LogLevel level, const std::string& message) const {
        for (const auto& line : Messages()) {
            if (line.level == level && line.message == message) return true;
        }
        return false;
    }

  private:
    struct Buffer {
        std::mutex mtx;
        std::vector<Line> lines;
    };

    struct Sink final : ILogSink {
        explicit Sink(std::shared_ptr<Buffer> out) : out_(std::move(out)) {}
        void log(const LogLevel level, const std::string_view message, std::string_view) override {
            std::lock_guard lock(out_->mtx);
            out_->lines.push_back({level, std::string(message)});
        }
        std::shared_ptr<Buffer> out_;
    };

    std::shared_ptr<Buffer> lines_;
};

struct ZipEntry {
    std::string name;
    std::string contents;
    bool directory = false;
};

// writes entries verbatim: duplicate and hostile names are kept as given
inline void WriteZip(const std::filesystem::path& path, const std::vector<ZipEntry>& entries) {
    archive* a = archive_write_new();
    if (!a)
        throw std::runtime_error("archive_write_new failed");
    if (archive_write_set_format_zip(a) != ARCHIVE_OK ||
        archive_write_open_filename(a, path.string().c_str()) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("cannot open zip for writing");
    }

    for (const auto& entry : entries) {
        archive_entry* hdr = archive_entry_new();
        archive_entry_set_pathname(hdr, entry.name.c_str());
        archive_entry_set_filetype(hdr, entry.directory ? AE_IFDIR : AE_IFREG);
        archive_entry_set_perm(hdr, entry.directory ? 0755 : 0644);
        archive_entry_set_size(hdr, entry.directory ? 0 : static_cast<la_int64_t>(entry.contents.size()));
        archive_entry_set_mtime(hdr, 1600000000, 0);
        if (archive_write_header(a, hdr) != ARCHIVE_OK) {
            archive_entry_free(hdr);
            (void)archive_write_free(a);
            throw std::runtime_error("archive_write_header failed for " + entry.name);
        }
        if (!entry.directory && !entry.contents.empty() &&
            archive_write_data(a, entry.contents.data(), entry.contents.size()) < 0) {
            archive_entry_free(hdr);
            (void)archive_write_free(a);
            throw std::runtime_error("archive_write_data failed for " + entry.name);
        }
        archive_entry_free(hdr);
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_close failed");
    }
    (void)archive_write_free(a);
}

// entries in archive order, with their contents
inline std::vector<std::pair<std::string, std::string>> ReadZip(const std::filesystem::path& path) {
    archive* a = archive_read_new();
    archive_read_support_format_zip(a);
    if (archive_read_open_filename(a, path.string().c_str(), 10240) != ARCHIVE_OK) {
        (void)archive_read_free(a);
        throw std::runtime_error("cannot open zip for reading: " + path.string());
    }

    std::vector<std::pair<std::string, std::string>> out;
    archive_entry* entry = nullptr;
    while (archive_read_next_header(a, &entry) == ARCHIVE_OK) {
        std::string data;
        char buf[8192];
        la_ssize_t n = 0;
        while ((n = archive_read_data(a, buf, sizeof(buf))) > 0) {
            data.append(buf, static_cast<size_t>(n));
        }
        out.emplace_back(archive_entry_pathname(entry), std::move(data));
    }
    (void)archive_read_free(a);
    return out;
}

inline std::vector<std::string> ReadZipNames(const std::filesystem::path& path) {
    std::vector<std::string> names;
    for (auto& [name, data] : ReadZip(path)) {
        names.push_back(name);
    }
    return names;
}

inline std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

inline void WriteFile(const std::filesystem::path& path, const std::string& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << data;
}

// smooth gradient, compresses well and survives resampling predictably
inline cbzsan::Image MakeGradient(std::uint32_t width, std::uint32_t height, int channels,
                                  cbzsan::ImageFormat format = cbzsan::ImageFormat::Jpeg) {
    cbzsan::Image img;
    img.width = width;
    img.height = height;
    img.channels = channels;
    img.format = format;
    img.pixels.resize(img.row_bytes() * height);
    for (std::uint32_t y = 0; y < height; ++y) {
        for (std::uint32_t x = 0; x < width; ++x) {
            std::uint8_t* p = img.pixels.data() + (static_cast<size_t>(y) * width + x) * channels;
            const auto r = static_cast<std::uint8_t>((x * 255) / (width > 1 ? width - 1 : 1));
            const auto g = static_cast<std::uint8_t>((y * 255) / (height > 1 ? height - 1 : 1));
            switch (channels) {
                case 1: p[0] = r; break;
                case 2: p[0] = r; p[1] = 255; break;
                case 3: p[0] = r; p[1] = g; p[2] = 128; break;
                default: p[0] = r; p[1] = g; p[2] = 128; p[3] = 255; break;
            }
        }
    }
    return img;
}

inline cbzsan::Image MakeSolid(std::uint32_t width, std::uint32_t height, int channels,
                               std::uint8_t value,
                               cbzsan::ImageFormat format = cbzsan::ImageFormat::Png) {
    cbzsan::Image img;
    img.width = width;
    img.height = height;
    img.channels = channels;
    img.format = format;
    img.pixels.assign(img.row_bytes() * height, value);
    return img;
}

inline std::string MakeJpegBytes(std::uint32_t width, std::uint32_t height, int quality,
                                 const std::filesystem::path& scratch) {
    cbzsan::EncodeOptions options;
    options.quality = quality;
    cbzsan::JpegCodec().encode(MakeGradient(width, height, 3), scratch, options);
    std::string bytes = ReadFile(scratch);
    std::error_code ec;
    std::filesystem::remove(scratch, ec);
    return bytes;
}

inline std::string MakePngBytes(const cbzsan::Image& image, const std::filesystem::path& scratch) {
    cbzsan::PngCodec().encode(image, scratch, cbzsan::EncodeOptions{});
    std::string bytes = ReadFile(scratch);
    std::error_code ec;
    std::filesystem::remove(scratch, ec);
    return bytes;
}

} // namespace testutil
