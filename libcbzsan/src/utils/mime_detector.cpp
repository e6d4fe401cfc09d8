#ifndef _WIN32
#include <magic.h>
#endif
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include <array>
#include <cstring>
#include <fstream>
#include <memory>
#include <type_traits>

namespace {

struct Signature {
    std::size_t offset;
    std::string_view bytes;
    std::string_view mime;
};

// leading bytes of the formats the sanitizer cares about
constexpr std::array<Signature, 9> kSignatures = {{
    {0, std::string_view("\xFF\xD8\xFF", 3), "image/jpeg"},
    {0, std::string_view("\x89PNG\r\n\x1A\n", 8), "image/png"},
    {8, std::string_view("WEBP", 4), "image/webp"},
    {0, std::string_view("GIF87a", 6), "image/gif"},
    {0, std::string_view("GIF89a", 6), "image/gif"},
    {0, std::string_view("BM", 2), "image/bmp"},
    {0, std::string_view("II*\0", 4), "image/tiff"},
    {0, std::string_view("MM\0*", 4), "image/tiff"},
    {0, std::string_view("PK\x03\x04", 4), "application/zip"},
}};

#ifndef _WIN32
struct MagicCloser {
    void operator()(const magic_t m) const { if (m) magic_close(m); }
};
using unique_magic = std::unique_ptr<std::remove_pointer_t<magic_t>, MagicCloser>;
#endif

} // namespace

std::string cbzsan::MimeDetector::detect(const std::filesystem::path& path)
{
#ifndef _WIN32
    const unique_magic magic(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR));
    if (magic && magic_load(magic.get(), nullptr) == 0)
    {
        const char* mime = magic_file(magic.get(), path.string().c_str());
        if (mime) {
            return mime;
        }
        // unreadable file: magic_file reports an error instead of a type
        return {};
    }
    Logger::log(LogLevel::Debug, "libmagic unavailable, using signature table", "mime_detector");
#endif
    return detect_by_signature(path);
}

std::string cbzsan::MimeDetector::detect_by_signature(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return {};
    }
    std::array<char, 16> head{};
    in.read(head.data(), static_cast<std::streamsize>(head.size()));
    const auto got = static_cast<std::size_t>(in.gcount());
    if (got == 0) {
        return "inode/x-empty";
    }

    for (const auto& sig : kSignatures) {
        if (got >= sig.offset + sig.bytes.size() &&
            std::memcmp(head.data() + sig.offset, sig.bytes.data(), sig.bytes.size()) == 0) {
            // "WEBP" at offset 8 only counts inside a RIFF container
            if (sig.mime == "image/webp" && std::memcmp(head.data(), "RIFF", 4) != 0) {
                continue;
            }
            return std::string(sig.mime);
        }
    }
    return "application/octet-stream";
}
