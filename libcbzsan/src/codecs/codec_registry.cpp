#include "../../include/codec_registry.hpp"
#include "../../include/jpeg_codec.hpp"
#include "../../include/png_codec.hpp"
#include "../../include/webp_codec.hpp"
#include "../../include/tiff_codec.hpp"
#include "../../include/bmp_codec.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include <exception>
#include <system_error>

namespace cbzsan {

CodecRegistry::CodecRegistry() {
    codecs_.push_back(std::make_unique<JpegCodec>());
    codecs_.push_back(std::make_unique<PngCodec>());
    codecs_.push_back(std::make_unique<WebpCodec>());
    codecs_.push_back(std::make_unique<TiffCodec>());
    codecs_.push_back(std::make_unique<BmpCodec>());
}

const IImageCodec* CodecRegistry::find_by_mime(const std::string& mime) const {
    for (const auto& codec : codecs_) {
        for (const auto supported : codec->get_supported_mime_types()) {
            if (supported == mime) {
                return codec.get();
            }
        }
    }
    return nullptr;
}

const IImageCodec* CodecRegistry::find_by_format(const ImageFormat format) const {
    for (const auto& codec : codecs_) {
        if (codec->get_format() == format) {
            return codec.get();
        }
    }
    return nullptr;
}

ProbeResult CodecRegistry::probe(const std::filesystem::path& path, const bool keep_metadata) const {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return NotAnImage{"", "unreadable: " + ec.message(), false};
    }
    if (size == 0) {
        return NotAnImage{"inode/x-empty", "empty file", false};
    }

    const std::string mime = MimeDetector::detect(path);
    if (mime.empty()) {
        return NotAnImage{"", "unreadable", false};
    }

    const IImageCodec* codec = find_by_mime(mime);
    if (!codec) {
        const bool looks_like_image = MimeDetector::is_image_mime(mime);
        return NotAnImage{mime,
                          looks_like_image ? "no codec can re-emit " + mime : "not an image (" + mime + ")",
                          looks_like_image};
    }

    try {
        return DecodedImage{codec->decode(path, keep_metadata), codec};
    } catch (const std::exception& e) {
        return NotAnImage{mime, std::string(codec->get_name()) + " decode failed: " + e.what(), true};
    }
}

} // namespace cbzsan
