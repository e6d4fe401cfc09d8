/**
 * @file image.hpp
 * @brief In-memory raster shared by the codecs and the resizer.
 */

#ifndef CBZSAN_IMAGE_HPP
#define CBZSAN_IMAGE_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace cbzsan {

/**
 * @brief Raster formats that can be decoded and re-emitted.
 */
enum class ImageFormat {
    Jpeg,
    Png,
    Webp,
    Tiff,
    Bmp
};

constexpr std::string_view image_format_to_string(const ImageFormat fmt) noexcept {
    switch (fmt) {
        case ImageFormat::Jpeg: return "JPEG";
        case ImageFormat::Png:  return "PNG";
        case ImageFormat::Webp: return "WEBP";
        case ImageFormat::Tiff: return "TIFF";
        case ImageFormat::Bmp:  return "BMP";
    }
    return "UNKNOWN";
}

/**
 * @brief A raw APPn or COM marker saved from a JPEG stream.
 */
struct JpegMarker {
    int marker = 0;
    std::vector<std::uint8_t> data;
};

/**
 * @brief Metadata a codec can carry from decode to encode.
 *
 * Only filled in when metadata preservation is requested; empty otherwise.
 */
struct ImageMetadata {
    std::vector<std::uint8_t> icc_profile;
    std::vector<std::uint8_t> exif;
    std::vector<std::uint8_t> xmp;
    std::vector<JpegMarker> jpeg_markers; ///< APP0..APP15 and COM, JPEG only
};

/**
 * @brief Decoded 8-bit interleaved raster.
 *
 * channels is 1 (gray), 2 (gray+alpha), 3 (RGB) or 4 (RGBA). Rows are
 * tightly packed: pixels.size() == width * height * channels.
 */
struct Image {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    int channels = 0;
    std::vector<std::uint8_t> pixels;

    ImageFormat format = ImageFormat::Jpeg;
    bool progressive = false; ///< JPEG: source was progressive
    bool lossless = false;    ///< WebP: source used the lossless bitstream
    ImageMetadata metadata;

    [[nodiscard]] bool has_alpha() const noexcept { return channels == 2 || channels == 4; }

    [[nodiscard]] std::size_t row_bytes() const noexcept {
        return static_cast<std::size_t>(width) * static_cast<std::size_t>(channels);
    }
};

} // namespace cbzsan

#endif // CBZSAN_IMAGE_HPP
