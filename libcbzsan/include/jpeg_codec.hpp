/**
 * @file jpeg_codec.hpp
 * @brief Defines the IImageCodec implementation for JPEG files.
 */

#ifndef CBZSAN_JPEG_CODEC_HPP
#define CBZSAN_JPEG_CODEC_HPP

#include "image_codec.hpp"
#include <array>
#include <string_view>
#include <span>

namespace cbzsan {

    /**
     * @brief Implements IImageCodec for JPEG files using libjpeg.
     *
     * @details Decodes baseline and progressive JPEGs in grayscale or
     * YCbCr/RGB. CMYK and YCCK streams are rejected since they cannot be
     * re-emitted faithfully from an RGB raster. Encoding uses the libjpeg
     * quality scale with optimized Huffman tables, and keeps the
     * progressive mode of the source.
     */
    class JpegCodec final : public IImageCodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "JpegCodec";
        }

        [[nodiscard]] ImageFormat get_format() const noexcept override { return ImageFormat::Jpeg; }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 2> kMimes = { "image/jpeg", "image/pjpeg" };
            return {kMimes.data(), kMimes.size()};
        }

        /**
         * @brief Decodes a JPEG into a gray or RGB raster.
         *
         * When keep_metadata is set, APPn and COM markers are saved so that
         * encode() can write them back (ICC profiles, EXIF, XMP).
         *
         * @throws std::runtime_error if libjpeg reports a fatal error or the
         *         color space is not gray/RGB.
         */
        [[nodiscard]] Image decode(const std::filesystem::path& input, bool keep_metadata) const override;

        /**
         * @brief Encodes a gray or RGB raster at the requested quality.
         *
         * Alpha channels are not representable in JPEG, so rasters with 2 or 4
         * channels are rejected.
         */
        void encode(const Image& image,
                    const std::filesystem::path& output,
                    const EncodeOptions& options) const override;
    };

} // namespace cbzsan

#endif // CBZSAN_JPEG_CODEC_HPP
