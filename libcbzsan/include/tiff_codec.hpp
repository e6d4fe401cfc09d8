/**
 * @file tiff_codec.hpp
 * @brief Defines the IImageCodec implementation for TIFF files.
 */

#ifndef CBZSAN_TIFF_CODEC_HPP
#define CBZSAN_TIFF_CODEC_HPP

#include "image_codec.hpp"
#include <array>
#include <string_view>
#include <span>

namespace cbzsan {

    /**
     * @brief Implements IImageCodec for single-page TIFF files using libtiff.
     *
     * @details Any sample layout libtiff's RGBA reader understands is
     * decoded; grayscale sources stay grayscale. Multi-page files are
     * rejected since a page in an archive is one raster. Encoding is
     * lossless Deflate with horizontal differencing and ignores quality.
     */
    class TiffCodec final : public IImageCodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "TiffCodec";
        }

        [[nodiscard]] ImageFormat get_format() const noexcept override { return ImageFormat::Tiff; }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 1> kMimes = { "image/tiff" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] Image decode(const std::filesystem::path& input, bool keep_metadata) const override;

        void encode(const Image& image,
                    const std::filesystem::path& output,
                    const EncodeOptions& options) const override;
    };

} // namespace cbzsan

#endif // CBZSAN_TIFF_CODEC_HPP
