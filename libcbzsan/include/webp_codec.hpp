/**
 * @file webp_codec.hpp
 * @brief Defines the IImageCodec implementation for WebP image files.
 */

#ifndef CBZSAN_WEBP_CODEC_HPP
#define CBZSAN_WEBP_CODEC_HPP

#include "image_codec.hpp"
#include <array>
#include <string_view>
#include <span>

namespace cbzsan {

    /**
     * @brief Implements IImageCodec for still WebP files using libwebp.
     *
     * @details Lossy sources are re-encoded lossy at the requested quality,
     * lossless sources stay lossless. Animated WebP is rejected at decode
     * time since a single raster cannot represent it. ICC, EXIF and XMP
     * chunks are carried through libwebpmux when metadata is preserved.
     */
    class WebpCodec final : public IImageCodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "WebpCodec";
        }

        [[nodiscard]] ImageFormat get_format() const noexcept override { return ImageFormat::Webp; }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 1> kMimes = { "image/webp" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] Image decode(const std::filesystem::path& input, bool keep_metadata) const override;

        void encode(const Image& image,
                    const std::filesystem::path& output,
                    const EncodeOptions& options) const override;
    };

} // namespace cbzsan

#endif // CBZSAN_WEBP_CODEC_HPP
