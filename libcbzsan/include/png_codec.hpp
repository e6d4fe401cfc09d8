/**
 * @file png_codec.hpp
 * @brief Defines the IImageCodec implementation for PNG files.
 */

#ifndef CBZSAN_PNG_CODEC_HPP
#define CBZSAN_PNG_CODEC_HPP

#include "image_codec.hpp"
#include <array>
#include <string_view>
#include <span>

namespace cbzsan {

    /**
     * @brief Implements IImageCodec for PNG files using libpng.
     *
     * @details Decoding normalizes every PNG to 8-bit gray, gray+alpha, RGB
     * or RGBA (palettes and tRNS expanded, 16-bit stripped). Encoding is
     * lossless and ignores the quality setting: it picks the smallest exact
     * color type for the pixels (gray, palette, gray+alpha, RGB, RGBA) and
     * compresses at zlib level 9 with adaptive filtering.
     */
    class PngCodec final : public IImageCodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "PngCodec";
        }

        [[nodiscard]] ImageFormat get_format() const noexcept override { return ImageFormat::Png; }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 1> kMimes = { "image/png" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] Image decode(const std::filesystem::path& input, bool keep_metadata) const override;

        void encode(const Image& image,
                    const std::filesystem::path& output,
                    const EncodeOptions& options) const override;
    };

} // namespace cbzsan

#endif // CBZSAN_PNG_CODEC_HPP
