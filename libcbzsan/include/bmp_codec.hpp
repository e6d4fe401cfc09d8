/**
 * @file bmp_codec.hpp
 * @brief Defines the IImageCodec implementation for BMP files.
 */

#ifndef CBZSAN_BMP_CODEC_HPP
#define CBZSAN_BMP_CODEC_HPP

#include "image_codec.hpp"
#include <array>
#include <string_view>
#include <span>

namespace cbzsan {

    /**
     * @brief Implements IImageCodec for BMP files using bmplib.
     *
     * Indexed and RLE sources are expanded to RGB(A). Output is an
     * uncompressed 24 or 32 bit BMP; quality is ignored.
     */
    class BmpCodec final : public IImageCodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "BmpCodec";
        }

        [[nodiscard]] ImageFormat get_format() const noexcept override { return ImageFormat::Bmp; }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 2> kMimes = { "image/bmp", "image/x-ms-bmp" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] Image decode(const std::filesystem::path& input, bool keep_metadata) const override;

        void encode(const Image& image,
                    const std::filesystem::path& output,
                    const EncodeOptions& options) const override;
    };

} // namespace cbzsan

#endif // CBZSAN_BMP_CODEC_HPP
