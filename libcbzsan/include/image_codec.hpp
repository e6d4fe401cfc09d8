/**
 * @file image_codec.hpp
 * @brief Interface implemented by every image format backend.
 */

#ifndef CBZSAN_IMAGE_CODEC_HPP
#define CBZSAN_IMAGE_CODEC_HPP

#include "image.hpp"
#include <filesystem>
#include <span>
#include <string_view>

/**
 * @namespace cbzsan
 * @brief The main namespace of the cbzsan library.
 *
 * @details Holds the sanitize pipeline (ArchiveExtractor, ImageNormalizer,
 * ArchiveRepackager, PipelineOrchestrator), the image codecs behind the
 * IImageCodec interface, and the two companion utilities (ArchiveScanner,
 * SuffixRenamer).
 */
namespace cbzsan {

/**
 * @brief Settings applied when re-encoding an image.
 */
struct EncodeOptions {
    int quality = 75;               ///< 1..100, meaning depends on the codec
    bool preserve_metadata = false; ///< Write ImageMetadata back into the output
};

/**
 * @brief Interface for an image format backend.
 *
 * Each implementation decodes one format into an 8-bit Image and writes it
 * back in the same format. Implementations are stateless; the CodecRegistry
 * owns one instance of each.
 */
class IImageCodec {
public:
    virtual ~IImageCodec() = default;

    // --- self-description ---

    /// @return Human-readable name of the codec (e.g. "JpegCodec").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return The format this codec reads and writes.
    [[nodiscard]] virtual ImageFormat get_format() const noexcept = 0;

    /// @return List of supported MIME types (e.g. "image/png").
    [[nodiscard]] virtual std::span<const std::string_view> get_supported_mime_types() const noexcept = 0;

    // --- operations ---

    /**
     * @brief Decode a file into an 8-bit raster.
     * @param input Path to the encoded image.
     * @param keep_metadata Whether to collect ICC/EXIF/XMP/markers into Image::metadata.
     * @throws std::runtime_error if the file cannot be decoded or its
     *         pixel layout cannot be re-emitted by encode().
     */
    [[nodiscard]] virtual Image decode(const std::filesystem::path& input, bool keep_metadata) const = 0;

    /**
     * @brief Encode a raster into the codec's format.
     * @param image Raster produced by decode(), possibly resized.
     * @param output Path of the file to create (overwritten if present).
     * @param options Quality and metadata settings.
     * @throws std::runtime_error on any encoder failure.
     */
    virtual void encode(const Image& image,
                        const std::filesystem::path& output,
                        const EncodeOptions& options) const = 0;
};

} // namespace cbzsan

#endif // CBZSAN_IMAGE_CODEC_HPP
