/**
 * @file codec_registry.hpp
 * @brief Defines the registry owning the image codecs and the decode probe.
 */

#ifndef CBZSAN_CODEC_REGISTRY_HPP
#define CBZSAN_CODEC_REGISTRY_HPP

#include "image_codec.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace cbzsan {

/**
 * @brief Probe outcome for a file that decoded successfully.
 */
struct DecodedImage {
    Image image;
    const IImageCodec* codec = nullptr; ///< Codec that decoded it; encodes the candidate too
};

/**
 * @brief Probe outcome for a file that cannot enter the resize path.
 */
struct NotAnImage {
    std::string mime;                 ///< Detected MIME type (may be empty if unreadable)
    std::string reason;               ///< Human-readable explanation for the log
    bool undecodable_image = false;   ///< true if the bytes look like an image we cannot handle
};

using ProbeResult = std::variant<DecodedImage, NotAnImage>;

/**
 * @brief Registry of all available image codecs.
 *
 * @details Owns one instance of each IImageCodec and answers the question
 * "is this file an image we can decode and re-emit?". Instantiated once per
 * run and shared by every ImageNormalizer.
 */
class CodecRegistry {
public:
    /**
     * @brief Construct and register the built-in codecs (JPEG, PNG, WebP, TIFF, BMP).
     */
    CodecRegistry();

    /**
     * @brief Find the codec handling a MIME type.
     * @return Non-owning pointer, or nullptr if no codec supports it.
     */
    [[nodiscard]] const IImageCodec* find_by_mime(const std::string& mime) const;

    /**
     * @brief Find the codec for a given format.
     * @return Non-owning pointer, or nullptr if no codec is registered.
     */
    [[nodiscard]] const IImageCodec* find_by_format(ImageFormat format) const;

    /**
     * @brief Capability probe: sniff the file and try to decode it.
     *
     * Zero-byte and unreadable files, non-image data, image types without a
     * codec, and decode failures all yield NotAnImage. Never throws.
     *
     * @param path File to probe.
     * @param keep_metadata Forwarded to IImageCodec::decode().
     */
    [[nodiscard]] ProbeResult probe(const std::filesystem::path& path, bool keep_metadata) const;

    /// @return All registered codecs.
    [[nodiscard]] const std::vector<std::unique_ptr<IImageCodec>>& all() const { return codecs_; }

private:
    ///< Owned instances of all registered codecs.
    std::vector<std::unique_ptr<IImageCodec>> codecs_;
};

} // namespace cbzsan

#endif // CBZSAN_CODEC_REGISTRY_HPP
