/**
 * @file image_normalizer.hpp
 * @brief Downsamples and re-encodes the images of a working tree in place.
 */

#ifndef CBZSAN_IMAGE_NORMALIZER_HPP
#define CBZSAN_IMAGE_NORMALIZER_HPP

#include "bounding_box.hpp"
#include "codec_registry.hpp"
#include <cstddef>
#include <filesystem>

namespace cbzsan {

/**
 * @brief Per-archive counters of what the normalizer did.
 */
struct NormalizeStats {
    std::size_t images_examined = 0;    ///< Files decoded successfully
    std::size_t images_resized = 0;     ///< Images larger than the box, downsampled before encoding
    std::size_t images_replaced = 0;    ///< Candidates strictly smaller than the original, promoted
    std::size_t images_kept = 0;        ///< Candidates not smaller, original left byte-for-byte
    std::size_t non_images = 0;         ///< Files that are not images
    std::size_t non_images_dropped = 0; ///< Non-images deleted (drop mode only)
    std::size_t undecodable = 0;        ///< Recognized images no codec could decode or re-emit
    std::size_t failures = 0;           ///< Files left untouched after an unexpected error

    NormalizeStats& operator+=(const NormalizeStats& other) noexcept;
};

/**
 * @brief Applies the resize and keep-if-smaller rule to every file of a tree.
 *
 * Directory listings are sorted by name at every level. Each regular file
 * is probed through the CodecRegistry. Images are downsampled when they
 * exceed the bounding box, always re-encoded in their own format next to
 * the original, and the candidate replaces the original only if it is
 * strictly smaller in bytes. Symlinks are ignored.
 */
class ImageNormalizer {
public:
    /**
     * @param box Maximum extent; an empty axis is unconstrained.
     * @param quality Encoder quality, 1..100. Ignored by lossless formats.
     * @param preserve_metadata Carry ICC/EXIF/XMP/APPn through re-encoding.
     * @param drop_non_images Delete files that are not images.
     * @param registry Codecs used for probing and encoding. Must outlive this object.
     */
    ImageNormalizer(const BoundingBox& box,
                    int quality,
                    bool preserve_metadata,
                    bool drop_non_images,
                    const CodecRegistry& registry);

    /**
     * @brief Normalizes every file under working_tree, recursively.
     *
     * Per-file errors are logged and counted; the affected file is left
     * untouched.
     */
    NormalizeStats normalize(const std::filesystem::path& working_tree) const;

    /**
     * @brief Normalizes a single file.
     * @throws std::exception on an unexpected failure (encode error, I/O error).
     */
    void normalize_file(const std::filesystem::path& file, NormalizeStats& stats) const;

private:
    void walk(const std::filesystem::path& dir, NormalizeStats& stats) const;

    BoundingBox box_;
    int quality_;
    bool preserve_metadata_;
    bool drop_non_images_;
    const CodecRegistry& registry_;
};

} // namespace cbzsan

#endif // CBZSAN_IMAGE_NORMALIZER_HPP
