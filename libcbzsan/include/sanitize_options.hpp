#ifndef CBZSAN_SANITIZE_OPTIONS_HPP
#define CBZSAN_SANITIZE_OPTIONS_HPP

#include "bounding_box.hpp"
#include <filesystem>

namespace cbzsan {

/**
 * @brief Run configuration of the sanitize pipeline.
 *
 * Built once from the command line and read-only afterwards.
 */
struct SanitizeOptions {
    BoundingBox bbox{1440, std::nullopt};       ///< Default "1440x"
    int quality = 75;                           ///< Encoder quality, 1..100
    std::filesystem::path temp_root = "/tmp";   ///< Parent of the per-archive working directories
    bool preserve_metadata = false;             ///< Keep ICC/EXIF/XMP/APPn when re-encoding
    bool drop_non_images = false;               ///< Delete members that are not images
};

} // namespace cbzsan

#endif // CBZSAN_SANITIZE_OPTIONS_HPP
