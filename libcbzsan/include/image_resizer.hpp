/**
 * @file image_resizer.hpp
 * @brief Area-averaging downsampler for decoded rasters.
 */

#ifndef CBZSAN_IMAGE_RESIZER_HPP
#define CBZSAN_IMAGE_RESIZER_HPP

#include "bounding_box.hpp"
#include "image.hpp"

namespace cbzsan {

/**
 * @brief Scales an image to exactly the given size with an area-averaging filter.
 *
 * Runs stb_image_resize2 with its box filter, so every destination pixel
 * is the mean of the source area it covers, weighted by fractional
 * overlap. Color channels of images with an alpha channel are averaged
 * premultiplied, so fully transparent pixels do not bleed their color
 * into the result.
 *
 * Format, encode hints and metadata of the source are carried over.
 *
 * @param source Decoded 8-bit image, 1 to 4 channels.
 * @param target Output size, both axes >= 1.
 * @return The resized image.
 * @throws std::invalid_argument on an empty source or a zero target axis.
 * @throws std::runtime_error if the resampler fails.
 */
[[nodiscard]] Image resize_area(const Image& source, ImageSize target);

} // namespace cbzsan

#endif // CBZSAN_IMAGE_RESIZER_HPP
