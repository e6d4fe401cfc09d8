/**
 * @file bounding_box.hpp
 * @brief The maximum image extent allowed before resizing, and its fit math.
 */

#ifndef CBZSAN_BOUNDING_BOX_HPP
#define CBZSAN_BOUNDING_BOX_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cbzsan {

/**
 * @brief Maximum width/height of an image. An empty axis is unconstrained.
 */
struct BoundingBox {
    std::optional<std::uint32_t> max_width;
    std::optional<std::uint32_t> max_height;

    [[nodiscard]] bool unconstrained() const noexcept { return !max_width && !max_height; }

    /// @return true if an image of the given extent needs no resizing.
    [[nodiscard]] bool fits(std::uint32_t width, std::uint32_t height) const noexcept;

    /// @return The compact "WxH" form, with omitted axes left empty ("1440x").
    [[nodiscard]] std::string to_string() const;
};

/**
 * @brief Target pixel dimensions of a resize.
 */
struct ImageSize {
    std::uint32_t width = 0;
    std::uint32_t height = 0;

    bool operator==(const ImageSize&) const = default;
};

/**
 * @brief Parses the compact grammar `(\d+)?x(\d+)?`.
 *
 * The whole string must match. Either number may be omitted to leave that
 * axis unconstrained ("1440x", "x2000", "x"). Zero or out-of-range values
 * are rejected.
 *
 * @return The parsed box, or nullopt on a malformed string.
 */
std::optional<BoundingBox> parse_bounding_box(std::string_view text);

/**
 * @brief Computes the aspect-preserving size an image must be scaled to.
 *
 * The most constraining configured axis lands exactly on its limit and the
 * other axis is rounded to the integer that keeps the aspect ratio closest
 * to the original. Never upscales.
 *
 * @return nullopt if the image already fits the box.
 */
std::optional<ImageSize> compute_target_size(std::uint32_t width,
                                              std::uint32_t height,
                                              const BoundingBox& box);

} // namespace cbzsan

#endif // CBZSAN_BOUNDING_BOX_HPP
