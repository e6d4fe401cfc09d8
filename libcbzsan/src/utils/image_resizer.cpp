#define STB_IMAGE_RESIZE_IMPLEMENTATION

#include "../../include/image_resizer.hpp"
#include "../../include/logger.hpp"
#include <stdexcept>
#include <string>

#include <stb_image_resize2.h>

namespace cbzsan {

namespace {

// non-PM alpha layouts: stb premultiplies before filtering and divides after
stbir_pixel_layout layout_for(const int channels) {
    switch (channels) {
        case 1: return STBIR_1CHANNEL;
        case 2: return STBIR_RA;
        case 3: return STBIR_RGB;
        default: return STBIR_RGBA;
    }
}

} // namespace

Image resize_area(const Image& source, const ImageSize target) {
    if (source.width == 0 || source.height == 0 || source.channels < 1 || source.channels > 4) {
        throw std::invalid_argument("resize_area: empty or malformed source image");
    }
    if (target.width == 0 || target.height == 0) {
        throw std::invalid_argument("resize_area: target size must be at least 1x1");
    }
    if (source.pixels.size() < source.row_bytes() * source.height) {
        throw std::invalid_argument("resize_area: pixel buffer shorter than the declared size");
    }

    Image result;
    result.width = target.width;
    result.height = target.height;
    result.channels = source.channels;
    result.format = source.format;
    result.progressive = source.progressive;
    result.lossless = source.lossless;
    result.metadata = source.metadata;
    result.pixels.resize(result.row_bytes() * result.height);

    // box filter: each output pixel averages the source area it covers
    const void* out = stbir_resize(source.pixels.data(),
                                   static_cast<int>(source.width), static_cast<int>(source.height),
                                   static_cast<int>(source.row_bytes()),
                                   result.pixels.data(),
                                   static_cast<int>(result.width), static_cast<int>(result.height),
                                   static_cast<int>(result.row_bytes()),
                                   layout_for(source.channels), STBIR_TYPE_UINT8,
                                   STBIR_EDGE_CLAMP, STBIR_FILTER_BOX);
    if (!out) {
        Logger::log(LogLevel::Error,
                    "stbir_resize failed for " + std::to_string(source.width) + "x" +
                    std::to_string(source.height) + " -> " + std::to_string(target.width) + "x" +
                    std::to_string(target.height),
                    "image_resizer");
        throw std::runtime_error("resize_area: stbir_resize failed");
    }

    return result;
}

} // namespace cbzsan
