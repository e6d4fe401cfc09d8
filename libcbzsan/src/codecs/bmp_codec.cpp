#include "../../include/bmp_codec.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

extern "C" {
#include <bmplib.h>
}

namespace {

std::string bmplib_result_to_string(const BMPRESULT res) {
    switch (res) {
        case BMP_RESULT_OK:        return "OK";
        case BMP_RESULT_INVALID:   return "Invalid pixel data";
        case BMP_RESULT_TRUNCATED: return "File truncated";
        case BMP_RESULT_INSANE:    return "Image dimensions too large";
        case BMP_RESULT_PNG:       return "Embedded PNG (unsupported)";
        case BMP_RESULT_JPEG:      return "Embedded JPEG (unsupported)";
        case BMP_RESULT_ERROR:     return "Generic error";
        case BMP_RESULT_ARRAY:     return "OS/2 Bitmap Array (unsupported)";
        default:                   return "Unknown result code (" + std::to_string(res) + ")";
    }
}

// bmp_errmsg() when bmplib left one, the result code otherwise
std::string describe(const BMPHANDLE h, const BMPRESULT res) {
    const char* msg = h ? bmp_errmsg(h) : nullptr;
    return msg && *msg ? std::string(msg) : bmplib_result_to_string(res);
}

/**
 * @brief RAII owner of a bmplib handle and the FILE it reads or writes.
 */
struct ScopedBmp {
    BMPHANDLE h = nullptr;
    cbzsan::unique_FILE f;

    ScopedBmp(const std::filesystem::path& path, const char* mode) : f(cbzsan::open_file(path, mode)) {}
    ~ScopedBmp() { if (h) bmp_free(h); }

    ScopedBmp(const ScopedBmp&) = delete;
    ScopedBmp& operator=(const ScopedBmp&) = delete;
};

/**
 * @brief Owns a buffer allocated by bmplib with malloc.
 */
struct MallocBuffer {
    unsigned char* data = nullptr;
    ~MallocBuffer() { std::free(data); }
};

} // namespace

namespace cbzsan {

Image BmpCodec::decode(const std::filesystem::path& input, const bool keep_metadata) const {
    ScopedBmp in(input, "rb");
    if (!in.f) {
        throw std::runtime_error("Cannot open BMP input: " + input.string());
    }
    in.h = bmpread_new(in.f.get());
    if (!in.h) {
        throw std::runtime_error("BmpCodec: failed to create read handle");
    }

    BMPRESULT res = bmpread_load_info(in.h);
    if (res != BMP_RESULT_OK) {
        throw std::runtime_error("BmpCodec: " + describe(in.h, res));
    }
    if (bmpread_is_64bit(in.h)) {
        throw std::runtime_error("BmpCodec: 64-bit BMP cannot be re-emitted at 8 bits: " + input.string());
    }

    // palette not loaded: bmplib expands indexed pixels to RGB(A)
    int width = 0, height = 0, channels = 0, bits = 0;
    bmpread_dimensions(in.h, &width, &height, &channels, &bits, nullptr);
    if (width <= 0 || height <= 0 || channels < 1 || channels > 4) {
        throw std::runtime_error("BmpCodec: unsupported layout in " + input.string());
    }
    if (bits != 8) {
        throw std::runtime_error("BmpCodec: " + std::to_string(bits) + " bits per channel not supported: " +
                                 input.string());
    }

    Image image;
    image.format = ImageFormat::Bmp;
    image.width = static_cast<std::uint32_t>(width);
    image.height = static_cast<std::uint32_t>(height);
    image.channels = channels;

    if (bmpread_buffersize(in.h) != image.row_bytes() * image.height) {
        throw std::runtime_error("BmpCodec: unexpected buffer size for " + input.string());
    }
    image.pixels.resize(image.row_bytes() * image.height);
    unsigned char* buffer = image.pixels.data();
    res = bmpread_load_image(in.h, &buffer);
    if (res != BMP_RESULT_OK) {
        throw std::runtime_error("BmpCodec: " + describe(in.h, res));
    }

    if (keep_metadata && bmpread_iccprofile_size(in.h) > 0) {
        MallocBuffer icc;
        const std::size_t icc_size = bmpread_iccprofile_size(in.h);
        if (bmpread_load_iccprofile(in.h, &icc.data) == BMP_RESULT_OK && icc.data) {
            image.metadata.icc_profile.assign(icc.data, icc.data + icc_size);
        } else {
            Logger::log(LogLevel::Warning, "Failed to load ICC profile, continuing without it.", "bmp_codec");
        }
    }

    return image;
}

void BmpCodec::encode(const Image& image,
                      const std::filesystem::path& output,
                      const EncodeOptions& options) const {
    if (image.channels < 1 || image.channels > 4 || image.pixels.size() < image.row_bytes() * image.height) {
        throw std::runtime_error("BmpCodec: malformed raster");
    }

    // gray rasters go out as RGB(A); a gray BMP would need a palette
    const int out_channels = image.channels <= 2 ? image.channels + 2 : image.channels;
    std::vector<std::uint8_t> expanded;
    const std::uint8_t* pixels = image.pixels.data();
    if (out_channels != image.channels) {
        const std::size_t count = static_cast<std::size_t>(image.width) * image.height;
        expanded.reserve(count * out_channels);
        for (std::size_t i = 0; i < count; ++i) {
            const std::uint8_t* p = image.pixels.data() + i * image.channels;
            expanded.insert(expanded.end(), {p[0], p[0], p[0]});
            if (image.channels == 2) expanded.push_back(p[1]);
        }
        pixels = expanded.data();
    }

    ScopedBmp out(output, "wb");
    if (!out.f) {
        Logger::log(LogLevel::Error, "Cannot open BMP output: " + output.string(), "bmp_codec");
        throw std::runtime_error("BmpCodec: cannot open output");
    }
    out.h = bmpwrite_new(out.f.get());
    if (!out.h) {
        throw std::runtime_error("BmpCodec: failed to create write handle");
    }

    BMPRESULT res = bmpwrite_set_dimensions(out.h, static_cast<int>(image.width), static_cast<int>(image.height),
                                            out_channels, 8);
    if (res != BMP_RESULT_OK) {
        throw std::runtime_error("BmpCodec: " + describe(out.h, res));
    }
    if (options.preserve_metadata && !image.metadata.icc_profile.empty()) {
        res = bmpwrite_set_iccprofile(out.h, image.metadata.icc_profile.size(), image.metadata.icc_profile.data());
        if (res != BMP_RESULT_OK) {
            Logger::log(LogLevel::Warning, "Can't attach ICC profile: " + describe(out.h, res), "bmp_codec");
        }
    }

    res = bmpwrite_save_image(out.h, pixels);
    if (res != BMP_RESULT_OK) {
        const std::string err = describe(out.h, res);
        Logger::log(LogLevel::Error, "Bmplib write error: " + err, "bmp_codec");
        throw std::runtime_error("BmpCodec: failed to write image");
    }
}

} // namespace cbzsan
