#include "../../include/png_codec.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <zlib.h>
#include <array>
#include <cstdint>
#include <cstring> // IDE may say it's unused, but memcpy lives here
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace cbzsan {

namespace {

    /**
     * @brief libpng error handler that throws a C++ exception.
     * @param msg The error message from libpng.
     */
    void png_error_fn(png_structp, const png_const_charp msg) {
        throw std::runtime_error(std::string("libpng: ") + msg);
    }

    /**
     * @brief libpng warning handler.
     * @param msg The warning message from libpng.
     */
    void png_warning_fn(png_structp, const png_const_charp msg) {
        Logger::log(LogLevel::Debug, std::string("libpng: ") + msg, "libpng");
    }

    /**
     * @brief RAII wrapper for libpng read structs (png_structp, png_infop).
     * Ensures png_destroy_read_struct is called even if exceptions occur.
     */
    struct PngRead {
        png_structp png = nullptr;
        png_infop info = nullptr;

        explicit PngRead() = default;

        ~PngRead() {
            if (png || info) png_destroy_read_struct(&png, &info, nullptr);
        }
    };

    /**
     * @brief RAII wrapper for libpng write structs (png_structp, png_infop).
     * Ensures png_destroy_write_struct is called even if exceptions occur.
     */
    struct PngWrite {
        png_structp png = nullptr;
        png_infop info = nullptr;

        explicit PngWrite() = default;

        ~PngWrite() {
            if (png || info) png_destroy_write_struct(&png, &info);
        }
    };

    /**
     * @brief Packs RGBA color components into a single 32-bit integer.
     */
    inline uint32_t pack_rgba(const unsigned char r, const unsigned char g,
                              const unsigned char b, const unsigned char a) {
        return (static_cast<uint32_t>(r) << 24) |
               (static_cast<uint32_t>(g) << 16) |
               (static_cast<uint32_t>(b) << 8)  |
               (static_cast<uint32_t>(a));
    }

    /**
     * @brief Reads pixel i of an Image as RGBA regardless of its channel count.
     */
    inline std::array<unsigned char, 4> rgba_at(const Image& image, const std::size_t i) {
        const unsigned char* p = image.pixels.data() + i * static_cast<std::size_t>(image.channels);
        switch (image.channels) {
            case 1:  return {p[0], p[0], p[0], 0xFF};
            case 2:  return {p[0], p[0], p[0], p[1]};
            case 3:  return {p[0], p[1], p[2], 0xFF};
            default: return {p[0], p[1], p[2], p[3]};
        }
    }

    /**
     * @brief Result of scanning a raster for the smallest exact PNG layout.
     */
    struct ColorAnalysis {
        bool all_gray = true;
        bool all_opaque = true;
        bool can_use_palette = true;
        std::unordered_map<uint32_t, uint8_t> color_to_index;
        std::vector<png_color> palette;
        std::vector<png_byte> transparency;
    };

    ColorAnalysis analyze_colors(const Image& image) {
        ColorAnalysis a;
        const std::size_t count = static_cast<std::size_t>(image.width) * image.height;
        for (std::size_t i = 0; i < count; ++i) {
            const auto [r, g, b, alpha] = rgba_at(image, i);

            if (r != g || g != b) a.all_gray = false;
            if (alpha != 0xFF) a.all_opaque = false;

            if (a.can_use_palette) {
                const uint32_t color = pack_rgba(r, g, b, alpha);
                if (a.color_to_index.find(color) == a.color_to_index.end()) {
                    if (a.color_to_index.size() >= 256) {
                        a.can_use_palette = false;
                        a.color_to_index.clear();
                        a.palette.clear();
                        a.transparency.clear();
                    } else {
                        const auto index = static_cast<uint8_t>(a.color_to_index.size());
                        a.color_to_index[color] = index;
                        a.palette.push_back({r, g, b});
                        a.transparency.push_back(alpha);
                    }
                }
            }
            if (!a.can_use_palette && !a.all_gray && !a.all_opaque) break;
        }
        return a;
    }

} // namespace

Image PngCodec::decode(const std::filesystem::path& input, const bool keep_metadata) const {
    const unique_FILE fp_in(open_file(input, "rb"));
    if (!fp_in) {
        throw std::runtime_error("Cannot open PNG input: " + input.string());
    }

    png_byte sig[8]{};
    if (std::fread(sig, 1, sizeof(sig), fp_in.get()) != sizeof(sig) || png_sig_cmp(sig, 0, sizeof(sig)) != 0) {
        throw std::runtime_error("Not a PNG signature: " + input.string());
    }

    PngRead rd;
    rd.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
    if (!rd.png) throw std::runtime_error("png_create_read_struct failed");
    rd.info = png_create_info_struct(rd.png);
    if (!rd.info) throw std::runtime_error("png_create_info_struct failed");
    if (setjmp(png_jmpbuf(rd.png))) throw std::runtime_error("libpng read error");

    png_init_io(rd.png, fp_in.get());
    png_set_sig_bytes(rd.png, sizeof(sig));
    png_read_info(rd.png, rd.info);

    png_uint_32 width = 0, height = 0;
    int bit_depth = 0, color_type = 0;
    png_get_IHDR(rd.png, rd.info, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);

    if (bit_depth == 16) png_set_strip_16(rd.png);
    if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(rd.png);
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(rd.png);
    if (png_get_valid(rd.png, rd.info, PNG_INFO_tRNS)) png_set_tRNS_to_alpha(rd.png);
    png_set_interlace_handling(rd.png);

    png_read_update_info(rd.png, rd.info);

    Image image;
    image.format = ImageFormat::Png;
    image.width = width;
    image.height = height;
    image.channels = png_get_channels(rd.png, rd.info);

    const size_t rowbytes = png_get_rowbytes(rd.png, rd.info);
    if (rowbytes != image.row_bytes()) {
        throw std::runtime_error("Rowbytes mismatch, expected 8-bit samples");
    }

    image.pixels.resize(rowbytes * height);
    std::vector<png_bytep> row_pointers(height);
    for (png_uint_32 y = 0; y < height; ++y) {
        row_pointers[y] = image.pixels.data() + y * rowbytes;
    }
    png_read_image(rd.png, row_pointers.data());
    png_read_end(rd.png, rd.info);

    if (keep_metadata && png_get_valid(rd.png, rd.info, PNG_INFO_iCCP)) {
        png_charp name = nullptr;
        int comp_type = 0;
        png_bytep profile = nullptr;
        png_uint_32 profile_len = 0;
        if (png_get_iCCP(rd.png, rd.info, &name, &comp_type, &profile, &profile_len) && profile) {
            image.metadata.icc_profile.assign(profile, profile + profile_len);
        }
    }

    return image;
}

void PngCodec::encode(const Image& image,
                      const std::filesystem::path& output,
                      const EncodeOptions& options) const {
    if (image.channels < 1 || image.channels > 4) {
        throw std::runtime_error("PNG cannot store " + std::to_string(image.channels) + " channels");
    }

    const ColorAnalysis colors = analyze_colors(image);

    const unique_FILE fp_out(open_file(output, "wb"));
    if (!fp_out) {
        Logger::log(LogLevel::Error, "Cannot open PNG output: " + output.string(), "png_codec");
        throw std::runtime_error("Cannot open PNG output");
    }

    PngWrite wr;
    wr.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
    if (!wr.png) throw std::runtime_error("png_create_write_struct failed");
    wr.info = png_create_info_struct(wr.png);
    if (!wr.info) throw std::runtime_error("png_create_info_struct failed");
    if (setjmp(png_jmpbuf(wr.png))) throw std::runtime_error("libpng write error");

    png_init_io(wr.png, fp_out.get());

    // set max compression
    png_set_compression_level(wr.png, 9);
    png_set_compression_mem_level(wr.png, 9);
    png_set_compression_strategy(wr.png, Z_DEFAULT_STRATEGY);
    png_set_filter(wr.png, PNG_FILTER_TYPE_BASE, PNG_ALL_FILTERS);

    // determine optimal output format; plain gray beats a palette of grays (no PLTE)
    int out_color_type = 0;
    if (colors.all_gray && colors.all_opaque) {
        out_color_type = PNG_COLOR_TYPE_GRAY;
    } else if (colors.can_use_palette) {
        out_color_type = PNG_COLOR_TYPE_PALETTE;
    } else if (colors.all_gray) {
        out_color_type = PNG_COLOR_TYPE_GA;
    } else if (colors.all_opaque) {
        out_color_type = PNG_COLOR_TYPE_RGB;
    } else {
        out_color_type = PNG_COLOR_TYPE_RGBA;
    }

    png_set_IHDR(wr.png, wr.info, image.width, image.height, 8, out_color_type,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);

    if (out_color_type == PNG_COLOR_TYPE_PALETTE) {
        png_set_PLTE(wr.png, wr.info, colors.palette.data(), static_cast<int>(colors.palette.size()));
        // only write tRNS if there is actual transparency
        if (!colors.all_opaque) {
            png_set_tRNS(wr.png, wr.info, colors.transparency.data(),
                         static_cast<int>(colors.transparency.size()), nullptr);
        }
    }

    if (options.preserve_metadata && !image.metadata.icc_profile.empty()) {
        png_set_iCCP(wr.png, wr.info, "ICC Profile", PNG_COMPRESSION_TYPE_BASE,
                     image.metadata.icc_profile.data(),
                     static_cast<png_uint_32>(image.metadata.icc_profile.size()));
    }

    png_write_info(wr.png, wr.info);

    const png_size_t out_channels = png_get_channels(wr.png, wr.info);
    std::vector<unsigned char> out_rowbuf(static_cast<size_t>(image.width) * out_channels);
    png_bytep out_row = out_rowbuf.data();

    for (png_uint_32 y = 0; y < image.height; ++y) {
        unsigned char *dst = out_row;
        const std::size_t row_start = static_cast<std::size_t>(y) * image.width;

        if (out_color_type == PNG_COLOR_TYPE_RGBA && image.channels == 4) {
            std::memcpy(dst, image.pixels.data() + row_start * 4, static_cast<size_t>(image.width) * 4);
        } else {
            for (png_uint_32 x = 0; x < image.width; ++x) {
                const auto [r, g, b, a] = rgba_at(image, row_start + x);
                switch (out_color_type) {
                    case PNG_COLOR_TYPE_PALETTE:
                        *dst++ = colors.color_to_index.at(pack_rgba(r, g, b, a));
                        break;
                    case PNG_COLOR_TYPE_GRAY:
                        *dst++ = r; // r = g = b
                        break;
                    case PNG_COLOR_TYPE_GA:
                        *dst++ = r;
                        *dst++ = a;
                        break;
                    case PNG_COLOR_TYPE_RGB:
                        *dst++ = r;
                        *dst++ = g;
                        *dst++ = b;
                        break;
                    default:
                        *dst++ = r;
                        *dst++ = g;
                        *dst++ = b;
                        *dst++ = a;
                        break;
                }
            }
        }

        png_write_rows(wr.png, &out_row, 1);
    }

    png_write_end(wr.png, wr.info);

    if (std::fflush(fp_out.get()) != 0 || std::ferror(fp_out.get())) {
        throw std::runtime_error("Write error on PNG output: " + output.string());
    }
}

} // namespace cbzsan
