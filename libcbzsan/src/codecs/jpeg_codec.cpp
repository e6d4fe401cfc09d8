#include "../../include/jpeg_codec.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <jpeglib.h>
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

/**
 * @brief libjpeg error handler that throws a C++ exception.
 * @param cinfo Pointer to the libjpeg error context.
 */
void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    throw std::runtime_error(std::string("libjpeg: ") + err->msg);
}

/**
 * @brief Routes libjpeg warnings (corrupt data, premature EOF) to the logger.
 */
void jpeg_output_message_log(const j_common_ptr cinfo) {
    char buffer[JMSG_LENGTH_MAX]{};
    (*cinfo->err->format_message)(cinfo, buffer);
    Logger::log(LogLevel::Debug, std::string("libjpeg: ") + buffer, "libjpeg");
}

void install_error_handlers(JpegErrorMgr &err) {
    err.pub.error_exit = jpeg_error_exit_throw;
    err.pub.output_message = jpeg_output_message_log;
}

/**
 * @brief RAII owner of a libjpeg decompressor.
 */
struct JpegDecompress {
    jpeg_decompress_struct cinfo{};
    JpegErrorMgr err{};

    JpegDecompress() {
        cinfo.err = jpeg_std_error(&err.pub);
        install_error_handlers(err);
        jpeg_create_decompress(&cinfo);
    }
    ~JpegDecompress() { jpeg_destroy_decompress(&cinfo); }

    JpegDecompress(const JpegDecompress &) = delete;
    JpegDecompress &operator=(const JpegDecompress &) = delete;
};

/**
 * @brief RAII owner of a libjpeg compressor.
 */
struct JpegCompress {
    jpeg_compress_struct cinfo{};
    JpegErrorMgr err{};

    JpegCompress() {
        cinfo.err = jpeg_std_error(&err.pub);
        install_error_handlers(err);
        jpeg_create_compress(&cinfo);
    }
    ~JpegCompress() { jpeg_destroy_compress(&cinfo); }

    JpegCompress(const JpegCompress &) = delete;
    JpegCompress &operator=(const JpegCompress &) = delete;
};

/**
 * @brief Configures libjpeg to save all metadata markers for later copying.
 */
void setup_marker_saving(const j_decompress_ptr srcinfo) {
    for (int m = 0; m < 16; ++m) {
        jpeg_save_markers(srcinfo, JPEG_APP0 + m, 0xFFFF);
    }
    jpeg_save_markers(srcinfo, JPEG_COM, 0xFFFF);
}

bool has_prefix(const jpeg_saved_marker_ptr m, const char *prefix, const std::size_t len) {
    return m->data_length >= len && std::memcmp(m->data, prefix, len) == 0;
}

/**
 * @brief Collects saved APPn/COM markers into the image metadata.
 *
 * JFIF (APP0) and Adobe (APP14) markers are left out: the encoder writes
 * its own, and a copied one would disagree with the new stream.
 */
std::vector<cbzsan::JpegMarker> collect_saved_markers(const j_decompress_ptr srcinfo) {
    std::vector<cbzsan::JpegMarker> markers;
    for (jpeg_saved_marker_ptr m = srcinfo->marker_list; m; m = m->next) {
        if (!m->data || m->data_length == 0) continue;
        if (m->marker == JPEG_APP0 && has_prefix(m, "JFIF\0", 5)) continue;
        if (m->marker == JPEG_APP0 + 14 && has_prefix(m, "Adobe", 5)) continue;
        if ((m->marker >= JPEG_APP0 && m->marker <= JPEG_APP0 + 15) || m->marker == JPEG_COM) {
            markers.push_back({m->marker, {m->data, m->data + m->data_length}});
        }
    }

    // stable: multi-chunk ICC profiles must keep their APP2 sequence
    std::ranges::stable_sort(markers,
                             [](const auto &a, const auto &b) { return a.marker < b.marker; });

    markers.erase(std::unique(markers.begin(), markers.end(),
                              [](const auto &a, const auto &b) {
                                  return a.marker == b.marker && a.data == b.data;
                              }),
                  markers.end());
    return markers;
}

} // namespace

namespace cbzsan {

Image JpegCodec::decode(const std::filesystem::path &input, const bool keep_metadata) const {
    unique_FILE infile(open_file(input, "rb"));
    if (!infile) {
        throw std::runtime_error("Cannot open JPEG input: " + input.string());
    }

    JpegDecompress src;
    jpeg_stdio_src(&src.cinfo, infile.get());
    if (keep_metadata) {
        setup_marker_saving(&src.cinfo);
    }

    if (jpeg_read_header(&src.cinfo, TRUE) != JPEG_HEADER_OK) {
        throw std::runtime_error("Invalid JPEG header");
    }

    switch (src.cinfo.jpeg_color_space) {
        case JCS_GRAYSCALE:
            src.cinfo.out_color_space = JCS_GRAYSCALE;
            break;
        case JCS_YCbCr:
        case JCS_RGB:
            src.cinfo.out_color_space = JCS_RGB;
            break;
        default:
            throw std::runtime_error("Unsupported JPEG color space: " +
                                     std::to_string(static_cast<int>(src.cinfo.jpeg_color_space)));
    }

    jpeg_start_decompress(&src.cinfo);

    Image image;
    image.format = ImageFormat::Jpeg;
    image.width = src.cinfo.output_width;
    image.height = src.cinfo.output_height;
    image.channels = src.cinfo.output_components;
    image.progressive = src.cinfo.progressive_mode != 0;

    Logger::log(LogLevel::Debug,
                std::string("JPEG ") + (image.progressive ? "progressive " : "baseline ") +
                std::to_string(image.width) + "x" + std::to_string(image.height),
                "jpeg_codec");

    image.pixels.resize(image.row_bytes() * image.height);
    while (src.cinfo.output_scanline < src.cinfo.output_height) {
        JSAMPROW row = image.pixels.data() + src.cinfo.output_scanline * image.row_bytes();
        if (jpeg_read_scanlines(&src.cinfo, &row, 1) != 1) {
            throw std::runtime_error("JPEG scanline read failed");
        }
    }

    if (keep_metadata) {
        image.metadata.jpeg_markers = collect_saved_markers(&src.cinfo);
    }

    jpeg_finish_decompress(&src.cinfo);
    return image;
}

void JpegCodec::encode(const Image &image,
                       const std::filesystem::path &output,
                       const EncodeOptions &options) const {
    if (image.channels != 1 && image.channels != 3) {
        throw std::runtime_error("JPEG cannot store " + std::to_string(image.channels) + " channels");
    }

    unique_FILE outfile(open_file(output, "wb"));
    if (!outfile) {
        Logger::log(LogLevel::Error, "Cannot open JPEG output: " + output.string(), "jpeg_codec");
        throw std::runtime_error("Cannot open JPEG output");
    }

    JpegCompress dst;
    jpeg_stdio_dest(&dst.cinfo, outfile.get());

    dst.cinfo.image_width = image.width;
    dst.cinfo.image_height = image.height;
    dst.cinfo.input_components = image.channels;
    dst.cinfo.in_color_space = image.channels == 1 ? JCS_GRAYSCALE : JCS_RGB;

    jpeg_set_defaults(&dst.cinfo);
    jpeg_set_quality(&dst.cinfo, std::clamp(options.quality, 1, 100), TRUE);
    dst.cinfo.optimize_coding = TRUE;
    if (image.progressive) {
        jpeg_simple_progression(&dst.cinfo);
    }

    jpeg_start_compress(&dst.cinfo, TRUE);

    // markers go right after the SOI/JFIF header, before any scan data
    if (options.preserve_metadata) {
        for (const auto &m : image.metadata.jpeg_markers) {
            jpeg_write_marker(&dst.cinfo, m.marker, m.data.data(), static_cast<unsigned int>(m.data.size()));
        }
    }

    const std::size_t stride = image.row_bytes();
    while (dst.cinfo.next_scanline < dst.cinfo.image_height) {
        JSAMPROW row = const_cast<JSAMPLE *>(image.pixels.data() + dst.cinfo.next_scanline * stride);
        jpeg_write_scanlines(&dst.cinfo, &row, 1);
    }

    jpeg_finish_compress(&dst.cinfo);

    if (std::fflush(outfile.get()) != 0 || std::ferror(outfile.get())) {
        throw std::runtime_error("Write error on JPEG output: " + output.string());
    }
}

} // namespace cbzsan
