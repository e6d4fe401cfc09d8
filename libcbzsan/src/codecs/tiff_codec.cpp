#include "../../include/tiff_codec.hpp"
#include "../../include/logger.hpp"
#include <tiffio.h>
#include <algorithm>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

/**
 * @brief Routes libtiff diagnostics to the logger instead of stderr.
 *
 * Failures are still reported through return codes and turned into
 * exceptions by the codec.
 */
void tiff_message_log(const char* module, const char* fmt, va_list ap) {
    char buffer[512]{};
    std::vsnprintf(buffer, sizeof(buffer), fmt, ap);
    std::string msg = "libtiff: ";
    if (module) {
        msg += module;
        msg += ": ";
    }
    cbzsan::Logger::log(cbzsan::LogLevel::Debug, msg + buffer, "libtiff");
}

void install_tiff_handlers() {
    static std::once_flag once;
    std::call_once(once, [] {
        TIFFSetWarningHandler(tiff_message_log);
        TIFFSetErrorHandler(tiff_message_log);
    });
}

/**
 * @brief RAII owner of a TIFF handle.
 */
struct TiffFile {
    TIFF* tif = nullptr;

    TiffFile(const std::filesystem::path& path, const char* mode) : tif(TIFFOpen(path.string().c_str(), mode)) {}
    ~TiffFile() { if (tif) TIFFClose(tif); }

    TiffFile(const TiffFile&) = delete;
    TiffFile& operator=(const TiffFile&) = delete;
};

bool has_alpha_sample(TIFF* tif) {
    uint16_t count = 0;
    uint16_t* types = nullptr;
    if (!TIFFGetFieldDefaulted(tif, TIFFTAG_EXTRASAMPLES, &count, &types) || count == 0 || !types) {
        return false;
    }
    return types[0] == EXTRASAMPLE_ASSOCALPHA || types[0] == EXTRASAMPLE_UNASSALPHA;
}

bool is_grayscale(TIFF* tif) {
    uint16_t photometric = 0;
    if (!TIFFGetField(tif, TIFFTAG_PHOTOMETRIC, &photometric)) {
        return false;
    }
    return photometric == PHOTOMETRIC_MINISBLACK || photometric == PHOTOMETRIC_MINISWHITE;
}

} // namespace

namespace cbzsan {

Image TiffCodec::decode(const std::filesystem::path& input, const bool keep_metadata) const {
    install_tiff_handlers();

    const TiffFile in(input, "r");
    if (!in.tif) {
        throw std::runtime_error("Cannot open TIFF input: " + input.string());
    }
    if (TIFFNumberOfDirectories(in.tif) > 1) {
        throw std::runtime_error("Multi-page TIFF cannot be re-emitted as one raster: " + input.string());
    }

    uint32_t width = 0, height = 0;
    if (!TIFFGetField(in.tif, TIFFTAG_IMAGEWIDTH, &width) ||
        !TIFFGetField(in.tif, TIFFTAG_IMAGELENGTH, &height) || width == 0 || height == 0) {
        throw std::runtime_error("TIFF without image dimensions: " + input.string());
    }

    const bool alpha = has_alpha_sample(in.tif);
    const bool gray = is_grayscale(in.tif);

    // libtiff handles decompression, bit depths and photometric conversions
    std::vector<uint32_t> raster(static_cast<std::size_t>(width) * height);
    if (!TIFFReadRGBAImageOriented(in.tif, width, height, raster.data(), ORIENTATION_TOPLEFT, 0)) {
        throw std::runtime_error("TIFFReadRGBAImageOriented failed: " + input.string());
    }

    Image image;
    image.format = ImageFormat::Tiff;
    image.width = width;
    image.height = height;
    image.channels = gray ? (alpha ? 2 : 1) : (alpha ? 4 : 3);
    image.pixels.resize(image.row_bytes() * height);

    // the RGBA reader hands back RGB with alpha premultiplied, Image holds straight alpha
    const auto straight = [](const uint32_t c, const uint32_t a) {
        if (a == 0 || a == 255) return static_cast<std::uint8_t>(c);
        return static_cast<std::uint8_t>(std::min<uint32_t>(255, (c * 255 + a / 2) / a));
    };

    std::uint8_t* out = image.pixels.data();
    for (const uint32_t p : raster) {
        const uint32_t a = TIFFGetA(p);
        if (gray) {
            *out++ = static_cast<std::uint8_t>(TIFFGetR(p));
        } else if (alpha) {
            *out++ = straight(TIFFGetR(p), a);
            *out++ = straight(TIFFGetG(p), a);
            *out++ = straight(TIFFGetB(p), a);
        } else {
            *out++ = static_cast<std::uint8_t>(TIFFGetR(p));
            *out++ = static_cast<std::uint8_t>(TIFFGetG(p));
            *out++ = static_cast<std::uint8_t>(TIFFGetB(p));
        }
        if (alpha) {
            *out++ = static_cast<std::uint8_t>(a);
        }
    }

    if (keep_metadata) {
        uint32_t icc_len = 0;
        void* icc_data = nullptr;
        if (TIFFGetField(in.tif, TIFFTAG_ICCPROFILE, &icc_len, &icc_data) && icc_data && icc_len > 0) {
            const auto* bytes = static_cast<const std::uint8_t*>(icc_data);
            image.metadata.icc_profile.assign(bytes, bytes + icc_len);
        }
    }

    Logger::log(LogLevel::Debug,
                "Decoded TIFF " + input.filename().string() + " (" + std::to_string(width) + "x" +
                std::to_string(height) + ", " + std::to_string(image.channels) + " channels)",
                "tiff_codec");
    return image;
}

void TiffCodec::encode(const Image& image,
                       const std::filesystem::path& output,
                       const EncodeOptions& options) const {
    if (image.channels < 1 || image.channels > 4 || image.pixels.size() < image.row_bytes() * image.height) {
        throw std::runtime_error("TiffCodec: malformed raster");
    }
    install_tiff_handlers();

    const TiffFile out(output, "w");
    if (!out.tif) {
        Logger::log(LogLevel::Error, "Cannot open TIFF output: " + output.string(), "tiff_codec");
        throw std::runtime_error("TiffCodec: cannot open output");
    }

    const bool gray = image.channels <= 2;
    TIFFSetField(out.tif, TIFFTAG_IMAGEWIDTH, image.width);
    TIFFSetField(out.tif, TIFFTAG_IMAGELENGTH, image.height);
    TIFFSetField(out.tif, TIFFTAG_SAMPLESPERPIXEL, static_cast<uint16_t>(image.channels));
    TIFFSetField(out.tif, TIFFTAG_BITSPERSAMPLE, static_cast<uint16_t>(8));
    TIFFSetField(out.tif, TIFFTAG_PHOTOMETRIC, gray ? PHOTOMETRIC_MINISBLACK : PHOTOMETRIC_RGB);
    TIFFSetField(out.tif, TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG);
    TIFFSetField(out.tif, TIFFTAG_ORIENTATION, ORIENTATION_TOPLEFT);
    TIFFSetField(out.tif, TIFFTAG_COMPRESSION, COMPRESSION_ADOBE_DEFLATE);
    TIFFSetField(out.tif, TIFFTAG_PREDICTOR, PREDICTOR_HORIZONTAL);
    TIFFSetField(out.tif, TIFFTAG_ZIPQUALITY, 9);
    TIFFSetField(out.tif, TIFFTAG_ROWSPERSTRIP, TIFFDefaultStripSize(out.tif, 0));

    if (image.has_alpha()) {
        const uint16_t extra = EXTRASAMPLE_UNASSALPHA;
        TIFFSetField(out.tif, TIFFTAG_EXTRASAMPLES, 1, &extra);
    }
    if (options.preserve_metadata && !image.metadata.icc_profile.empty()) {
        TIFFSetField(out.tif, TIFFTAG_ICCPROFILE,
                     static_cast<uint32_t>(image.metadata.icc_profile.size()),
                     image.metadata.icc_profile.data());
    }

    // the predictor may modify the scanline in place, so hand libtiff a copy
    std::vector<std::uint8_t> row(image.row_bytes());
    for (uint32_t y = 0; y < image.height; ++y) {
        const auto* src = image.pixels.data() + static_cast<std::size_t>(y) * image.row_bytes();
        std::copy(src, src + row.size(), row.begin());
        if (TIFFWriteScanline(out.tif, row.data(), y, 0) < 0) {
            Logger::log(LogLevel::Error, "Failed to write TIFF scanline for: " + output.string(), "tiff_codec");
            throw std::runtime_error("TiffCodec: write scanline failed");
        }
    }

    if (!TIFFWriteDirectory(out.tif)) {
        Logger::log(LogLevel::Error, "Failed to write TIFF directory for: " + output.string(), "tiff_codec");
        throw std::runtime_error("TiffCodec: write directory failed");
    }
}

} // namespace cbzsan
