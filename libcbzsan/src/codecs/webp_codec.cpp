#include "../../include/webp_codec.hpp"
#include "../../include/logger.hpp"
#include <webp/decode.h>
#include <webp/encode.h>
#include <webp/mux.h>
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace cbzsan {

namespace {

std::vector<uint8_t> read_whole_file(const std::filesystem::path& input) {
    std::ifstream file(input, std::ios::binary | std::ios::ate);
    if (!file) {
        throw std::runtime_error("WebpCodec: cannot open input file: " + input.string());
    }
    const std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);
    std::vector<uint8_t> data(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(data.data()), size)) {
        throw std::runtime_error("WebpCodec: failed to read input file: " + input.string());
    }
    return data;
}

struct PictureGuard {
    WebPPicture picture{};
    ~PictureGuard() { WebPPictureFree(&picture); }
};

struct WriterGuard {
    WebPMemoryWriter writer{};
    WriterGuard() { WebPMemoryWriterInit(&writer); }
    ~WriterGuard() { WebPMemoryWriterClear(&writer); }
};

struct MuxGuard {
    WebPMux* mux = nullptr;
    ~MuxGuard() { if (mux) WebPMuxDelete(mux); }
};

struct DataGuard {
    WebPData data{};
    DataGuard() { WebPDataInit(&data); }
    ~DataGuard() { WebPDataClear(&data); }
};

void copy_chunk(const WebPMux* mux, const char* fourcc, std::vector<uint8_t>& out) {
    WebPData chunk;
    if (WebPMuxGetChunk(mux, fourcc, &chunk) == WEBP_MUX_OK && chunk.size > 0) {
        out.assign(chunk.bytes, chunk.bytes + chunk.size);
    }
}

// WebP has no gray layout, so gray rasters are widened before import
std::vector<uint8_t> widen_gray(const Image& image) {
    const int out_channels = image.has_alpha() ? 4 : 3;
    const size_t count = static_cast<size_t>(image.width) * image.height;
    std::vector<uint8_t> out(count * out_channels);
    for (size_t i = 0; i < count; ++i) {
        const uint8_t* src = image.pixels.data() + i * image.channels;
        uint8_t* dst = out.data() + i * out_channels;
        dst[0] = dst[1] = dst[2] = src[0];
        if (out_channels == 4) dst[3] = src[1];
    }
    return out;
}

} // namespace

Image WebpCodec::decode(const std::filesystem::path& input, const bool keep_metadata) const {
    const std::vector<uint8_t> input_data = read_whole_file(input);

    WebPBitstreamFeatures features;
    if (WebPGetFeatures(input_data.data(), input_data.size(), &features) != VP8_STATUS_OK) {
        throw std::runtime_error("WebpCodec: feature detection failed for: " + input.string());
    }
    if (features.has_animation) {
        throw std::runtime_error("WebpCodec: animated WebP cannot be re-emitted as a single frame");
    }

    Image image;
    image.format = ImageFormat::Webp;
    image.lossless = features.format == 2;
    image.channels = features.has_alpha ? 4 : 3;

    int width = 0, height = 0;
    uint8_t* decoded = features.has_alpha
        ? WebPDecodeRGBA(input_data.data(), input_data.size(), &width, &height)
        : WebPDecodeRGB(input_data.data(), input_data.size(), &width, &height);
    if (!decoded) {
        throw std::runtime_error("WebpCodec: decode failed for: " + input.string());
    }
    image.width = static_cast<uint32_t>(width);
    image.height = static_cast<uint32_t>(height);
    image.pixels.assign(decoded, decoded + image.row_bytes() * image.height);
    WebPFree(decoded);

    Logger::log(LogLevel::Debug,
                std::string("WebP ") + (image.lossless ? "lossless " : "lossy ") +
                std::to_string(width) + "x" + std::to_string(height),
                "webp_codec");

    if (keep_metadata) {
        const WebPData input_webp{input_data.data(), input_data.size()};
        MuxGuard mux_in;
        mux_in.mux = WebPMuxCreate(&input_webp, 0);
        if (mux_in.mux) {
            copy_chunk(mux_in.mux, "ICCP", image.metadata.icc_profile);
            copy_chunk(mux_in.mux, "EXIF", image.metadata.exif);
            copy_chunk(mux_in.mux, "XMP ", image.metadata.xmp);
        } else {
            Logger::log(LogLevel::Warning, "WebpCodec: cannot read metadata chunks of " + input.string(), "webp_codec");
        }
    }

    return image;
}

void WebpCodec::encode(const Image& image,
                       const std::filesystem::path& output,
                       const EncodeOptions& options) const {
    WebPConfig config;
    if (!WebPConfigPreset(&config, WEBP_PRESET_DEFAULT, static_cast<float>(std::clamp(options.quality, 1, 100)))) {
        throw std::runtime_error("WebpCodec: WebPConfigPreset failed");
    }
    if (image.lossless && !WebPConfigLosslessPreset(&config, 6)) {
        throw std::runtime_error("WebpCodec: WebPConfigLosslessPreset failed");
    }
    if (!WebPValidateConfig(&config)) {
        throw std::runtime_error("WebpCodec: invalid encoder configuration");
    }

    PictureGuard pic;
    if (!WebPPictureInit(&pic.picture)) {
        throw std::runtime_error("WebpCodec: WebPPictureInit failed");
    }
    pic.picture.width = static_cast<int>(image.width);
    pic.picture.height = static_cast<int>(image.height);
    pic.picture.use_argb = image.lossless ? 1 : 0;

    std::vector<uint8_t> widened;
    const uint8_t* rgb = image.pixels.data();
    int channels = image.channels;
    if (channels == 1 || channels == 2) {
        widened = widen_gray(image);
        rgb = widened.data();
        channels = channels == 2 ? 4 : 3;
    }

    const int stride = static_cast<int>(image.width) * channels;
    const int imported = channels == 4
        ? WebPPictureImportRGBA(&pic.picture, rgb, stride)
        : WebPPictureImportRGB(&pic.picture, rgb, stride);
    if (!imported) {
        throw std::runtime_error("WebpCodec: picture import failed");
    }

    WriterGuard writer;
    pic.picture.writer = WebPMemoryWrite;
    pic.picture.custom_ptr = &writer.writer;

    if (!WebPEncode(&config, &pic.picture)) {
        throw std::runtime_error("WebpCodec: WebPEncode failed (error " +
                                 std::to_string(static_cast<int>(pic.picture.error_code)) + ")");
    }

    const bool with_metadata = options.preserve_metadata &&
        (!image.metadata.icc_profile.empty() || !image.metadata.exif.empty() || !image.metadata.xmp.empty());

    const uint8_t* bytes = writer.writer.mem;
    size_t size = writer.writer.size;

    MuxGuard mux;
    DataGuard assembled;
    if (with_metadata) {
        const WebPData encoded{writer.writer.mem, writer.writer.size};
        mux.mux = WebPMuxCreate(&encoded, 1);
        if (!mux.mux) {
            throw std::runtime_error("WebpCodec: WebPMuxCreate failed");
        }
        const auto set_chunk = [&](const char* fourcc, const std::vector<uint8_t>& payload) {
            if (payload.empty()) return;
            const WebPData chunk{payload.data(), payload.size()};
            if (WebPMuxSetChunk(mux.mux, fourcc, &chunk, 1) != WEBP_MUX_OK) {
                Logger::log(LogLevel::Warning, std::string("WebpCodec: cannot set chunk ") + fourcc, "webp_codec");
            }
        };
        set_chunk("ICCP", image.metadata.icc_profile);
        set_chunk("EXIF", image.metadata.exif);
        set_chunk("XMP ", image.metadata.xmp);

        if (WebPMuxAssemble(mux.mux, &assembled.data) != WEBP_MUX_OK) {
            throw std::runtime_error("WebpCodec: WebPMuxAssemble failed");
        }
        bytes = assembled.data.bytes;
        size = assembled.data.size;
    }

    std::ofstream out(output, std::ios::binary | std::ios::trunc);
    if (!out) {
        Logger::log(LogLevel::Error, "WebpCodec: cannot open output file: " + output.string(), "webp_codec");
        throw std::runtime_error("WebpCodec: cannot open output file");
    }
    out.write(reinterpret_cast<const char*>(bytes), static_cast<std::streamsize>(size));
    out.close();
    if (!out) {
        throw std::runtime_error("WebpCodec: write error on: " + output.string());
    }
}

} // namespace cbzsan
