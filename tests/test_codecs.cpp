#include <gtest/gtest.h>
#include "bmp_codec.hpp"
#include "codec_registry.hpp"
#include "jpeg_codec.hpp"
#include "mime_detector.hpp"
#include "png_codec.hpp"
#include "tiff_codec.hpp"
#include "webp_codec.hpp"
#include "testing.hpp"
#include <tiffio.h>
#include <variant>

namespace cbzsan {

namespace {

// color type byte of the IHDR chunk
int png_color_type(const std::filesystem::path& file) {
    const std::string bytes = testutil::ReadFile(file);
    return bytes.size() > 25 ? static_cast<unsigned char>(bytes[25]) : -1;
}

// two blank RGB pages in one file
void write_two_page_tiff(const std::filesystem::path& file) {
    TIFF* tif = TIFFOpen(file.string().c_str(), "w");
    ASSERT_NE(tif, nullptr);
    std::vector<std::uint8_t> row(8 * 3, 0x40);
    for (int page = 0; page < 2; ++page) {
        TIFFSetField(tif, TIFFTAG_IMAGEWIDTH, 8u);
        TIFFSetField(tif, TIFFTAG_IMAGELENGTH, 4u);
        TIFFSetField(tif, TIFFTAG_SAMPLESPERPIXEL, 3);
        TIFFSetField(tif, TIFFTAG_BITSPERSAMPLE, 8);
        TIFFSetField(tif, TIFFTAG_PHOTOMETRIC, PHOTOMETRIC_RGB);
        TIFFSetField(tif, TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG);
        for (uint32_t y = 0; y < 4; ++y) {
            ASSERT_GE(TIFFWriteScanline(tif, row.data(), y, 0), 0);
        }
        ASSERT_TRUE(TIFFWriteDirectory(tif));
    }
    TIFFClose(tif);
}

} // namespace

class CodecsTest : public ::testing::Test {
protected:
    testutil::TemporaryDirectory temp_dir;
    CodecRegistry registry;

    std::filesystem::path File(const std::string& name) const { return temp_dir.Path() / name; }
};

TEST_F(CodecsTest, JpegRoundTripKeepsDimensions) {
    const JpegCodec codec;
    codec.encode(testutil::MakeGradient(123, 77, 3), File("a.jpg"), EncodeOptions{});

    const Image decoded = codec.decode(File("a.jpg"), false);
    EXPECT_EQ(decoded.width, 123u);
    EXPECT_EQ(decoded.height, 77u);
    EXPECT_EQ(decoded.channels, 3);
    EXPECT_EQ(decoded.format, ImageFormat::Jpeg);
}

TEST_F(CodecsTest, JpegKeepsGrayscale) {
    const JpegCodec codec;
    codec.encode(testutil::MakeGradient(64, 64, 1), File("gray.jpg"), EncodeOptions{});
    EXPECT_EQ(codec.decode(File("gray.jpg"), false).channels, 1);
}

TEST_F(CodecsTest, JpegLowerQualityIsSmaller) {
    const JpegCodec codec;
    const Image img = testutil::MakeGradient(256, 256, 3);
    EncodeOptions high;
    high.quality = 95;
    EncodeOptions low;
    low.quality = 30;
    codec.encode(img, File("high.jpg"), high);
    codec.encode(img, File("low.jpg"), low);
    EXPECT_LT(std::filesystem::file_size(File("low.jpg")), std::filesystem::file_size(File("high.jpg")));
}

TEST_F(CodecsTest, JpegDecodeOfGarbageThrows) {
    testutil::WriteFile(File("bad.jpg"), std::string("\xFF\xD8\xFF\xE0garbage", 11));
    EXPECT_THROW((void)JpegCodec().decode(File("bad.jpg"), false), std::runtime_error);
}

TEST_F(CodecsTest, PngRoundTripKeepsPixels) {
    const PngCodec codec;
    const Image src = testutil::MakeGradient(50, 40, 4, ImageFormat::Png);
    codec.encode(src, File("a.png"), EncodeOptions{});

    const Image decoded = codec.decode(File("a.png"), false);
    EXPECT_EQ(decoded.width, 50u);
    EXPECT_EQ(decoded.height, 40u);
    EXPECT_EQ(decoded.format, ImageFormat::Png);
    // opaque alpha lets the encoder drop the alpha channel, colors are exact either way
    ASSERT_EQ(decoded.channels, 3);
    for (std::size_t i = 0; i < 50u * 40u; ++i) {
        ASSERT_EQ(decoded.pixels[i * 3], src.pixels[i * 4]);
        ASSERT_EQ(decoded.pixels[i * 3 + 1], src.pixels[i * 4 + 1]);
        ASSERT_EQ(decoded.pixels[i * 3 + 2], src.pixels[i * 4 + 2]);
    }
}

TEST_F(CodecsTest, PngReducesOpaqueGrayToGrayscale) {
    PngCodec().encode(testutil::MakeGradient(300, 20, 3, ImageFormat::Png), File("rgb.png"), EncodeOptions{});
    // stored as RGB, but every pixel has r == g == b
    Image gray = testutil::MakeGradient(300, 20, 1, ImageFormat::Png);
    gray.channels = 3;
    gray.pixels.clear();
    for (std::uint32_t y = 0; y < 20; ++y) {
        for (std::uint32_t x = 0; x < 300; ++x) {
            const auto v = static_cast<std::uint8_t>(x * 255 / 299);
            gray.pixels.insert(gray.pixels.end(), {v, v, v});
        }
    }
    PngCodec().encode(gray, File("gray.png"), EncodeOptions{});

    EXPECT_EQ(png_color_type(File("gray.png")), 0);
    EXPECT_NE(png_color_type(File("rgb.png")), 0);
}

TEST_F(CodecsTest, PngUsesPaletteForFewColors) {
    Image img = testutil::MakeSolid(16, 16, 3, 0, ImageFormat::Png);
    for (std::size_t i = 0; i < img.pixels.size(); i += 3) {
        img.pixels[i] = (i / 3) % 2 ? 255 : 0;
        img.pixels[i + 2] = 80;
    }
    PngCodec().encode(img, File("pal.png"), EncodeOptions{});
    EXPECT_EQ(png_color_type(File("pal.png")), 3);

    const Image decoded = PngCodec().decode(File("pal.png"), false);
    EXPECT_EQ(decoded.channels, 3);
    EXPECT_EQ(decoded.pixels, img.pixels);
}

TEST_F(CodecsTest, PngKeepsTranslucentColor) {
    Image img = testutil::MakeGradient(300, 300, 4, ImageFormat::Png);
    for (std::size_t i = 3; i < img.pixels.size(); i += 4) {
        img.pixels[i] = 100;
    }
    PngCodec().encode(img, File("rgba.png"), EncodeOptions{});
    EXPECT_EQ(png_color_type(File("rgba.png")), 6);
    EXPECT_EQ(PngCodec().decode(File("rgba.png"), false).channels, 4);
}

TEST_F(CodecsTest, WebpLosslessStaysLossless) {
    const WebpCodec codec;
    Image img = testutil::MakeGradient(64, 48, 4, ImageFormat::Webp);
    img.lossless = true;
    codec.encode(img, File("a.webp"), EncodeOptions{});

    const Image decoded = codec.decode(File("a.webp"), false);
    EXPECT_EQ(decoded.width, 64u);
    EXPECT_EQ(decoded.height, 48u);
    EXPECT_TRUE(decoded.lossless);
    EXPECT_EQ(decoded.format, ImageFormat::Webp);
}

TEST_F(CodecsTest, WebpLossyRoundTrip) {
    const WebpCodec codec;
    codec.encode(testutil::MakeGradient(64, 48, 3, ImageFormat::Webp), File("b.webp"), EncodeOptions{});
    const Image decoded = codec.decode(File("b.webp"), false);
    EXPECT_EQ(decoded.width, 64u);
    EXPECT_FALSE(decoded.lossless);
}

TEST_F(CodecsTest, TiffRoundTripIsLossless) {
    const TiffCodec codec;
    const Image src = testutil::MakeGradient(70, 45, 3, ImageFormat::Tiff);
    codec.encode(src, File("a.tif"), EncodeOptions{});

    const Image decoded = codec.decode(File("a.tif"), false);
    EXPECT_EQ(decoded.width, 70u);
    EXPECT_EQ(decoded.height, 45u);
    EXPECT_EQ(decoded.channels, 3);
    EXPECT_EQ(decoded.format, ImageFormat::Tiff);
    EXPECT_EQ(decoded.pixels, src.pixels);
}

TEST_F(CodecsTest, TiffKeepsGrayAndAlpha) {
    const TiffCodec codec;
    Image src = testutil::MakeGradient(32, 16, 2, ImageFormat::Tiff);
    for (std::size_t i = 1; i < src.pixels.size(); i += 2) {
        src.pixels[i] = 255;
    }
    codec.encode(src, File("ga.tif"), EncodeOptions{});
    const Image decoded = codec.decode(File("ga.tif"), false);
    EXPECT_EQ(decoded.channels, 2);
    EXPECT_EQ(decoded.pixels, src.pixels);

    codec.encode(testutil::MakeGradient(32, 16, 1, ImageFormat::Tiff), File("g.tif"), EncodeOptions{});
    EXPECT_EQ(codec.decode(File("g.tif"), false).channels, 1);
}

TEST_F(CodecsTest, TiffMultiPageIsRejected) {
    write_two_page_tiff(File("pages.tif"));
    EXPECT_THROW((void)TiffCodec().decode(File("pages.tif"), false), std::runtime_error);

    const ProbeResult result = registry.probe(File("pages.tif"), false);
    ASSERT_TRUE(std::holds_alternative<NotAnImage>(result));
    EXPECT_TRUE(std::get<NotAnImage>(result).undecodable_image);
}

TEST_F(CodecsTest, BmpRoundTripIsLossless) {
    const BmpCodec codec;
    const Image src = testutil::MakeGradient(33, 21, 3, ImageFormat::Bmp);
    codec.encode(src, File("a.bmp"), EncodeOptions{});

    const Image decoded = codec.decode(File("a.bmp"), false);
    EXPECT_EQ(decoded.width, 33u);
    EXPECT_EQ(decoded.height, 21u);
    EXPECT_EQ(decoded.channels, 3);
    EXPECT_EQ(decoded.format, ImageFormat::Bmp);
    EXPECT_EQ(decoded.pixels, src.pixels);
}

TEST_F(CodecsTest, BmpWritesGrayAsRgb) {
    const BmpCodec codec;
    const Image src = testutil::MakeGradient(16, 8, 1, ImageFormat::Bmp);
    codec.encode(src, File("g.bmp"), EncodeOptions{});

    const Image decoded = codec.decode(File("g.bmp"), false);
    ASSERT_EQ(decoded.channels, 3);
    for (std::size_t i = 0; i < 16u * 8u; ++i) {
        ASSERT_EQ(decoded.pixels[i * 3], src.pixels[i]);
        ASSERT_EQ(decoded.pixels[i * 3 + 1], src.pixels[i]);
        ASSERT_EQ(decoded.pixels[i * 3 + 2], src.pixels[i]);
    }
}

TEST_F(CodecsTest, BmpDecodeOfTruncatedFileThrows) {
    BmpCodec().encode(testutil::MakeGradient(40, 40, 3, ImageFormat::Bmp), File("full.bmp"), EncodeOptions{});
    const std::string bytes = testutil::ReadFile(File("full.bmp"));
    testutil::WriteFile(File("cut.bmp"), bytes.substr(0, 40));
    EXPECT_THROW((void)BmpCodec().decode(File("cut.bmp"), false), std::runtime_error);
}

TEST_F(CodecsTest, ProbeDecodesTiffAndBmp) {
    TiffCodec().encode(testutil::MakeGradient(20, 30, 3, ImageFormat::Tiff), File("page.tif"), EncodeOptions{});
    BmpCodec().encode(testutil::MakeGradient(20, 30, 3, ImageFormat::Bmp), File("page.bmp"), EncodeOptions{});

    const ProbeResult tiff = registry.probe(File("page.tif"), false);
    ASSERT_TRUE(std::holds_alternative<DecodedImage>(tiff));
    EXPECT_EQ(std::get<DecodedImage>(tiff).codec->get_format(), ImageFormat::Tiff);

    const ProbeResult bmp = registry.probe(File("page.bmp"), false);
    ASSERT_TRUE(std::holds_alternative<DecodedImage>(bmp));
    EXPECT_EQ(std::get<DecodedImage>(bmp).codec->get_format(), ImageFormat::Bmp);
    EXPECT_EQ(std::get<DecodedImage>(bmp).image.height, 30u);
}

TEST_F(CodecsTest, RegistryFindsCodecsByMimeAndFormat) {
    ASSERT_NE(registry.find_by_mime("image/jpeg"), nullptr);
    EXPECT_EQ(registry.find_by_mime("image/jpeg")->get_format(), ImageFormat::Jpeg);
    EXPECT_EQ(registry.find_by_mime("image/png")->get_format(), ImageFormat::Png);
    EXPECT_EQ(registry.find_by_mime("image/webp")->get_format(), ImageFormat::Webp);
    EXPECT_EQ(registry.find_by_mime("image/tiff")->get_format(), ImageFormat::Tiff);
    EXPECT_EQ(registry.find_by_mime("image/bmp")->get_format(), ImageFormat::Bmp);
    EXPECT_EQ(registry.find_by_mime("image/x-ms-bmp")->get_format(), ImageFormat::Bmp);
    EXPECT_EQ(registry.find_by_mime("image/gif"), nullptr);
    EXPECT_EQ(registry.find_by_mime("text/plain"), nullptr);
    EXPECT_EQ(registry.find_by_format(ImageFormat::Png), registry.find_by_mime("image/png"));
    EXPECT_EQ(registry.all().size(), 5u);
}

TEST_F(CodecsTest, ProbeDecodesJpeg) {
    testutil::WriteFile(File("page.jpg"), testutil::MakeJpegBytes(40, 60, 80, File("scratch.jpg")));
    const ProbeResult result = registry.probe(File("page.jpg"), false);
    ASSERT_TRUE(std::holds_alternative<DecodedImage>(result));
    const auto& decoded = std::get<DecodedImage>(result);
    EXPECT_EQ(decoded.image.width, 40u);
    EXPECT_EQ(decoded.image.height, 60u);
    ASSERT_NE(decoded.codec, nullptr);
    EXPECT_EQ(decoded.codec->get_format(), ImageFormat::Jpeg);
}

TEST_F(CodecsTest, ProbeDetectsByContentNotExtension) {
    // a PNG named .jpg is still handled by the PNG codec
    testutil::WriteFile(File("odd.jpg"),
                        testutil::MakePngBytes(testutil::MakeGradient(8, 8, 3, ImageFormat::Png), File("s.png")));
    const ProbeResult result = registry.probe(File("odd.jpg"), false);
    ASSERT_TRUE(std::holds_alternative<DecodedImage>(result));
    EXPECT_EQ(std::get<DecodedImage>(result).codec->get_format(), ImageFormat::Png);
}

TEST_F(CodecsTest, ProbeRejectsText) {
    testutil::WriteFile(File("notes.txt"), "These are the notes of chapter one.\n");
    const ProbeResult result = registry.probe(File("notes.txt"), false);
    ASSERT_TRUE(std::holds_alternative<NotAnImage>(result));
    EXPECT_FALSE(std::get<NotAnImage>(result).undecodable_image);
}

TEST_F(CodecsTest, ProbeRejectsEmptyFile) {
    testutil::WriteFile(File("empty.jpg"), "");
    const ProbeResult result = registry.probe(File("empty.jpg"), false);
    ASSERT_TRUE(std::holds_alternative<NotAnImage>(result));
    EXPECT_EQ(std::get<NotAnImage>(result).mime, "inode/x-empty");
    EXPECT_FALSE(std::get<NotAnImage>(result).undecodable_image);
}

TEST_F(CodecsTest, ProbeFlagsCorruptImageAsUndecodable) {
    testutil::WriteFile(File("broken.jpg"), std::string("\xFF\xD8\xFF\xE0\x00\x10JFIF\x00", 11) + "truncated");
    const ProbeResult result = registry.probe(File("broken.jpg"), false);
    ASSERT_TRUE(std::holds_alternative<NotAnImage>(result));
    EXPECT_TRUE(std::get<NotAnImage>(result).undecodable_image);
}

TEST_F(CodecsTest, ProbeOfMissingFileDoesNotThrow) {
    const ProbeResult result = registry.probe(File("missing.png"), false);
    ASSERT_TRUE(std::holds_alternative<NotAnImage>(result));
    EXPECT_FALSE(std::get<NotAnImage>(result).undecodable_image);
}

TEST_F(CodecsTest, SignatureSniffing) {
    testutil::WriteFile(File("x.bin"), testutil::MakeJpegBytes(8, 8, 75, File("s.jpg")));
    EXPECT_EQ(MimeDetector::detect_by_signature(File("x.bin")), "image/jpeg");
    EXPECT_TRUE(MimeDetector::is_image_mime("image/gif"));
    EXPECT_FALSE(MimeDetector::is_image_mime("text/plain"));
}

} // namespace cbzsan
