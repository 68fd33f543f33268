//
// Created by Giuseppe Francione on 12/12/25.
//

#include <gtest/gtest.h>
#include "test_images.hpp"
#include "../libimgscrub/include/errors.hpp"
#include "../libimgscrub/include/imgscrub.hpp"
#include "../libimgscrub/include/png_codec.hpp"
#include "../libimgscrub/include/sanitizer.hpp"
#include "../libimgscrub/include/webp_codec.hpp"

using namespace imgscrub;
using namespace test_images;

namespace {

    const std::vector<std::string> kCriticalOnly = {"IHDR", "IDAT", "IEND"};

    bool only_critical_chunks(const std::vector<std::uint8_t>& png) {
        const auto types = png_chunk_types(png);
        if (types.empty() || types.front() != "IHDR" || types.back() != "IEND") return false;
        for (const auto& t : types) {
            if (t != "IHDR" && t != "IDAT" && t != "IEND") return false;
        }
        return true;
    }

} // namespace

TEST(Sanitizer, DownscalesLargeJpegAndDropsItsMetadata) {
    JpegFixture fx;
    fx.width = 4000;
    fx.height = 3000;
    fx.exif = make_exif();
    fx.icc = make_icc(3000);
    fx.solid = {40, 80, 120};
    const auto input = make_jpeg(fx);

    const SanitizedOutput out = Sanitizer().sanitize(input);
    EXPECT_EQ(out.mime, "image/png");
    EXPECT_TRUE(only_critical_chunks(out.bytes));

    const ImageBuffer decoded = PngCodec().decode(out.bytes);
    EXPECT_EQ(decoded.raster.width, 2048u);
    EXPECT_EQ(decoded.raster.height, 1536u);
    EXPECT_EQ(decoded.raster.mode, ColorMode::Rgb);
    EXPECT_TRUE(decoded.metadata.empty());
    EXPECT_FALSE(contains(out.bytes, "Canon"));
}

TEST(Sanitizer, RewritesSmallPngLosslessly) {
    PngFixture fx;
    fx.width = 100;
    fx.height = 100;
    fx.text = {{"Author", "Jane Doe"}, {"Comment", "shot at home"}};
    fx.xmp = make_xmp();
    fx.exif = make_exif();
    fx.time = true;
    fx.gamma = true;
    fx.private_chunk = true;
    const auto input = make_png(fx);

    const SanitizedOutput out = Sanitizer().sanitize(input);
    EXPECT_NE(out.bytes, input);
    EXPECT_TRUE(only_critical_chunks(out.bytes));
    EXPECT_FALSE(contains(out.bytes, "Jane Doe"));

    const ImageBuffer before = PngCodec().decode(input);
    const ImageBuffer after = PngCodec().decode(out.bytes);
    EXPECT_EQ(after.raster.width, 100u);
    EXPECT_EQ(after.raster.height, 100u);
    EXPECT_EQ(after.raster.pixels, before.raster.pixels);
}

TEST(Sanitizer, IsIdempotentOnItsOwnPngOutput) {
    PngFixture fx;
    fx.width = 40;
    fx.height = 30;
    fx.text = {{"Software", "editor"}};
    const SanitizedOutput first = Sanitizer().sanitize(make_png(fx));
    const SanitizedOutput second = Sanitizer().sanitize(first.bytes);

    EXPECT_EQ(PngCodec().decode(first.bytes).raster.pixels,
              PngCodec().decode(second.bytes).raster.pixels);
    EXPECT_TRUE(only_critical_chunks(second.bytes));
}

TEST(Sanitizer, JpegOutputCarriesNoExifOrIcc) {
    PngFixture fx;
    fx.width = 32;
    fx.height = 32;
    fx.exif = make_exif();
    fx.xmp = make_xmp();
    const SanitizedOutput out = Sanitizer().sanitize(make_png(fx), OutputFormat::jpeg());

    EXPECT_EQ(out.mime, "image/jpeg");
    const auto markers = jpeg_markers(out.bytes);
    for (const int m : markers) {
        EXPECT_NE(m, 0xE1);
        EXPECT_NE(m, 0xE2);
        EXPECT_NE(m, 0xED);
        EXPECT_NE(m, 0xFE);
    }
    EXPECT_FALSE(contains_xmp_signature(out.bytes));
}

TEST(Sanitizer, NormalizesPaletteAndAlphaInputs) {
    PngFixture pal;
    pal.width = 4;
    pal.height = 1;
    pal.color_type = PNG_COLOR_TYPE_PALETTE;
    pal.palette = {{255, 0, 0}, {0, 255, 0}};
    pal.trns = {0, 255};
    pal.pixels = {0, 1, 1, 0};
    const ImageBuffer from_palette = PngCodec().decode(Sanitizer().sanitize(make_png(pal)).bytes);
    EXPECT_EQ(from_palette.raster.mode, ColorMode::Rgb);
    EXPECT_EQ(from_palette.raster.pixels,
              (std::vector<std::uint8_t>{255, 0, 0, 0, 255, 0, 0, 255, 0, 255, 0, 0}));

    PngFixture rgba;
    rgba.color_type = PNG_COLOR_TYPE_RGB_ALPHA;
    const ImageBuffer from_rgba = PngCodec().decode(Sanitizer().sanitize(make_png(rgba)).bytes);
    EXPECT_EQ(from_rgba.raster.mode, ColorMode::Rgb);

    PngFixture gray;
    gray.color_type = PNG_COLOR_TYPE_GRAY;
    const ImageBuffer from_gray = PngCodec().decode(Sanitizer().sanitize(make_png(gray)).bytes);
    EXPECT_EQ(from_gray.raster.mode, ColorMode::Grayscale);
}

TEST(Sanitizer, ConvertsCmykJpeg) {
    JpegFixture fx;
    fx.color_space = JCS_CMYK;
    fx.solid = {255, 255, 255, 255};
    const ImageBuffer out = PngCodec().decode(Sanitizer().sanitize(make_jpeg(fx)).bytes);
    EXPECT_EQ(out.raster.mode, ColorMode::Rgb);
    EXPECT_EQ(out.raster.width, 16u);
}

TEST(Sanitizer, DropsWebpMetadataChunks) {
    WebpFixture fx;
    fx.width = 40;
    fx.height = 30;
    fx.alpha = true;
    fx.exif = make_exif();
    fx.icc = make_icc(600);
    fx.xmp = make_xmp();

    const SanitizedOutput out = Sanitizer().sanitize(make_webp(fx));
    EXPECT_EQ(out.mime, "image/png");
    EXPECT_TRUE(only_critical_chunks(out.bytes));
    EXPECT_FALSE(contains(out.bytes, "Canon"));

    const ImageBuffer decoded = PngCodec().decode(out.bytes);
    EXPECT_EQ(decoded.raster.mode, ColorMode::Rgb);
    EXPECT_EQ(decoded.raster.width, 40u);
    EXPECT_EQ(decoded.raster.height, 30u);
}

TEST(Sanitizer, EncodesWebpOutputWithoutMetadataChunks) {
    JpegFixture fx;
    fx.exif = make_exif();
    fx.icc = make_icc(3000);
    fx.xmp = make_xmp();

    const SanitizedOutput out = Sanitizer().sanitize(make_jpeg(fx), OutputFormat::webp());
    EXPECT_EQ(out.mime, "image/webp");
    EXPECT_EQ(riff_chunk_types(out.bytes), (std::vector<std::string>{"VP8L"}));
    EXPECT_FALSE(contains(out.bytes, "Canon"));

    const ImageBuffer decoded = WebpCodec().decode(out.bytes);
    EXPECT_EQ(decoded.raster.width, 16u);
    EXPECT_TRUE(decoded.metadata.empty());
}

TEST(Sanitizer, ChecksMaxDimensionBeforeDecoding) {
    const std::vector<std::uint8_t> garbage = {'n', 'o', 'p', 'e'};
    EXPECT_THROW((void)Sanitizer().sanitize(garbage, OutputFormat::png(), 0), InvalidConfig);
    EXPECT_THROW((void)Sanitizer().sanitize(garbage, OutputFormat::png(), -1), InvalidConfig);
}

TEST(Sanitizer, RejectsFormatsWithoutEncoder) {
    const auto png = make_png(PngFixture{});
    EXPECT_THROW((void)Sanitizer().sanitize(png, parse_output_format("GIF")), EncodeError);
}

TEST(Sanitizer, RejectsUndecodableInput) {
    EXPECT_THROW((void)Sanitizer().sanitize(std::vector<std::uint8_t>{}), DecodeError);

    const std::string text = "this is plain text, not an image";
    const std::vector<std::uint8_t> bytes(text.begin(), text.end());
    EXPECT_THROW((void)Sanitizer().sanitize(bytes), DecodeError);

    auto png = make_png(PngFixture{});
    png.resize(png.size() / 2);
    EXPECT_THROW((void)Sanitizer().sanitize(png), DecodeError);
}

TEST(Sanitizer, ErrorsAreCatchableAsBaseType) {
    try {
        (void)Sanitizer().sanitize(std::vector<std::uint8_t>{});
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_NE(std::string(e.what()).find("empty"), std::string::npos);
    }
}

TEST(Sanitizer, DetectsXmpSignatures) {
    const std::string packet = "xx<x:xmpmeta xmlns:x='adobe:ns:meta/'>";
    EXPECT_TRUE(contains_xmp_signature(std::vector<std::uint8_t>(packet.begin(), packet.end())));

    const std::string ns = "http://ns.adobe.com/xap/1.0/";
    EXPECT_TRUE(contains_xmp_signature(std::vector<std::uint8_t>(ns.begin(), ns.end())));

    const std::string clean = "<x:xmp";
    EXPECT_FALSE(contains_xmp_signature(std::vector<std::uint8_t>(clean.begin(), clean.end())));
}

TEST(SanitizeBytes, AppliesOptions) {
    PngFixture fx;
    fx.width = 300;
    fx.height = 150;
    SanitizeOptions options;
    options.max_dim = 100;
    options.format = OutputFormat::jpeg();

    const SanitizedOutput out = sanitize_bytes(make_png(fx), options);
    EXPECT_EQ(out.mime, "image/jpeg");
    EXPECT_EQ(jpeg_markers(out.bytes).front(), 0xE0);
}
