//
// Created by Giuseppe Francione on 03/12/25.
//

#include "../../include/color_normalizer.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace imgscrub {

ImageBuffer normalize_color_mode(ImageBuffer buffer) {
    Raster& raster = buffer.raster;
    const ColorMode from = raster.mode;
    if (from == ColorMode::Rgb || from == ColorMode::Grayscale) {
        return buffer;
    }

    const std::size_t pixel_count = static_cast<std::size_t>(raster.width) * raster.height;
    std::vector<std::uint8_t> rgb(pixel_count * 3);
    const std::uint8_t* src = raster.pixels.data();
    std::uint8_t* dst = rgb.data();

    switch (from) {
        case ColorMode::GrayAlpha:
            for (std::size_t i = 0; i < pixel_count; ++i, src += 2, dst += 3) {
                dst[0] = dst[1] = dst[2] = src[0];
            }
            break;
        case ColorMode::Rgba:
            for (std::size_t i = 0; i < pixel_count; ++i, src += 4, dst += 3) {
                dst[0] = src[0];
                dst[1] = src[1];
                dst[2] = src[2];
            }
            break;
        case ColorMode::Palette: {
            // decoders pad the palette to 256 entries, guard anyway
            const PaletteEntry fallback{};
            for (std::size_t i = 0; i < pixel_count; ++i, ++src, dst += 3) {
                const PaletteEntry& e = *src < raster.palette.size() ? raster.palette[*src] : fallback;
                dst[0] = e.r;
                dst[1] = e.g;
                dst[2] = e.b;
            }
            break;
        }
        case ColorMode::Cmyk:
            for (std::size_t i = 0; i < pixel_count; ++i, src += 4, dst += 3) {
                const int k = src[3];
                dst[0] = static_cast<std::uint8_t>(255 - std::min(255, src[0] + k));
                dst[1] = static_cast<std::uint8_t>(255 - std::min(255, src[1] + k));
                dst[2] = static_cast<std::uint8_t>(255 - std::min(255, src[2] + k));
            }
            break;
        case ColorMode::Rgb:
        case ColorMode::Grayscale:
            break;
    }

    raster.pixels = std::move(rgb);
    raster.mode = ColorMode::Rgb;
    raster.palette.clear();
    raster.palette.shrink_to_fit();

    Logger::log(LogLevel::Debug,
                "Converted " + std::string(color_mode_name(from)) + " to RGB (" +
                std::to_string(raster.width) + "x" + std::to_string(raster.height) + ")",
                "color_normalizer");
    return buffer;
}

} // namespace imgscrub
