//
// Created by Giuseppe Francione on 02/12/25.
//

#include "../../include/image_buffer.hpp"

std::string_view imgscrub::color_mode_name(const ColorMode mode) noexcept {
    switch (mode) {
        case ColorMode::Grayscale: return "L";
        case ColorMode::GrayAlpha: return "LA";
        case ColorMode::Rgb:       return "RGB";
        case ColorMode::Rgba:      return "RGBA";
        case ColorMode::Palette:   return "P";
        case ColorMode::Cmyk:      return "CMYK";
    }
    return "?";
}
