//
// Created by Giuseppe Francione on 03/12/25.
//

#ifndef IMGSCRUB_COLOR_NORMALIZER_HPP
#define IMGSCRUB_COLOR_NORMALIZER_HPP

#include "image_buffer.hpp"

namespace imgscrub {

    /**
     * @brief Collapses any decoded color mode to Rgb or Grayscale.
     *
     * Rgb and Grayscale pass through untouched. GrayAlpha and Rgba lose their
     * alpha channel (dropped, not composited), Palette images are expanded
     * and their palette discarded, Cmyk is converted with
     * `channel = 255 - min(255, C + K)`.
     *
     * @param buffer Buffer to convert, taken by value.
     * @return The same buffer with raster.mode in {Rgb, Grayscale}.
     */
    ImageBuffer normalize_color_mode(ImageBuffer buffer);

} // namespace imgscrub

#endif // IMGSCRUB_COLOR_NORMALIZER_HPP
