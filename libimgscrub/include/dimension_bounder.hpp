//
// Created by Giuseppe Francione on 03/12/25.
//

#ifndef IMGSCRUB_DIMENSION_BOUNDER_HPP
#define IMGSCRUB_DIMENSION_BOUNDER_HPP

#include "image_buffer.hpp"
#include <cstdint>
#include <utility>

namespace imgscrub {

    /// Default bound on the long edge of sanitized images.
    inline constexpr int kDefaultMaxDimension = 2048;

    /**
     * @brief Computes the size an image of @p width x @p height is scaled to.
     *
     * The long edge becomes @p max_dim, the short edge is scaled by the same
     * factor and rounded to the nearest integer, never below 1. Sizes already
     * within the bound are returned unchanged.
     *
     * @throws InvalidConfig if @p max_dim <= 0.
     */
    std::pair<std::uint32_t, std::uint32_t> bounded_size(std::uint32_t width,
                                                         std::uint32_t height,
                                                         int max_dim);

    /**
     * @brief Downscales a buffer so that max(width, height) <= @p max_dim.
     *
     * Uses an exact area-averaging (box) filter: every destination pixel is
     * the coverage-weighted mean of the source pixels under it. No-op when
     * the image already fits.
     *
     * @param buffer Buffer to bound, taken by value. Must be Rgb or Grayscale.
     * @param max_dim Maximum allowed length of the long edge.
     * @throws InvalidConfig if @p max_dim <= 0.
     */
    ImageBuffer bound_dimensions(ImageBuffer buffer, int max_dim);

} // namespace imgscrub

#endif // IMGSCRUB_DIMENSION_BOUNDER_HPP
