//
// Created by Giuseppe Francione on 03/12/25.
//

#include "../../include/dimension_bounder.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace {

    struct Tap {
        std::uint32_t index;
        float weight;
    };

    /**
     * @brief Box-filter taps along one axis.
     *
     * Destination sample @c o covers the source interval
     * [o * scale, (o + 1) * scale); each source sample overlapping it gets a
     * weight equal to its share of that interval. Weights of one destination
     * sample sum to 1.
     */
    std::vector<std::vector<Tap>> box_taps(const std::uint32_t src_len, const std::uint32_t dst_len) {
        const double scale = static_cast<double>(src_len) / dst_len;
        std::vector<std::vector<Tap>> taps(dst_len);

        for (std::uint32_t o = 0; o < dst_len; ++o) {
            const double start = o * scale;
            const double end = std::min(static_cast<double>(src_len), (o + 1) * scale);
            const double span = end - start;

            auto& row = taps[o];
            for (auto i = static_cast<std::uint32_t>(std::floor(start)); i < src_len && i < end; ++i) {
                const double cover = std::min(end, i + 1.0) - std::max(start, static_cast<double>(i));
                if (cover > 0.0) {
                    row.push_back({i, static_cast<float>(cover / span)});
                }
            }
        }
        return taps;
    }

    std::vector<std::uint8_t> resample_area(const imgscrub::Raster& src,
                                            const std::uint32_t dst_w,
                                            const std::uint32_t dst_h) {
        const unsigned ch = imgscrub::channels_of(src.mode);
        const auto x_taps = box_taps(src.width, dst_w);
        const auto y_taps = box_taps(src.height, dst_h);

        const std::size_t src_stride = src.row_bytes();
        const std::size_t dst_stride = static_cast<std::size_t>(dst_w) * ch;

        std::vector<std::uint8_t> out(dst_stride * dst_h);
        std::vector<float> horizontal(dst_stride);
        std::vector<float> acc(dst_stride);

        // one destination row at a time: horizontally reduce every source
        // row under it, then blend those by vertical coverage
        for (std::uint32_t oy = 0; oy < dst_h; ++oy) {
            std::ranges::fill(acc, 0.0f);

            for (const auto& [sy, wy] : y_taps[oy]) {
                const std::uint8_t* src_row = src.pixels.data() + sy * src_stride;

                for (std::uint32_t ox = 0; ox < dst_w; ++ox) {
                    float* h = horizontal.data() + static_cast<std::size_t>(ox) * ch;
                    std::fill_n(h, ch, 0.0f);
                    for (const auto& [sx, wx] : x_taps[ox]) {
                        const std::uint8_t* px = src_row + static_cast<std::size_t>(sx) * ch;
                        for (unsigned c = 0; c < ch; ++c) {
                            h[c] += wx * px[c];
                        }
                    }
                }

                for (std::size_t i = 0; i < dst_stride; ++i) {
                    acc[i] += wy * horizontal[i];
                }
            }

            std::uint8_t* dst_row = out.data() + oy * dst_stride;
            for (std::size_t i = 0; i < dst_stride; ++i) {
                dst_row[i] = static_cast<std::uint8_t>(std::clamp(std::lround(acc[i]), 0L, 255L));
            }
        }
        return out;
    }

} // namespace

namespace imgscrub {

std::pair<std::uint32_t, std::uint32_t> bounded_size(const std::uint32_t width,
                                                     const std::uint32_t height,
                                                     const int max_dim) {
    if (max_dim <= 0) {
        throw InvalidConfig("max dimension must be positive, got " + std::to_string(max_dim));
    }

    const std::uint32_t longest = std::max(width, height);
    const auto bound = static_cast<std::uint32_t>(max_dim);
    if (longest <= bound) {
        return {width, height};
    }

    const double factor = static_cast<double>(bound) / longest;
    auto scale = [&](const std::uint32_t edge) -> std::uint32_t {
        if (edge == longest) return bound;
        const auto scaled = static_cast<std::uint32_t>(std::lround(edge * factor));
        return std::max<std::uint32_t>(1, scaled);
    };
    return {scale(width), scale(height)};
}

ImageBuffer bound_dimensions(ImageBuffer buffer, const int max_dim) {
    Raster& raster = buffer.raster;
    const auto [new_w, new_h] = bounded_size(raster.width, raster.height, max_dim);

    if (new_w == raster.width && new_h == raster.height) {
        Logger::log(LogLevel::Debug,
                    "Within bound " + std::to_string(max_dim) + ": " +
                    std::to_string(raster.width) + "x" + std::to_string(raster.height),
                    "dimension_bounder");
        return buffer;
    }

    if (raster.mode == ColorMode::Palette) {
        throw InvalidConfig("cannot resample a palette image, normalize its color mode first");
    }
    if (raster.pixels.size() != raster.expected_size()) {
        throw InvalidConfig("raster size does not match its dimensions");
    }

    Logger::log(LogLevel::Info,
                "Downscaling " + std::to_string(raster.width) + "x" + std::to_string(raster.height) +
                " -> " + std::to_string(new_w) + "x" + std::to_string(new_h),
                "dimension_bounder");

    raster.pixels = resample_area(raster, new_w, new_h);
    raster.width = new_w;
    raster.height = new_h;
    return buffer;
}

} // namespace imgscrub
