//
// Created by Giuseppe Francione on 02/12/25.
//

/**
 * @file image_buffer.hpp
 * @brief In-memory image representation passed between pipeline stages.
 */

#ifndef IMGSCRUB_IMAGE_BUFFER_HPP
#define IMGSCRUB_IMAGE_BUFFER_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace imgscrub {

/**
 * @brief Pixel layout of a Raster.
 *
 * All modes use 8-bit samples, interleaved, rows packed without padding.
 */
enum class ColorMode {
    Grayscale, ///< 1 sample per pixel
    GrayAlpha, ///< 2 samples per pixel
    Rgb,       ///< 3 samples per pixel
    Rgba,      ///< 4 samples per pixel
    Palette,   ///< 1 index per pixel into Raster::palette
    Cmyk       ///< 4 samples per pixel, not inverted
};

/// @return Number of 8-bit samples stored per pixel for @p mode.
constexpr unsigned channels_of(const ColorMode mode) noexcept {
    switch (mode) {
        case ColorMode::Grayscale: return 1;
        case ColorMode::GrayAlpha: return 2;
        case ColorMode::Rgb:       return 3;
        case ColorMode::Rgba:      return 4;
        case ColorMode::Palette:   return 1;
        case ColorMode::Cmyk:      return 4;
    }
    return 0;
}

/// @return Short name of @p mode ("L", "LA", "RGB", "RGBA", "P", "CMYK").
std::string_view color_mode_name(ColorMode mode) noexcept;

/**
 * @brief One palette entry, alpha included (255 when the source had no tRNS).
 */
struct PaletteEntry {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;
};

/**
 * @brief Pure pixel data.
 *
 * Carries no metadata by construction: encoders only ever receive a Raster,
 * so there is no argument through which a profile or a text chunk could
 * reach the output file.
 */
struct Raster {
    ColorMode mode = ColorMode::Rgb;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::vector<std::uint8_t> pixels;       ///< width * height * channels_of(mode) bytes
    std::vector<PaletteEntry> palette;      ///< only used by ColorMode::Palette

    [[nodiscard]] std::size_t row_bytes() const noexcept {
        return static_cast<std::size_t>(width) * channels_of(mode);
    }

    [[nodiscard]] std::size_t expected_size() const noexcept {
        return row_bytes() * height;
    }
};

/**
 * @brief An ancillary block the decoder found but did not classify further.
 *
 * For PNG the name is the chunk type ("gAMA", "tIME", "prVt"), for JPEG the
 * marker ("APP0", "APP13").
 */
struct AncillaryChunk {
    std::string name;
    std::vector<std::uint8_t> data;
};

/**
 * @brief Side-channel information attached to a decoded image.
 *
 * Everything that is not pixel data lives here. The stripper clears it as
 * a whole, there is no per-field allow list.
 */
struct ImageMetadata {
    std::vector<std::uint8_t> icc_profile;
    std::vector<std::uint8_t> exif;          ///< raw TIFF structure, without the "Exif\0\0" prefix
    std::string xmp;                         ///< XMP packet as found in the container
    std::map<std::string, std::string> text; ///< tEXt/zTXt/iTXt keywords, JPEG COM as "comment"
    std::vector<AncillaryChunk> chunks;

    [[nodiscard]] bool empty() const noexcept {
        return icc_profile.empty() && exif.empty() && xmp.empty() &&
               text.empty() && chunks.empty();
    }

    /// @return Number of distinct metadata entries currently held.
    [[nodiscard]] std::size_t entry_count() const noexcept {
        return (icc_profile.empty() ? 0 : 1) + (exif.empty() ? 0 : 1) +
               (xmp.empty() ? 0 : 1) + text.size() + chunks.size();
    }

    void clear() noexcept {
        icc_profile.clear();
        icc_profile.shrink_to_fit();
        exif.clear();
        exif.shrink_to_fit();
        xmp.clear();
        xmp.shrink_to_fit();
        text.clear();
        chunks.clear();
        chunks.shrink_to_fit();
    }
};

/**
 * @brief A decoded image as it travels through the pipeline.
 *
 * Owned by exactly one stage at a time; stages take it by value and hand
 * it on with std::move. Copying is allowed but never done by the pipeline.
 */
struct ImageBuffer {
    Raster raster;
    ImageMetadata metadata;
    std::string source_mime; ///< container detected at decode time (e.g. "image/jpeg")
};

} // namespace imgscrub

#endif // IMGSCRUB_IMAGE_BUFFER_HPP
