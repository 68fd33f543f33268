//
// Created by Giuseppe Francione on 19/10/25.
//

/**
 * @file png_codec.hpp
 * @brief Defines the IImageCodec implementation for PNG files.
 */

#ifndef IMGSCRUB_PNG_CODEC_HPP
#define IMGSCRUB_PNG_CODEC_HPP

#include "codec.hpp"
#include <array>
#include <string_view>
#include <span>

namespace imgscrub {

    /**
     * @brief Implements IImageCodec for PNG using libpng.
     *
     * @details Decoding records every ancillary chunk in ImageMetadata.
     * Encoding writes IHDR, IDAT and IEND only, at maximum zlib compression
     * with adaptive filtering.
     */
    class PngCodec final : public IImageCodec {
    public:
        // --- self-description ---
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "PNG";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 2> kMimes = { "image/png", "image/apng" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 1> kExts = { ".png" };
            return {kExts.data(), kExts.size()};
        }

        [[nodiscard]] OutputFormatKind get_output_kind() const noexcept override {
            return OutputFormatKind::Png;
        }

        // --- operations ---

        /**
         * @brief Decodes a PNG held in memory.
         *
         * 16-bit samples are reduced to 8 bits and sub-byte samples unpacked.
         * Palette images stay indexed (palette alpha taken from tRNS), tRNS on
         * gray/RGB images becomes an alpha channel.
         *
         * @throws DecodeError if libpng rejects the stream.
         */
        [[nodiscard]] ImageBuffer decode(std::span<const std::uint8_t> data) const override;

        /**
         * @brief Encodes an 8-bit RGB or grayscale raster to PNG.
         * @throws EncodeError for any other color mode or on libpng failure.
         */
        [[nodiscard]] std::vector<std::uint8_t> encode(const Raster& raster) const override;
    };

} // namespace imgscrub

#endif // IMGSCRUB_PNG_CODEC_HPP
