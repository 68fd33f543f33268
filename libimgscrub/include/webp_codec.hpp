//
// Created by Giuseppe Francione on 19/10/25.
//

/**
 * @file webp_codec.hpp
 * @brief Defines the IImageCodec implementation for WebP files.
 */

#ifndef IMGSCRUB_WEBP_CODEC_HPP
#define IMGSCRUB_WEBP_CODEC_HPP

#include "codec.hpp"
#include <array>
#include <string_view>
#include <span>

namespace imgscrub {

    /**
     * @brief Implements IImageCodec for WebP using libwebp and libwebpmux.
     *
     * @details Decoding reads the EXIF, XMP and ICCP chunks of an extended
     * (VP8X) file through the WebPMux API. Encoding produces a simple
     * lossless file: RIFF header plus a single VP8L chunk.
     */
    class WebpCodec final : public IImageCodec {
    public:
        // --- self-description ---
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "WEBP";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 1> kMimes = { "image/webp" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 1> kExts = { ".webp" };
            return {kExts.data(), kExts.size()};
        }

        [[nodiscard]] OutputFormatKind get_output_kind() const noexcept override {
            return OutputFormatKind::Webp;
        }

        // --- operations ---

        /**
         * @brief Decodes a still WebP image (lossy or lossless).
         *
         * Images with an alpha channel decode to Rgba, all others to Rgb.
         * Animated files are rejected.
         *
         * @throws DecodeError if libwebp rejects the stream.
         */
        [[nodiscard]] ImageBuffer decode(std::span<const std::uint8_t> data) const override;

        /**
         * @brief Encodes an 8-bit RGB or grayscale raster to lossless WebP.
         * @throws EncodeError for any other color mode or on libwebp failure.
         */
        [[nodiscard]] std::vector<std::uint8_t> encode(const Raster& raster) const override;
    };

} // namespace imgscrub

#endif // IMGSCRUB_WEBP_CODEC_HPP
