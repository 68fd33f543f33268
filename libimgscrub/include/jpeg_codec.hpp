//
// Created by Giuseppe Francione on 19/10/25.
//

/**
 * @file jpeg_codec.hpp
 * @brief Defines the IImageCodec implementation for JPEG files.
 */

#ifndef IMGSCRUB_JPEG_CODEC_HPP
#define IMGSCRUB_JPEG_CODEC_HPP

#include "codec.hpp"
#include <array>
#include <string_view>
#include <span>

namespace imgscrub {

    /// Quality used for every JPEG imgscrub writes.
    inline constexpr int kJpegQuality = 90;

    /**
     * @brief Implements IImageCodec for JPEG using libjpeg.
     *
     * @details Unlike a lossless jpegtran-style pass, this codec performs a
     * full decode and re-encode: DCT coefficients of the source are never
     * carried over, and no APPn/COM marker is copied.
     */
    class JpegCodec final : public IImageCodec {
    public:
        // --- self-description ---
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "JPEG";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 2> kMimes = { "image/jpeg", "image/pjpeg" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 3> kExts = { ".jpg", ".jpeg", ".jpe" };
            return {kExts.data(), kExts.size()};
        }

        [[nodiscard]] OutputFormatKind get_output_kind() const noexcept override {
            return OutputFormatKind::Jpeg;
        }

        // --- operations ---

        /**
         * @brief Decodes a baseline or progressive JPEG held in memory.
         *
         * Saves APP0..APP15 and COM markers into ImageMetadata: EXIF (APP1),
         * XMP (APP1), ICC (APP2, multi-segment) and comments are classified,
         * every other marker is kept as an AncillaryChunk.
         *
         * @throws DecodeError if libjpeg rejects the stream.
         */
        [[nodiscard]] ImageBuffer decode(std::span<const std::uint8_t> data) const override;

        /**
         * @brief Encodes an 8-bit RGB or grayscale raster at kJpegQuality.
         *
         * Huffman tables are optimized. Only the JFIF APP0 header is written.
         *
         * @throws EncodeError for any other color mode or on libjpeg failure.
         */
        [[nodiscard]] std::vector<std::uint8_t> encode(const Raster& raster) const override;
    };

} // namespace imgscrub

#endif // IMGSCRUB_JPEG_CODEC_HPP
