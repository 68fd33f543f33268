//
// Created by Giuseppe Francione on 19/10/25.
//

#ifndef IMGSCRUB_CODEC_HPP
#define IMGSCRUB_CODEC_HPP

#include "image_buffer.hpp"
#include "output_format.hpp"
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

/**
 * @namespace imgscrub
 * @brief The main namespace for the imgscrub library.
 *
 * @details Holds the image codec adapters (IImageCodec and its libpng /
 * libjpeg implementations), the pipeline stages (normalizer, bounder,
 * stripper), the Sanitizer orchestrator, the output anonymizer and the
 * data-URL codec.
 */
namespace imgscrub {

/**
 * @brief Capability interface over an external imaging library.
 *
 * Each implementation targets one container format and describes itself
 * (MIME types, extensions) so the CodecRegistry can dispatch on the
 * detected input type and on the requested output format.
 *
 * Implementations are stateless: every call sets up and tears down its own
 * library context, so a single instance can serve concurrent callers.
 */
class IImageCodec {
public:
    virtual ~IImageCodec() = default;

    // --- self-description ---

    /// @return Human-readable name of the codec (e.g. "PNG").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return List of MIME types this codec can decode (e.g. "image/png").
    [[nodiscard]] virtual std::span<const std::string_view>
    get_supported_mime_types() const noexcept = 0;

    /// @return List of file extensions for this container (e.g. ".png").
    [[nodiscard]] virtual std::span<const std::string_view>
    get_supported_extensions() const noexcept = 0;

    /// @return The output format kind this codec encodes to.
    [[nodiscard]] virtual OutputFormatKind get_output_kind() const noexcept = 0;

    // --- operations ---

    /**
     * @brief Decode a complete image file held in memory.
     *
     * The returned buffer owns all of its storage; nothing references
     * @p data or library-internal memory afterwards.
     *
     * @param data Encoded bytes.
     * @return Decoded raster plus every metadata block the container carried.
     * @throws DecodeError if the bytes are not a valid image of this type.
     */
    [[nodiscard]] virtual ImageBuffer decode(std::span<const std::uint8_t> data) const = 0;

    /**
     * @brief Encode a raster.
     *
     * Only Rgb and Grayscale rasters are accepted. The output carries no
     * ancillary data beyond what the container mandates.
     *
     * @param raster Pixel data to encode.
     * @return Encoded bytes.
     * @throws EncodeError on unsupported color mode or library failure.
     */
    [[nodiscard]] virtual std::vector<std::uint8_t> encode(const Raster& raster) const = 0;
};

} // namespace imgscrub

#endif // IMGSCRUB_CODEC_HPP
