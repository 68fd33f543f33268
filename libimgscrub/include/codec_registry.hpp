//
// Created by Giuseppe Francione on 19/10/25.
//

/**
 * @file codec_registry.hpp
 * @brief Defines the registry that maps MIME types and output formats to codecs.
 */

#ifndef IMGSCRUB_CODEC_REGISTRY_HPP
#define IMGSCRUB_CODEC_REGISTRY_HPP

#include "codec.hpp"
#include <memory>
#include <string>
#include <vector>

namespace imgscrub {

/**
 * @brief Registry of the image codecs available to the pipeline.
 *
 * @details Owns every IImageCodec instance. The Sanitizer asks it for a
 * decoder by detected MIME type and for an encoder by requested output
 * format, so the pipeline itself never names libpng, libjpeg or libwebp.
 */
class CodecRegistry {
public:
    /**
     * @brief Construct and register the built-in codecs (PngCodec, JpegCodec, WebpCodec).
     */
    CodecRegistry();

    /**
     * @brief Register an additional codec.
     *
     * Codecs registered later take precedence over earlier ones for the
     * same MIME type or output format.
     */
    void add(std::unique_ptr<IImageCodec> codec);

    /**
     * @brief Find the codec that decodes a given MIME type.
     * @param mime MIME type string (e.g. "image/png").
     * @return Non-owning pointer, or nullptr if no codec handles it.
     */
    [[nodiscard]] const IImageCodec* find_by_mime(const std::string& mime) const;

    /**
     * @brief Find the codec for a file extension (with the dot, case-insensitive).
     * @return Non-owning pointer, or nullptr if no codec handles it.
     */
    [[nodiscard]] const IImageCodec* find_by_extension(const std::string& ext) const;

    /**
     * @brief Find the codec that encodes to @p kind.
     * @return Non-owning pointer, or nullptr for OutputFormatKind::Other.
     */
    [[nodiscard]] const IImageCodec* find_encoder(OutputFormatKind kind) const;

    /// @return All registered codecs, in registration order.
    [[nodiscard]] const std::vector<std::unique_ptr<IImageCodec>>& all() const { return codecs_; }

    /// @return A registry with the built-in codecs, shared by the free functions in imgscrub.hpp.
    static const CodecRegistry& builtin();

private:
    std::vector<std::unique_ptr<IImageCodec>> codecs_;
};

} // namespace imgscrub

#endif // IMGSCRUB_CODEC_REGISTRY_HPP
