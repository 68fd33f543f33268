//
// Created by Giuseppe Francione on 05/12/25.
//

/**
 * @file sanitizer.hpp
 * @brief The bytes-in, sanitized-bytes-out pipeline.
 */

#ifndef IMGSCRUB_SANITIZER_HPP
#define IMGSCRUB_SANITIZER_HPP

#include "codec_registry.hpp"
#include "dimension_bounder.hpp"
#include "output_format.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace imgscrub {

/**
 * @brief Result of a sanitize call: encoded bytes plus their MIME type.
 */
struct SanitizedOutput {
    std::vector<std::uint8_t> bytes;
    std::string mime;
};

/**
 * @brief Runs decode, normalize, bound, strip and encode over one image.
 *
 * @details Stateless apart from the registry reference; safe to share
 * between threads as long as the registry outlives it.
 */
class Sanitizer {
public:
    /**
     * @param registry Codec set to dispatch on. Must outlive the Sanitizer.
     */
    explicit Sanitizer(const CodecRegistry& registry = CodecRegistry::builtin());

    /**
     * @brief Sanitize one encoded image.
     *
     * @param data Encoded input bytes, any container the registry decodes.
     * @param format Output container.
     * @param max_dim Maximum length of the long edge, validated before decoding.
     * @param declared_mime MIME type claimed by the caller (e.g. from a data
     * URL), only used for error context. May be empty.
     * @return Sanitized bytes and the MIME type they were encoded as.
     * @throws InvalidConfig if @p max_dim <= 0.
     * @throws DecodeError if the input is empty, of an unsupported type or corrupt.
     * @throws EncodeError if no encoder exists for @p format, the encoder fails,
     * or the encoded output still carries an XMP packet.
     */
    [[nodiscard]] SanitizedOutput sanitize(std::span<const std::uint8_t> data,
                                           const OutputFormat& format = OutputFormat::png(),
                                           int max_dim = kDefaultMaxDimension,
                                           std::string_view declared_mime = {}) const;

    /**
     * @brief Detect the container of @p data and decode it, metadata included.
     *
     * No normalization or stripping is applied; used by the pipeline's first
     * stage and by the inspection report.
     *
     * @throws DecodeError if the input is empty, of an unsupported type or corrupt.
     */
    [[nodiscard]] ImageBuffer decode(std::span<const std::uint8_t> data,
                                     std::string_view declared_mime = {}) const;

private:
    const CodecRegistry& registry_;
};

/**
 * @brief Looks for XMP packet signatures anywhere in @p data.
 * @return true if "<x:xmpmeta" or "http://ns.adobe.com/xap/1.0/" occurs.
 */
[[nodiscard]] bool contains_xmp_signature(std::span<const std::uint8_t> data);

} // namespace imgscrub

#endif // IMGSCRUB_SANITIZER_HPP
