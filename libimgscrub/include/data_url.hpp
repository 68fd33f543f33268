//
// Created by Giuseppe Francione on 04/12/25.
//

/**
 * @file data_url.hpp
 * @brief The data:<mime>;base64,<payload> wire format.
 */

#ifndef IMGSCRUB_DATA_URL_HPP
#define IMGSCRUB_DATA_URL_HPP

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace imgscrub {

/**
 * @brief Decoded content of a data URL.
 */
struct DataUrlPayload {
    std::string mime;                ///< media type exactly as written, may be empty
    std::vector<std::uint8_t> bytes;

    bool operator==(const DataUrlPayload&) const = default;
};

/**
 * @brief Parser and formatter for base64 data URLs.
 *
 * Only the base64 form is understood. Media type parameters other than the
 * final ";base64" marker are not supported.
 */
class DataUrl {
public:
    /**
     * @brief Parse a data URL.
     *
     * Leading and trailing whitespace is ignored. The scheme is matched
     * case-sensitively; the media type is everything between "data:" and the
     * first ';' and is returned verbatim.
     *
     * @param text The URL.
     * @return The media type and the decoded payload.
     * @throws InvalidFormat if the text is not data:<mime>;base64,<payload>
     * or the payload is not strictly valid base64.
     */
    static DataUrlPayload parse(std::string_view text);

    /**
     * @brief Build a data URL from raw bytes. Never fails.
     */
    static std::string format(std::span<const std::uint8_t> bytes, std::string_view mime);

    /// @return true if @p text, once trimmed, starts with "data:".
    static bool looks_like_data_url(std::string_view text) noexcept;
};

} // namespace imgscrub

#endif // IMGSCRUB_DATA_URL_HPP
