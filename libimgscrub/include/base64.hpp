//
// Created by Giuseppe Francione on 04/12/25.
//

#ifndef IMGSCRUB_BASE64_HPP
#define IMGSCRUB_BASE64_HPP

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace imgscrub {

    /**
     * @brief Standard-alphabet base64 (RFC 4648, with padding).
     */
    class Base64 {
    public:
        /**
         * @brief Encode binary data.
         * @return Padded base64 text, empty for empty input.
         */
        static std::string encode(std::span<const std::uint8_t> data);

        /**
         * @brief Strictly decode base64 text.
         *
         * The length must be a multiple of 4, only the standard alphabet is
         * accepted, and '=' may only appear as one or two trailing
         * characters. No whitespace is skipped.
         *
         * @throws InvalidFormat on any violation.
         */
        static std::vector<std::uint8_t> decode(std::string_view text);
    };

} // namespace imgscrub

#endif // IMGSCRUB_BASE64_HPP
