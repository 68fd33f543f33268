//
// Created by Giuseppe Francione on 06/12/25.
//

#ifndef IMGSCRUB_BYTE_SOURCE_HPP
#define IMGSCRUB_BYTE_SOURCE_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace imgscrub {

    /**
     * @brief Raw input bytes and where they came from.
     */
    struct ByteSource {
        std::vector<std::uint8_t> bytes;
        std::optional<std::filesystem::path> path; ///< set when read from a file
        std::string declared_mime;                 ///< set when parsed from a data URL
    };

    /**
     * @brief Resolves a user supplied input string to bytes.
     *
     * An existing regular file is read whole; otherwise the string is parsed
     * as a data URL.
     *
     * @throws IoError if the string is neither an existing file nor a data URL,
     * or reading the file fails.
     * @throws InvalidFormat if it looks like a data URL but is malformed.
     */
    ByteSource load_byte_source(const std::string& input);

} // namespace imgscrub

#endif // IMGSCRUB_BYTE_SOURCE_HPP
