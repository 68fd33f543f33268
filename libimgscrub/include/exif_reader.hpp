//
// Created by Giuseppe Francione on 08/12/25.
//

/**
 * @file exif_reader.hpp
 * @brief Read-only walker over the TIFF structure of an EXIF block.
 */

#ifndef IMGSCRUB_EXIF_READER_HPP
#define IMGSCRUB_EXIF_READER_HPP

#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <string_view>

namespace imgscrub {

    /**
     * @brief Decodes EXIF tags to printable strings for diagnostics.
     *
     * Understands both byte orders ("II" and "MM"). IFD0 is walked, then the
     * Exif sub-IFD it points to; the GPS IFD is only counted. Nothing here
     * is used by the sanitization pipeline, which never interprets EXIF.
     */
    class ExifReader {
    public:
        /**
         * @brief Parse a raw EXIF block (TIFF header first, no "Exif\0\0" prefix).
         *
         * Unknown tags are named "Unknown_<decimal id>". BYTE and UNDEFINED
         * values are shown as "<bytes:N>", ASCII values as text, numeric
         * values as numbers (tuples in parentheses). GPSInfo is shown as
         * "<ifd:N entries>".
         *
         * A malformed or truncated block yields whatever was parsed before
         * the damage; it never throws.
         *
         * @return Tag name to printable value.
         */
        static std::map<std::string, std::string> read(std::span<const std::uint8_t> tiff);

        /// @return Name of EXIF/TIFF tag @p tag, or "Unknown_<id>".
        static std::string tag_name(std::uint16_t tag);
    };

} // namespace imgscrub

#endif // IMGSCRUB_EXIF_READER_HPP
