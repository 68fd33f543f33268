//
// Created by Giuseppe Francione on 11/10/25.
//

#ifndef IMGSCRUB_MIME_DETECTOR_HPP
#define IMGSCRUB_MIME_DETECTOR_HPP

#include <cstdint>
#include <span>
#include <string>

namespace imgscrub {

    /**
     * @brief Detects the container type of in-memory image data.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a byte buffer.
         *
         * @param data The bytes to inspect (only a prefix is examined).
         * @return A MIME type string (e.g. "image/jpeg"), or
         * "application/octet-stream" when nothing matches.
         *
         * @note Uses libmagic. If the magic database cannot be loaded,
         * falls back to sniff_signature().
         */
        static std::string detect(std::span<const std::uint8_t> data);

        /**
         * @brief Recognizes the PNG, JPEG and WebP magic numbers without libmagic.
         * @return "image/png", "image/jpeg", "image/webp" or "application/octet-stream".
         */
        static std::string sniff_signature(std::span<const std::uint8_t> data);
    };

} // namespace imgscrub
#endif //IMGSCRUB_MIME_DETECTOR_HPP
