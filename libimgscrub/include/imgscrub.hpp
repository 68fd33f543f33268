//
// Created by Giuseppe Francione on 09/12/25.
//

/**
 * @file imgscrub.hpp
 * @brief Public API for the imgscrub library.
 */

#ifndef IMGSCRUB_HPP
#define IMGSCRUB_HPP

#include "dimension_bounder.hpp"
#include "output_format.hpp"
#include "sanitizer.hpp"
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace imgscrub {

/**
 * @brief Per-call configuration of a sanitize run.
 */
struct SanitizeOptions {
    /// Output container. Default: PNG.
    OutputFormat format = OutputFormat::png();
    /// Maximum length of the long edge, must be positive. Default: 2048.
    int max_dim = kDefaultMaxDimension;
};

/**
 * @brief Sanitize an encoded image held in memory.
 * @throws InvalidConfig, DecodeError, EncodeError
 */
SanitizedOutput sanitize_bytes(std::span<const std::uint8_t> data,
                               const SanitizeOptions& options = {});

/**
 * @brief Sanitize the image inside a data URL.
 * @return A data URL carrying the sanitized image and its new MIME type.
 * @throws InvalidFormat if @p data_url is malformed; otherwise as sanitize_bytes().
 */
std::string sanitize_data_url(std::string_view data_url,
                              const SanitizeOptions& options = {});

/**
 * @brief Sanitize an image file into the system temporary directory.
 *
 * The result is persisted by OutputAnonymizer (randomized name, reset
 * timestamps and permissions). The caller owns the returned file and is
 * responsible for deleting it; see TemporarySanitizedImage for a scoped
 * alternative.
 *
 * @throws IoError if @p input cannot be read or the output cannot be written;
 * otherwise as sanitize_bytes().
 */
std::filesystem::path sanitize_file_to_temp(const std::filesystem::path& input,
                                            const SanitizeOptions& options = {});

/**
 * @brief A sanitized copy of an image in the temporary directory, deleted
 * when this object goes out of scope.
 *
 * @details The destructor never throws. A file that is already gone is not
 * reported; any other removal failure is logged at Warning level.
 */
class TemporarySanitizedImage {
public:
    /**
     * @brief Sanitize @p input into the temporary directory.
     * @throws as sanitize_file_to_temp().
     */
    explicit TemporarySanitizedImage(const std::filesystem::path& input,
                                     const SanitizeOptions& options = {});
    ~TemporarySanitizedImage();

    TemporarySanitizedImage(const TemporarySanitizedImage&) = delete;
    TemporarySanitizedImage& operator=(const TemporarySanitizedImage&) = delete;
    TemporarySanitizedImage(TemporarySanitizedImage&& other) noexcept;
    TemporarySanitizedImage& operator=(TemporarySanitizedImage&& other) noexcept;

    /// @return Path of the sanitized file (empty after being moved from).
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    void remove();

    std::filesystem::path path_;
};

} // namespace imgscrub

#endif // IMGSCRUB_HPP
