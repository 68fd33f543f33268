//
// Created by Giuseppe Francione on 09/12/25.
//

/**
 * @file imgscrub.cpp
 * @brief Implementation of the public imgscrub API.
 */

#include "../../include/imgscrub.hpp"
#include "../../include/data_url.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/output_anonymizer.hpp"
#include <utility>

namespace imgscrub {

SanitizedOutput sanitize_bytes(const std::span<const std::uint8_t> data, const SanitizeOptions& options) {
    return Sanitizer().sanitize(data, options.format, options.max_dim);
}

std::string sanitize_data_url(const std::string_view data_url, const SanitizeOptions& options) {
    const DataUrlPayload payload = DataUrl::parse(data_url);
    const SanitizedOutput out = Sanitizer().sanitize(payload.bytes, options.format, options.max_dim, payload.mime);
    return DataUrl::format(out.bytes, out.mime);
}

std::filesystem::path sanitize_file_to_temp(const std::filesystem::path& input, const SanitizeOptions& options) {
    Logger::log(LogLevel::Debug, "Sanitizing " + input.filename().string() + " to temp", "imgscrub");

    const std::vector<std::uint8_t> data = read_file(input);
    const SanitizedOutput out = Sanitizer().sanitize(data, options.format, options.max_dim);

    std::error_code ec;
    const auto temp_dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        throw IoError("no usable temporary directory: " + ec.message());
    }
    return OutputAnonymizer::persist(out, temp_dir).path;
}

TemporarySanitizedImage::TemporarySanitizedImage(const std::filesystem::path& input, const SanitizeOptions& options)
    : path_(sanitize_file_to_temp(input, options)) {}

TemporarySanitizedImage::~TemporarySanitizedImage() {
    remove();
}

TemporarySanitizedImage::TemporarySanitizedImage(TemporarySanitizedImage&& other) noexcept
    : path_(std::exchange(other.path_, {})) {}

TemporarySanitizedImage& TemporarySanitizedImage::operator=(TemporarySanitizedImage&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::exchange(other.path_, {});
    }
    return *this;
}

void TemporarySanitizedImage::remove() {
    if (path_.empty()) return;
    remove_file_logged(path_, "temp_sanitized_image");
    path_.clear();
}

} // namespace imgscrub
