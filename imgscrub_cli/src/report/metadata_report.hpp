//
// Created by Giuseppe Francione on 10/12/25.
//

#ifndef IMGSCRUB_METADATA_REPORT_HPP
#define IMGSCRUB_METADATA_REPORT_HPP

#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <ostream>
#include <span>
#include <string>

/**
 * @brief Hex encoded SHA-256 of @p data (OpenSSL EVP).
 * @throws std::runtime_error if the digest cannot be computed.
 */
std::string sha256_hex(std::span<const std::uint8_t> data);

/**
 * @brief Describes what an encoded image carries besides its pixels.
 *
 * Keys: format, mode, size, sha256, icc_profile_present, icc_profile_bytes,
 * icc_profile_sha256, info_keys, info_detail, exif_present, exif_count,
 * exif (with @p exif_full) or exif_subset, xmp_present.
 *
 * @throws imgscrub::DecodeError if the bytes cannot be decoded.
 */
nlohmann::json build_metadata_report(std::span<const std::uint8_t> bytes, bool exif_full);

/**
 * @brief Filesystem facts about @p path: basename, dir, size_bytes, mode
 * (octal) and mtime/atime/ctime as ISO-8601 UTC.
 * @throws imgscrub::IoError if the file cannot be stat'ed.
 */
nlohmann::json file_stat_report(const std::filesystem::path& path);

/**
 * @brief Prints the assembled report as aligned text sections.
 */
void print_text_report(std::ostream& os, const nlohmann::json& report);

#endif // IMGSCRUB_METADATA_REPORT_HPP
