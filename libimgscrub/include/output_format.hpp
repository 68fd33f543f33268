//
// Created by Giuseppe Francione on 02/12/25.
//

/**
 * @file output_format.hpp
 * @brief Output format enumeration and the MIME/extension tables around it.
 *
 * The MIME-to-extension mapping defined here is part of the persisted
 * artifact contract (img_xxxxxxxx.png / .jpg), so it must stay deterministic.
 */

#ifndef IMGSCRUB_OUTPUT_FORMAT_HPP
#define IMGSCRUB_OUTPUT_FORMAT_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_map>

namespace imgscrub {

/**
 * @brief Encoders imgscrub can be asked for.
 *
 * Other is a pass-through for anything the caller names that is not PNG,
 * JPEG or WEBP; it keeps the requested name so a MIME type can still be guessed.
 */
enum class OutputFormatKind {
    Png,
    Jpeg,
    Webp,
    Other
};

/**
 * @brief A requested output format.
 */
struct OutputFormat {
    OutputFormatKind kind = OutputFormatKind::Png;
    std::string name = "PNG"; ///< upper-case format name as requested

    static OutputFormat png() { return {OutputFormatKind::Png, "PNG"}; }
    static OutputFormat jpeg() { return {OutputFormatKind::Jpeg, "JPEG"}; }
    static OutputFormat webp() { return {OutputFormatKind::Webp, "WEBP"}; }

    bool operator==(const OutputFormat& other) const {
        return kind == other.kind && name == other.name;
    }
};

///< Map linking common file extensions (lowercase) to their primary MIME type.
inline const std::unordered_map<std::string, std::string> ext_to_mime = {
    {".png",    "image/png"},
    {".apng",   "image/apng"},
    {".jpg",    "image/jpeg"},
    {".jpeg",   "image/jpeg"},
    {".jpe",    "image/jpeg"},
    {".gif",    "image/gif"},
    {".bmp",    "image/bmp"},
    {".tif",    "image/tiff"},
    {".tiff",   "image/tiff"},
    {".webp",   "image/webp"},
    {".jxl",    "image/jxl"},
    {".avif",   "image/avif"},
    {".heic",   "image/heic"},
    {".ico",    "image/vnd.microsoft.icon"},
    {".tga",    "image/x-tga"},
    {".ppm",    "image/x-portable-pixmap"},
    {".pgm",    "image/x-portable-graymap"},
    {".pbm",    "image/x-portable-bitmap"},
    {".pnm",    "image/x-portable-anymap"},
    {".svg",    "image/svg+xml"},
};

///< Reverse lookup used when naming persisted files.
inline const std::unordered_map<std::string, std::string> mime_to_ext = {
    {"image/png",                "png"},
    {"image/jpeg",               "jpg"},
    {"image/gif",                "gif"},
    {"image/bmp",                "bmp"},
    {"image/tiff",               "tif"},
    {"image/webp",               "webp"},
    {"image/jxl",                "jxl"},
    {"image/avif",               "avif"},
    {"image/x-tga",              "tga"},
    {"image/x-portable-pixmap",  "ppm"},
    {"image/vnd.microsoft.icon", "ico"},
};

/**
 * @brief Parses a user supplied format name.
 *
 * Case-insensitive. "PNG" maps to Png, "JPG" and "JPEG" map to Jpeg,
 * "WEBP" maps to Webp, any other non-empty name becomes Other with the upper-cased name kept. An
 * empty string means the default (PNG).
 */
inline OutputFormat parse_output_format(const std::string& str) {
    std::string s = str;
    std::ranges::transform(s, s.begin(),
        [](unsigned char c){ return static_cast<char>(std::toupper(c)); });

    if (s.empty() || s == "PNG") return OutputFormat::png();
    if (s == "JPG" || s == "JPEG") return OutputFormat::jpeg();
    if (s == "WEBP") return OutputFormat::webp();
    return {OutputFormatKind::Other, s};
}

/**
 * @brief MIME type produced by encoding to @p fmt.
 *
 * PNG, JPEG and WEBP are fixed. Other formats are guessed from the extension
 * table using the lower-cased format name, falling back to
 * "application/octet-stream".
 */
inline std::string mime_for_format(const OutputFormat& fmt) {
    switch (fmt.kind) {
        case OutputFormatKind::Png:  return "image/png";
        case OutputFormatKind::Jpeg: return "image/jpeg";
        case OutputFormatKind::Webp: return "image/webp";
        case OutputFormatKind::Other: break;
    }
    std::string ext = "." + fmt.name;
    std::ranges::transform(ext, ext.begin(),
        [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    const auto it = ext_to_mime.find(ext);
    return it != ext_to_mime.end() ? it->second : "application/octet-stream";
}

/**
 * @brief File extension (with the dot) used for a persisted artifact of type @p mime.
 * @return ".png" for image/png, ".jpg" for image/jpeg, a table entry for other
 * image types, ".bin" otherwise.
 */
inline std::string extension_for_mime(const std::string& mime) {
    const auto it = mime_to_ext.find(mime);
    return it != mime_to_ext.end() ? "." + it->second : ".bin";
}

} // namespace imgscrub

#endif // IMGSCRUB_OUTPUT_FORMAT_HPP
