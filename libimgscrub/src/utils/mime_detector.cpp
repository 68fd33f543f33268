//
// Created by Giuseppe Francione on 11/10/25.
//

#include <magic.h>
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include <array>
#include <algorithm>
#include <memory>
#include <string>
#include <type_traits>

namespace {

    constexpr std::array<std::uint8_t, 8> kPngSignature = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
    constexpr std::array<std::uint8_t, 3> kJpegSignature = {0xFF, 0xD8, 0xFF};
    // "RIFF" <size:4> "WEBP"
    constexpr std::array<std::uint8_t, 4> kRiffTag = {'R', 'I', 'F', 'F'};
    constexpr std::array<std::uint8_t, 4> kWebpTag = {'W', 'E', 'B', 'P'};

    struct MagicCloser {
        void operator()(const magic_t m) const { if (m) magic_close(m); }
    };
    using unique_magic = std::unique_ptr<std::remove_pointer_t<magic_t>, MagicCloser>;

} // namespace

std::string imgscrub::MimeDetector::detect(const std::span<const std::uint8_t> data)
{
    if (data.empty()) return "application/octet-stream";

    const unique_magic magic(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR));
    if (!magic || magic_load(magic.get(), nullptr) != 0)
    {
        const char* err = magic ? magic_error(magic.get()) : nullptr;
        Logger::log(LogLevel::Warning,
                    std::string("libmagic unavailable (") + (err ? err : "no database") +
                    "), falling back to signature sniffing",
                    "libmagic");
        return sniff_signature(data);
    }

    const char* mime = magic_buffer(magic.get(), data.data(), data.size());
    std::string result = mime ? mime : "";
    if (result.empty())
    {
        return sniff_signature(data);
    }
    return result;
}

std::string imgscrub::MimeDetector::sniff_signature(const std::span<const std::uint8_t> data)
{
    if (data.size() >= kPngSignature.size() &&
        std::equal(kPngSignature.begin(), kPngSignature.end(), data.begin()))
    {
        return "image/png";
    }
    if (data.size() >= kJpegSignature.size() &&
        std::equal(kJpegSignature.begin(), kJpegSignature.end(), data.begin()))
    {
        return "image/jpeg";
    }
    if (data.size() >= 12 &&
        std::equal(kRiffTag.begin(), kRiffTag.end(), data.begin()) &&
        std::equal(kWebpTag.begin(), kWebpTag.end(), data.begin() + 8))
    {
        return "image/webp";
    }
    return "application/octet-stream";
}
