//
// Created by Giuseppe Francione on 05/12/25.
//

#include "../../include/sanitizer.hpp"
#include "../../include/color_normalizer.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/metadata_stripper.hpp"
#include "../../include/mime_detector.hpp"
#include <algorithm>
#include <array>

namespace {

    constexpr std::array<std::string_view, 2> kXmpSignatures = {
        "<x:xmpmeta",
        "http://ns.adobe.com/xap/1.0/"
    };

    bool contains_bytes(const std::span<const std::uint8_t> haystack, const std::string_view needle) {
        const auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                                    [](const std::uint8_t a, const char b) {
                                        return a == static_cast<unsigned char>(b);
                                    });
        return it != haystack.end();
    }

    // "(N bytes, declared X, detected Y)"
    std::string context(const std::size_t size, const std::string_view declared, const std::string_view detected) {
        std::string out = "(" + std::to_string(size) + " bytes";
        if (!declared.empty()) out += ", declared " + std::string(declared);
        if (!detected.empty()) out += ", detected " + std::string(detected);
        return out + ")";
    }

    std::string dims(const imgscrub::Raster& r) {
        return std::to_string(r.width) + "x" + std::to_string(r.height);
    }

} // namespace

namespace imgscrub {

Sanitizer::Sanitizer(const CodecRegistry& registry) : registry_(registry) {}

ImageBuffer Sanitizer::decode(const std::span<const std::uint8_t> data, const std::string_view declared_mime) const {
    if (data.empty()) {
        throw DecodeError("decode: empty input " + context(0, declared_mime, {}));
    }

    const std::string detected = MimeDetector::detect(data);
    const IImageCodec* codec = registry_.find_by_mime(detected);
    if (!codec) {
        throw DecodeError("decode: unsupported image type " + context(data.size(), declared_mime, detected));
    }
    if (!declared_mime.empty() && declared_mime != detected) {
        Logger::log(LogLevel::Warning,
                    "Declared MIME " + std::string(declared_mime) + " does not match detected " + detected,
                    "sanitizer");
    }

    Logger::log(LogLevel::Debug,
                "Decoding " + std::to_string(data.size()) + " bytes with " + std::string(codec->get_name()),
                "sanitizer");
    try {
        return codec->decode(data);
    } catch (const DecodeError& e) {
        throw DecodeError(std::string("decode: ") + e.what() + " " + context(data.size(), declared_mime, detected));
    }
}

SanitizedOutput Sanitizer::sanitize(const std::span<const std::uint8_t> data,
                                    const OutputFormat& format,
                                    const int max_dim,
                                    const std::string_view declared_mime) const {
    if (max_dim <= 0) {
        throw InvalidConfig("sanitize: max dimension must be positive, got " + std::to_string(max_dim));
    }
    const IImageCodec* encoder = registry_.find_encoder(format.kind);
    if (!encoder) {
        throw EncodeError("sanitize: no encoder for output format " + format.name);
    }

    Logger::log(LogLevel::Debug,
                "Start sanitize: " + std::to_string(data.size()) + " bytes -> " + format.name +
                ", max_dim " + std::to_string(max_dim),
                "sanitizer");

    ImageBuffer buffer = decode(data, declared_mime);
    const std::string source_mime = buffer.source_mime;
    const std::string source_dims = dims(buffer.raster);
    const std::size_t source_entries = buffer.metadata.entry_count();

    buffer = normalize_color_mode(std::move(buffer));
    buffer = bound_dimensions(std::move(buffer), max_dim);
    buffer = strip_metadata(std::move(buffer));

    SanitizedOutput out;
    out.mime = mime_for_format(format);
    try {
        out.bytes = encoder->encode(buffer.raster);
    } catch (const EncodeError& e) {
        throw EncodeError(std::string("encode: ") + e.what() + " " + context(data.size(), declared_mime, source_mime));
    }

    if (contains_xmp_signature(out.bytes)) {
        throw EncodeError("encode: XMP packet found in " + format.name + " output " +
                          context(out.bytes.size(), declared_mime, source_mime));
    }

    Logger::log(LogLevel::Info,
                "Sanitized " + source_mime + " " + source_dims + " (" + std::to_string(source_entries) +
                " metadata entries) -> " + out.mime + " " + dims(buffer.raster) + ", " +
                std::to_string(out.bytes.size()) + " bytes",
                "sanitizer");
    return out;
}

bool contains_xmp_signature(const std::span<const std::uint8_t> data) {
    return std::ranges::any_of(kXmpSignatures, [&](const std::string_view sig) {
        return contains_bytes(data, sig);
    });
}

} // namespace imgscrub
