//
// Created by Giuseppe Francione on 04/12/25.
//

#include "../../include/data_url.hpp"
#include "../../include/base64.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"

namespace {

    constexpr std::string_view kScheme = "data:";
    constexpr std::string_view kBase64Marker = ";base64,";
    constexpr std::string_view kWhitespace = " \t\r\n\f\v";

    std::string_view trim(std::string_view s) noexcept {
        const auto first = s.find_first_not_of(kWhitespace);
        if (first == std::string_view::npos) return {};
        const auto last = s.find_last_not_of(kWhitespace);
        return s.substr(first, last - first + 1);
    }

} // namespace

namespace imgscrub {

DataUrlPayload DataUrl::parse(const std::string_view text) {
    const std::string_view url = trim(text);

    if (!url.starts_with(kScheme)) {
        throw InvalidFormat("not a data URL: missing \"data:\" scheme");
    }

    const std::string_view rest = url.substr(kScheme.size());
    const auto semicolon = rest.find(';');
    if (semicolon == std::string_view::npos) {
        throw InvalidFormat("not a data URL: missing \";base64,\"");
    }
    if (rest.substr(semicolon, kBase64Marker.size()) != kBase64Marker) {
        throw InvalidFormat("unsupported data URL encoding, only base64 is accepted");
    }

    DataUrlPayload payload;
    payload.mime = std::string(rest.substr(0, semicolon));
    payload.bytes = Base64::decode(rest.substr(semicolon + kBase64Marker.size()));

    Logger::log(LogLevel::Debug,
                "Parsed data URL: " + (payload.mime.empty() ? std::string("<no mime>") : payload.mime) +
                ", " + std::to_string(payload.bytes.size()) + " bytes",
                "data_url");
    return payload;
}

std::string DataUrl::format(const std::span<const std::uint8_t> bytes, const std::string_view mime) {
    std::string out;
    out.reserve(kScheme.size() + mime.size() + kBase64Marker.size() + (bytes.size() + 2) / 3 * 4);
    out.append(kScheme);
    out.append(mime);
    out.append(kBase64Marker);
    out.append(Base64::encode(bytes));
    return out;
}

bool DataUrl::looks_like_data_url(const std::string_view text) noexcept {
    return trim(text).starts_with(kScheme);
}

} // namespace imgscrub
