//
// Created by Giuseppe Francione on 19/10/25.
//

#include "../../include/codec_registry.hpp"
#include "../../include/jpeg_codec.hpp"
#include "../../include/png_codec.hpp"
#include "../../include/webp_codec.hpp"
#include <algorithm>
#include <cctype>
#include <ranges>

namespace imgscrub {

CodecRegistry::CodecRegistry() {
    codecs_.push_back(std::make_unique<PngCodec>());
    codecs_.push_back(std::make_unique<JpegCodec>());
    codecs_.push_back(std::make_unique<WebpCodec>());
}

void CodecRegistry::add(std::unique_ptr<IImageCodec> codec) {
    if (codec) {
        codecs_.push_back(std::move(codec));
    }
}

const IImageCodec* CodecRegistry::find_by_mime(const std::string& mime) const {
    for (const auto& codec : codecs_ | std::views::reverse) {
        for (const auto supported_mime : codec->get_supported_mime_types()) {
            if (supported_mime == mime) {
                return codec.get();
            }
        }
    }
    return nullptr;
}

const IImageCodec* CodecRegistry::find_by_extension(const std::string& ext) const {
    if (ext.empty() || ext[0] != '.') return nullptr;

    auto iequals = [](const std::string_view s1, const std::string_view s2) {
        return std::equal(s1.begin(), s1.end(), s2.begin(), s2.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    };

    for (const auto& codec : codecs_ | std::views::reverse) {
        for (const auto supported_ext : codec->get_supported_extensions()) {
            if (iequals(supported_ext, ext)) {
                return codec.get();
            }
        }
    }
    return nullptr;
}

const IImageCodec* CodecRegistry::find_encoder(const OutputFormatKind kind) const {
    if (kind == OutputFormatKind::Other) return nullptr;
    for (const auto& codec : codecs_ | std::views::reverse) {
        if (codec->get_output_kind() == kind) {
            return codec.get();
        }
    }
    return nullptr;
}

const CodecRegistry& CodecRegistry::builtin() {
    static const CodecRegistry registry;
    return registry;
}

} // namespace imgscrub
