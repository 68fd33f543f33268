//
// Created by Giuseppe Francione on 03/12/25.
//

#include "../../include/metadata_stripper.hpp"
#include "../../include/logger.hpp"
#include <ranges>
#include <string>

namespace {

    // "ICC(3000B), EXIF(212B), text:Author, tIME"
    std::string describe(const imgscrub::ImageMetadata& meta) {
        std::string removed;
        auto note = [&removed](const std::string& what) {
            removed += removed.empty() ? what : ", " + what;
        };
        if (!meta.icc_profile.empty()) note("ICC(" + std::to_string(meta.icc_profile.size()) + "B)");
        if (!meta.exif.empty()) note("EXIF(" + std::to_string(meta.exif.size()) + "B)");
        if (!meta.xmp.empty()) note("XMP(" + std::to_string(meta.xmp.size()) + "B)");
        for (const auto& key : meta.text | std::views::keys) note("text:" + key);
        for (const auto& chunk : meta.chunks) note(chunk.name);
        return removed;
    }

} // namespace

namespace imgscrub {

ImageBuffer strip_metadata(ImageBuffer buffer) {
    // a palette survives only as long as the pixels still index into it
    if (buffer.raster.mode != ColorMode::Palette) {
        buffer.raster.palette.clear();
        buffer.raster.palette.shrink_to_fit();
    }

    ImageMetadata& meta = buffer.metadata;
    if (meta.empty()) {
        Logger::log(LogLevel::Debug, "No metadata to strip", "metadata_stripper");
        return buffer;
    }

    if (Logger::enabled(LogLevel::Debug)) {
        Logger::log(LogLevel::Debug, "Stripping metadata: " + describe(meta), "metadata_stripper");
    }
    meta.clear();
    return buffer;
}

} // namespace imgscrub
