//
// Created by Giuseppe Francione on 10/12/25.
//

#include "metadata_report.hpp"
#include "../../../libimgscrub/include/codec_registry.hpp"
#include "../../../libimgscrub/include/errors.hpp"
#include "../../../libimgscrub/include/exif_reader.hpp"
#include "../../../libimgscrub/include/sanitizer.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <array>
#include <ctime>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <stdexcept>
#ifdef _WIN32
#include <sys/types.h>
#endif
#include <sys/stat.h>

namespace {

    struct MdCtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };

    using UniqueMDCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

    // EXIF tags that identify a camera, a person, a place or a moment
    constexpr std::array<const char*, 9> kExifSubset = {
        "DateTime", "DateTimeOriginal", "DateTimeDigitized", "Make", "Model",
        "Software", "Artist", "Copyright", "GPSInfo"
    };

    std::string iso_utc(const std::time_t t) {
        std::tm tm{};
#ifdef _WIN32
        gmtime_s(&tm, &t);
#else
        gmtime_r(&t, &tm);
#endif
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S+00:00", &tm);
        return buf;
    }

    std::string octal_mode(const unsigned mode) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "0o%o", static_cast<unsigned>(mode & 0777));
        return buf;
    }

    nlohmann::json detail(const char* type, const std::size_t len) {
        return {{"type", type}, {"len", len}};
    }

} // namespace

std::string sha256_hex(const std::span<const std::uint8_t> data) {
    static constexpr char kHex[] = "0123456789abcdef";

    const UniqueMDCtx ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Digest context allocation failed");
    }
    std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
    unsigned int out_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Digest init failed");
    }
    if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("Digest update failed");
    }
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != 1) {
        throw std::runtime_error("Digest final failed");
    }

    std::string hex;
    hex.reserve(out_len * 2);
    for (unsigned int i = 0; i < out_len; ++i) {
        hex.push_back(kHex[(out[i] >> 4) & 0x0F]);
        hex.push_back(kHex[out[i] & 0x0F]);
    }
    return hex;
}

nlohmann::json build_metadata_report(const std::span<const std::uint8_t> bytes, const bool exif_full) {
    const imgscrub::CodecRegistry& registry = imgscrub::CodecRegistry::builtin();
    const imgscrub::ImageBuffer image = imgscrub::Sanitizer(registry).decode(bytes);
    const imgscrub::ImageMetadata& meta = image.metadata;
    const imgscrub::IImageCodec* codec = registry.find_by_mime(image.source_mime);

    nlohmann::json report;
    report["format"] = codec ? std::string(codec->get_name()) : image.source_mime;
    report["mode"] = std::string(imgscrub::color_mode_name(image.raster.mode));
    report["size"] = {image.raster.width, image.raster.height};
    report["sha256"] = sha256_hex(bytes);

    report["icc_profile_present"] = !meta.icc_profile.empty();
    report["icc_profile_bytes"] = meta.icc_profile.size();
    report["icc_profile_sha256"] = meta.icc_profile.empty() ? nlohmann::json(nullptr)
                                                            : nlohmann::json(sha256_hex(meta.icc_profile));

    nlohmann::json info_detail = nlohmann::json::object();
    for (const auto& [key, value] : meta.text) info_detail[key] = detail("str", value.size());
    for (const auto& chunk : meta.chunks) info_detail[chunk.name] = detail("bytes", chunk.data.size());
    if (!meta.exif.empty()) info_detail["exif"] = detail("bytes", meta.exif.size());
    if (!meta.xmp.empty()) info_detail["xmp"] = detail("str", meta.xmp.size());

    nlohmann::json info_keys = nlohmann::json::array();
    for (const auto& [key, value] : info_detail.items()) info_keys.push_back(key);
    report["info_keys"] = std::move(info_keys);
    report["info_detail"] = std::move(info_detail);

    const auto exif = imgscrub::ExifReader::read(meta.exif);
    report["exif_present"] = !exif.empty();
    report["exif_count"] = exif.size();
    if (exif_full) {
        report["exif"] = exif;
    } else {
        nlohmann::json subset = nlohmann::json::object();
        for (const char* key : kExifSubset) {
            if (const auto it = exif.find(key); it != exif.end()) subset[key] = it->second;
        }
        if (!subset.empty()) report["exif_subset"] = std::move(subset);
    }

    // raw container bytes, not the decoded packet
    report["xmp_present"] = imgscrub::contains_xmp_signature(bytes);
    return report;
}

nlohmann::json file_stat_report(const std::filesystem::path& path) {
#ifdef _WIN32
    // wide-char path, as in open_file()
    struct _stat64 st{};
    if (_wstat64(path.c_str(), &st) != 0) {
#else
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
#endif
        throw imgscrub::IoError("cannot stat " + path.string() + ": " + std::strerror(errno));
    }

    const std::filesystem::path abs = std::filesystem::absolute(path);
    return {
        {"basename", abs.filename().string()},
        {"dir", abs.parent_path().string()},
        {"size_bytes", static_cast<std::uintmax_t>(st.st_size)},
        {"mode", octal_mode(static_cast<unsigned>(st.st_mode))},
        {"mtime", iso_utc(st.st_mtime)},
        {"atime", iso_utc(st.st_atime)},
        {"ctime", iso_utc(st.st_ctime)},
    };
}

namespace {

    void section(std::ostream& os, const std::string_view title) {
        os << "\n" << title << "\n\n";
    }

    void dump_object(std::ostream& os, const nlohmann::json& obj, const int indent = 0) {
        std::size_t key_width = 0;
        for (const auto& [key, value] : obj.items()) key_width = std::max(key_width, key.size());

        const std::string pad(static_cast<std::size_t>(indent), ' ');
        for (const auto& [key, value] : obj.items()) {
            if (value.is_object()) {
                os << pad << key << ":\n";
                dump_object(os, value, indent + 2);
                continue;
            }
            os << pad << key << std::string(key_width - key.size(), ' ') << " : "
               << (value.is_string() ? value.get<std::string>() : value.dump()) << "\n";
        }
    }

} // namespace

void print_text_report(std::ostream& os, const nlohmann::json& report) {
    os << "Source: " << report.value("source", std::string("?")) << "\n";
    if (report.contains("source_file")) {
        section(os, "-- SOURCE FILE --");
        dump_object(os, report["source_file"]);
    }
    section(os, "-- BEFORE --");
    dump_object(os, report["before"]);
    if (report.contains("sanitized")) {
        section(os, "-- SANITIZED FILE --");
        dump_object(os, report["sanitized"]["file"]);
        section(os, "-- AFTER --");
        dump_object(os, report["sanitized"]["report"]);
        os << "\nsanitized_mime: " << report.value("sanitized_mime", std::string("?")) << "\n";
    }
}
