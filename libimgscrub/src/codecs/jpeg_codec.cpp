//
// Created by Giuseppe Francione on 19/10/25.
//

#include "../../include/jpeg_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <cstdio>
#include <cstdlib>
#include <jpeglib.h>
#include <algorithm>
#include <cstring>
#include <map>
#include <ranges>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr std::uint8_t kExifSignature[] = {'E', 'x', 'i', 'f', 0, 0};
constexpr char kXmpSignature[] = "http://ns.adobe.com/xap/1.0/"; // followed by a NUL
constexpr char kIccSignature[] = "ICC_PROFILE";                  // followed by a NUL
constexpr std::size_t kIccHeaderSize = sizeof(kIccSignature) + 2; // signature, seq_no, count

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

/**
 * @brief libjpeg error handler that throws a C++ exception.
 * @param cinfo Pointer to the libjpeg error context.
 */
void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    Logger::log(LogLevel::Debug, std::string("libjpeg: ") + err->msg, "libjpeg");
    throw std::runtime_error(err->msg);
}

/**
 * @brief Routes libjpeg's corrupt-data warnings to the Logger instead of stderr.
 */
void jpeg_output_message_log(const j_common_ptr cinfo) {
    char buffer[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buffer);
    Logger::log(LogLevel::Warning, std::string("libjpeg: ") + buffer, "libjpeg");
}

void install_error_handlers(JpegErrorMgr& mgr) {
    jpeg_std_error(&mgr.pub);
    mgr.pub.error_exit = jpeg_error_exit_throw;
    mgr.pub.output_message = jpeg_output_message_log;
}

/**
 * @brief RAII wrapper for a libjpeg decompressor.
 */
struct JpegDecompress {
    jpeg_decompress_struct cinfo{};
    JpegErrorMgr err{};

    JpegDecompress() {
        install_error_handlers(err);
        cinfo.err = &err.pub;
        jpeg_create_decompress(&cinfo);
    }

    ~JpegDecompress() { jpeg_destroy_decompress(&cinfo); }

    JpegDecompress(const JpegDecompress&) = delete;
    JpegDecompress& operator=(const JpegDecompress&) = delete;
};

/**
 * @brief RAII wrapper for a libjpeg compressor writing to a malloc'd buffer.
 */
struct JpegCompress {
    jpeg_compress_struct cinfo{};
    JpegErrorMgr err{};
    unsigned char* buffer = nullptr; ///< owned, allocated by jpeg_mem_dest
    unsigned long size = 0;

    JpegCompress() {
        install_error_handlers(err);
        cinfo.err = &err.pub;
        jpeg_create_compress(&cinfo);
    }

    ~JpegCompress() {
        jpeg_destroy_compress(&cinfo);
        std::free(buffer);
    }

    JpegCompress(const JpegCompress&) = delete;
    JpegCompress& operator=(const JpegCompress&) = delete;
};

bool starts_with(const jpeg_saved_marker_ptr m, const void* sig, const std::size_t len) {
    return m->data_length >= len && std::memcmp(m->data, sig, len) == 0;
}

std::string marker_name(const int marker) {
    if (marker == JPEG_COM) return "COM";
    return "APP" + std::to_string(marker - JPEG_APP0);
}

/**
 * @brief Configures libjpeg to keep every APPn and COM marker in memory.
 */
void setup_marker_saving(const j_decompress_ptr srcinfo) {
    for (int m = 0; m < 16; ++m) {
        jpeg_save_markers(srcinfo, JPEG_APP0 + m, 0xFFFF);
    }
    jpeg_save_markers(srcinfo, JPEG_COM, 0xFFFF);
}

/**
 * @brief Sorts the saved markers into @p meta.
 *
 * ICC profiles may be split over several APP2 segments, each carrying its
 * 1-based sequence number; they are joined back in sequence order.
 */
void collect_saved_markers(const j_decompress_ptr srcinfo, imgscrub::ImageMetadata& meta) {
    std::map<int, std::vector<std::uint8_t>> icc_segments;

    for (jpeg_saved_marker_ptr m = srcinfo->marker_list; m; m = m->next) {
        if (!m->data) continue;
        const auto* begin = m->data;
        const auto* end = m->data + m->data_length;

        if (m->marker == JPEG_APP0 + 1 && starts_with(m, kExifSignature, sizeof(kExifSignature))) {
            meta.exif.assign(begin + sizeof(kExifSignature), end);
        } else if (m->marker == JPEG_APP0 + 1 && starts_with(m, kXmpSignature, sizeof(kXmpSignature))) {
            meta.xmp.assign(begin + sizeof(kXmpSignature), end);
        } else if (m->marker == JPEG_APP0 + 2 && starts_with(m, kIccSignature, sizeof(kIccSignature)) &&
                   m->data_length >= kIccHeaderSize) {
            const int seq_no = begin[sizeof(kIccSignature)];
            auto& segment = icc_segments[seq_no];
            segment.insert(segment.end(), begin + kIccHeaderSize, end);
        } else if (m->marker == JPEG_COM) {
            std::string comment(reinterpret_cast<const char*>(begin), m->data_length);
            auto& slot = meta.text["comment"];
            slot += slot.empty() ? comment : "\n" + comment;
        } else {
            meta.chunks.push_back({marker_name(m->marker), std::vector<std::uint8_t>(begin, end)});
        }
    }

    for (const auto& segment : icc_segments | std::views::values) {
        meta.icc_profile.insert(meta.icc_profile.end(), segment.begin(), segment.end());
    }
}

} // namespace

namespace imgscrub {

ImageBuffer JpegCodec::decode(const std::span<const std::uint8_t> data) const {
    Logger::log(LogLevel::Debug, "Start JPEG decode: " + std::to_string(data.size()) + " bytes", "jpeg_codec");

    if (data.size() < 3 || data[0] != 0xFF || data[1] != 0xD8) {
        throw DecodeError("JpegCodec: missing SOI marker (" + std::to_string(data.size()) + " bytes)");
    }

    ImageBuffer out;
    out.source_mime = "image/jpeg";

    try {
        JpegDecompress src;
        jpeg_mem_src(&src.cinfo, data.data(), static_cast<unsigned long>(data.size()));
        setup_marker_saving(&src.cinfo);

        if (jpeg_read_header(&src.cinfo, TRUE) != JPEG_HEADER_OK) {
            throw std::runtime_error("Invalid JPEG header");
        }

        Logger::log(LogLevel::Debug,
                    std::string("JPEG ") + (src.cinfo.progressive_mode ? "progressive" : "baseline"),
                    "jpeg_codec");

        Raster& raster = out.raster;
        switch (src.cinfo.jpeg_color_space) {
            case JCS_GRAYSCALE:
                src.cinfo.out_color_space = JCS_GRAYSCALE;
                raster.mode = ColorMode::Grayscale;
                break;
            case JCS_CMYK:
            case JCS_YCCK:
                src.cinfo.out_color_space = JCS_CMYK;
                raster.mode = ColorMode::Cmyk;
                break;
            default:
                src.cinfo.out_color_space = JCS_RGB;
                raster.mode = ColorMode::Rgb;
                break;
        }

        jpeg_start_decompress(&src.cinfo);

        if (static_cast<unsigned>(src.cinfo.output_components) != channels_of(raster.mode)) {
            throw std::runtime_error("unexpected component count " +
                                     std::to_string(src.cinfo.output_components));
        }

        raster.width = src.cinfo.output_width;
        raster.height = src.cinfo.output_height;
        raster.pixels.resize(raster.expected_size());

        const std::size_t row_stride = raster.row_bytes();
        while (src.cinfo.output_scanline < src.cinfo.output_height) {
            JSAMPROW row = raster.pixels.data() + src.cinfo.output_scanline * row_stride;
            jpeg_read_scanlines(&src.cinfo, &row, 1);
        }

        // adobe writes cmyk inverted
        if (raster.mode == ColorMode::Cmyk && src.cinfo.saw_Adobe_marker) {
            std::ranges::transform(raster.pixels, raster.pixels.begin(),
                                   [](const std::uint8_t v) { return static_cast<std::uint8_t>(255 - v); });
        }

        collect_saved_markers(&src.cinfo, out.metadata);

        jpeg_finish_decompress(&src.cinfo);
    } catch (const Error&) {
        throw;
    } catch (const std::exception& e) {
        throw DecodeError(std::string("JpegCodec: ") + e.what() +
                          " (" + std::to_string(data.size()) + " bytes)");
    }

    Logger::log(LogLevel::Debug,
                "JPEG decoded: " + std::to_string(out.raster.width) + "x" + std::to_string(out.raster.height) +
                " " + std::string(color_mode_name(out.raster.mode)) +
                ", metadata entries: " + std::to_string(out.metadata.entry_count()),
                "jpeg_codec");
    return out;
}

std::vector<std::uint8_t> JpegCodec::encode(const Raster& raster) const {
    J_COLOR_SPACE in_space = JCS_UNKNOWN;
    switch (raster.mode) {
        case ColorMode::Rgb:       in_space = JCS_RGB; break;
        case ColorMode::Grayscale: in_space = JCS_GRAYSCALE; break;
        default:
            throw EncodeError("JpegCodec: refusing to encode color mode " +
                              std::string(color_mode_name(raster.mode)));
    }
    if (raster.width == 0 || raster.height == 0 || raster.pixels.size() != raster.expected_size()) {
        throw EncodeError("JpegCodec: raster size does not match its dimensions");
    }

    std::vector<std::uint8_t> out;
    try {
        JpegCompress dst;
        jpeg_mem_dest(&dst.cinfo, &dst.buffer, &dst.size);

        dst.cinfo.image_width = raster.width;
        dst.cinfo.image_height = raster.height;
        dst.cinfo.input_components = static_cast<int>(channels_of(raster.mode));
        dst.cinfo.in_color_space = in_space;

        jpeg_set_defaults(&dst.cinfo);
        jpeg_set_quality(&dst.cinfo, kJpegQuality, TRUE);
        dst.cinfo.optimize_coding = TRUE;
        // JFIF APP0 with neutral 1:1 density is all that gets written
        dst.cinfo.write_JFIF_header = TRUE;
        dst.cinfo.density_unit = 0;
        dst.cinfo.X_density = 1;
        dst.cinfo.Y_density = 1;
        dst.cinfo.write_Adobe_marker = FALSE;

        jpeg_start_compress(&dst.cinfo, TRUE);

        const std::size_t row_stride = raster.row_bytes();
        while (dst.cinfo.next_scanline < dst.cinfo.image_height) {
            auto row = const_cast<JSAMPROW>(raster.pixels.data() + dst.cinfo.next_scanline * row_stride);
            jpeg_write_scanlines(&dst.cinfo, &row, 1);
        }

        jpeg_finish_compress(&dst.cinfo);
        out.assign(dst.buffer, dst.buffer + dst.size);
    } catch (const std::exception& e) {
        throw EncodeError(std::string("JpegCodec: ") + e.what());
    }

    Logger::log(LogLevel::Debug, "JPEG encoded: " + std::to_string(out.size()) + " bytes", "jpeg_codec");
    return out;
}

} // namespace imgscrub
