//
// Created by Giuseppe Francione on 19/10/25.
//

#include "../../include/png_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <zlib.h>
#include <cstdio>
#include <cstring>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

    constexpr const char* kXmpKeyword = "XML:com.adobe.xmp";

    /**
     * @brief libpng error handler that throws a C++ exception.
     * @param msg The error message from libpng.
     */
    void png_error_fn(png_structp, const png_const_charp msg) {
        Logger::log(LogLevel::Debug, std::string("libpng: ") + msg, "libpng");
        throw std::runtime_error(msg);
    }

    /**
     * @brief libpng warning handler.
     * @param msg The warning message from libpng.
     */
    void png_warning_fn(png_structp, const png_const_charp msg) {
        Logger::log(LogLevel::Warning, std::string("libpng: ") + msg, "libpng");
    }

    /**
     * @brief RAII wrapper for libpng read structs (png_structp, png_infop).
     * Ensures png_destroy_read_struct is called even if exceptions occur.
     */
    struct PngRead {
        png_structp png = nullptr;
        png_infop info = nullptr;

        explicit PngRead() = default;

        ~PngRead() {
            if (png || info) png_destroy_read_struct(&png, &info, nullptr);
        }

        PngRead(const PngRead&) = delete;
        PngRead& operator=(const PngRead&) = delete;
    };

    /**
     * @brief RAII wrapper for libpng write structs (png_structp, png_infop).
     * Ensures png_destroy_write_struct is called even if exceptions occur.
     */
    struct PngWrite {
        png_structp png = nullptr;
        png_infop info = nullptr;

        explicit PngWrite() = default;

        ~PngWrite() {
            if (png || info) png_destroy_write_struct(&png, &info);
        }

        PngWrite(const PngWrite&) = delete;
        PngWrite& operator=(const PngWrite&) = delete;
    };

    // cursor over the caller's buffer, only alive for the duration of decode()
    struct MemoryReader {
        const std::uint8_t* data = nullptr;
        std::size_t size = 0;
        std::size_t offset = 0;
    };

    void read_from_memory(png_structp png, png_bytep out, const png_size_t len) {
        auto* src = static_cast<MemoryReader*>(png_get_io_ptr(png));
        if (len > src->size - src->offset) {
            png_error(png, "unexpected end of PNG data");
        }
        std::memcpy(out, src->data + src->offset, len);
        src->offset += len;
    }

    void write_to_vector(png_structp png, png_bytep data, const png_size_t len) {
        auto* out = static_cast<std::vector<std::uint8_t>*>(png_get_io_ptr(png));
        out->insert(out->end(), data, data + len);
    }

    void flush_noop(png_structp) {}

    // keeps duplicated keywords (several "Comment" chunks are legal) distinct
    void insert_text(std::map<std::string, std::string>& text, const std::string& key, std::string value) {
        std::string unique_key = key;
        for (int n = 2; text.contains(unique_key); ++n) {
            unique_key = key + " (" + std::to_string(n) + ")";
        }
        text.emplace(std::move(unique_key), std::move(value));
    }

    /**
     * @brief Moves every ancillary chunk libpng parsed into @p meta.
     *
     * Must be called after png_read_end so chunks placed after IDAT are seen.
     */
    void collect_metadata(png_structp png, png_infop info, imgscrub::ImageMetadata& meta) {
        // iccp
        if (png_get_valid(png, info, PNG_INFO_iCCP)) {
            png_charp name = nullptr;
            int comp_type = 0;
            png_bytep profile = nullptr;
            png_uint_32 profile_len = 0;
            if (png_get_iCCP(png, info, &name, &comp_type, &profile, &profile_len) && profile) {
                meta.icc_profile.assign(profile, profile + profile_len);
            }
        }

        // exif
        png_bytep exif = nullptr;
        png_uint_32 exif_len = 0;
        if (png_get_eXIf_1(png, info, &exif_len, &exif) && exif && exif_len > 0) {
            meta.exif.assign(exif, exif + exif_len);
        }

        // text, ztxt, itxt
        png_textp text = nullptr;
        int num_text = 0;
        png_get_text(png, info, &text, &num_text);
        for (int i = 0; i < num_text; ++i) {
            const std::string key = text[i].key ? text[i].key : "";
            const std::size_t len = text[i].compression >= PNG_ITXT_COMPRESSION_NONE
                                        ? text[i].itxt_length
                                        : text[i].text_length;
            std::string value = text[i].text ? std::string(text[i].text, len) : std::string();
            if (key == kXmpKeyword) {
                meta.xmp = std::move(value);
            } else {
                insert_text(meta.text, key, std::move(value));
            }
        }

        // tIME is a fingerprint on its own, keep its value for reporting
        if (png_get_valid(png, info, PNG_INFO_tIME)) {
            png_timep mod_time = nullptr;
            if (png_get_tIME(png, info, &mod_time) && mod_time) {
                char buf[32];
                std::snprintf(buf, sizeof(buf), "%04u-%02u-%02uT%02u:%02u:%02u",
                              mod_time->year, mod_time->month, mod_time->day,
                              mod_time->hour, mod_time->minute, mod_time->second);
                meta.chunks.push_back({"tIME", std::vector<std::uint8_t>(buf, buf + std::strlen(buf))});
            }
        }

        // known chunks without a payload worth keeping
        constexpr struct { png_uint_32 flag; const char* name; } kKnown[] = {
            {PNG_INFO_gAMA, "gAMA"},
            {PNG_INFO_cHRM, "cHRM"},
            {PNG_INFO_sRGB, "sRGB"},
            {PNG_INFO_pHYs, "pHYs"},
            {PNG_INFO_bKGD, "bKGD"},
            {PNG_INFO_sBIT, "sBIT"},
            {PNG_INFO_hIST, "hIST"},
            {PNG_INFO_oFFs, "oFFs"},
            {PNG_INFO_pCAL, "pCAL"},
            {PNG_INFO_sCAL, "sCAL"},
        };
        for (const auto& k : kKnown) {
            if (png_get_valid(png, info, k.flag)) {
                meta.chunks.push_back({k.name, {}});
            }
        }

        // splt (suggested palettes, named)
        png_sPLT_tp splt = nullptr;
        const int n_splt = png_get_sPLT(png, info, &splt);
        for (int i = 0; i < n_splt && splt; ++i) {
            const std::string name = splt[i].name ? splt[i].name : "";
            meta.chunks.push_back({"sPLT", std::vector<std::uint8_t>(name.begin(), name.end())});
        }

        // everything libpng does not know about (private chunks, caBX, ...)
        png_unknown_chunkp unknowns = nullptr;
        const int n_unknown = png_get_unknown_chunks(png, info, &unknowns);
        for (int i = 0; i < n_unknown && unknowns; ++i) {
            const auto& u = unknowns[i];
            const std::string name(reinterpret_cast<const char*>(u.name),
                                   strnlen(reinterpret_cast<const char*>(u.name), 4));
            imgscrub::AncillaryChunk chunk{name, {}};
            if (u.data && u.size > 0) {
                chunk.data.assign(u.data, u.data + u.size);
            }
            meta.chunks.push_back(std::move(chunk));
        }
    }

    imgscrub::ColorMode mode_from_png(const int color_type) {
        switch (color_type) {
            case PNG_COLOR_TYPE_GRAY:       return imgscrub::ColorMode::Grayscale;
            case PNG_COLOR_TYPE_GRAY_ALPHA: return imgscrub::ColorMode::GrayAlpha;
            case PNG_COLOR_TYPE_RGB:        return imgscrub::ColorMode::Rgb;
            case PNG_COLOR_TYPE_RGB_ALPHA:  return imgscrub::ColorMode::Rgba;
            case PNG_COLOR_TYPE_PALETTE:    return imgscrub::ColorMode::Palette;
            default:
                throw std::runtime_error("unsupported PNG color type " + std::to_string(color_type));
        }
    }

} // namespace

namespace imgscrub {

    ImageBuffer PngCodec::decode(const std::span<const std::uint8_t> data) const {
        Logger::log(LogLevel::Debug, "Start PNG decode: " + std::to_string(data.size()) + " bytes", "png_codec");

        if (data.size() < 8 || png_sig_cmp(data.data(), 0, 8) != 0) {
            throw DecodeError("PngCodec: missing PNG signature (" + std::to_string(data.size()) + " bytes)");
        }

        ImageBuffer out;
        out.source_mime = "image/png";

        try {
            PngRead rd;
            rd.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
            if (!rd.png) throw std::runtime_error("png_create_read_struct failed");
            rd.info = png_create_info_struct(rd.png);
            if (!rd.info) throw std::runtime_error("png_create_info_struct failed");
            if (setjmp(png_jmpbuf(rd.png))) throw std::runtime_error("libpng read error");

            MemoryReader reader{data.data(), data.size(), 0};
            png_set_read_fn(rd.png, &reader, read_from_memory);

            // surface private chunks too, a sanitizer must see what it removes
            png_set_keep_unknown_chunks(rd.png, PNG_HANDLE_CHUNK_ALWAYS, nullptr, 0);

            png_read_info(rd.png, rd.info);

            png_uint_32 width = 0, height = 0;
            int bit_depth = 0, color_type = 0, interlace = 0;
            png_get_IHDR(rd.png, rd.info, &width, &height, &bit_depth, &color_type, &interlace, nullptr, nullptr);

            if (bit_depth == 16) png_set_strip_16(rd.png);
            if (bit_depth < 8) {
                if (color_type == PNG_COLOR_TYPE_GRAY) png_set_expand_gray_1_2_4_to_8(rd.png);
                else png_set_packing(rd.png);
            }
            if (color_type != PNG_COLOR_TYPE_PALETTE && png_get_valid(rd.png, rd.info, PNG_INFO_tRNS)) {
                png_set_tRNS_to_alpha(rd.png);
            }
            if (interlace != PNG_INTERLACE_NONE) png_set_interlace_handling(rd.png);

            png_read_update_info(rd.png, rd.info);

            Raster& raster = out.raster;
            raster.mode = mode_from_png(png_get_color_type(rd.png, rd.info));
            raster.width = width;
            raster.height = height;

            const std::size_t rowbytes = png_get_rowbytes(rd.png, rd.info);
            if (rowbytes != raster.row_bytes()) {
                throw std::runtime_error("rowbytes mismatch after transformations");
            }

            if (raster.mode == ColorMode::Palette) {
                png_colorp plte = nullptr;
                int num_plte = 0;
                png_get_PLTE(rd.png, rd.info, &plte, &num_plte);
                png_bytep trans_alpha = nullptr;
                int num_trans = 0;
                if (png_get_valid(rd.png, rd.info, PNG_INFO_tRNS)) {
                    png_get_tRNS(rd.png, rd.info, &trans_alpha, &num_trans, nullptr);
                }
                // out-of-range indices are legal in a corrupt file, pad to 256
                raster.palette.assign(256, PaletteEntry{});
                for (int i = 0; i < num_plte && plte; ++i) {
                    raster.palette[i] = {plte[i].red, plte[i].green, plte[i].blue, 255};
                }
                for (int i = 0; i < num_trans && trans_alpha; ++i) {
                    raster.palette[i].a = trans_alpha[i];
                }
            }

            raster.pixels.resize(raster.expected_size());
            std::vector<png_bytep> row_pointers(height);
            for (png_uint_32 y = 0; y < height; ++y) {
                row_pointers[y] = raster.pixels.data() + y * rowbytes;
            }

            png_read_image(rd.png, row_pointers.data());
            png_read_end(rd.png, rd.info);

            collect_metadata(rd.png, rd.info, out.metadata);
        } catch (const Error&) {
            throw;
        } catch (const std::exception& e) {
            throw DecodeError(std::string("PngCodec: ") + e.what() +
                              " (" + std::to_string(data.size()) + " bytes)");
        }

        Logger::log(LogLevel::Debug,
                    "PNG decoded: " + std::to_string(out.raster.width) + "x" + std::to_string(out.raster.height) +
                    " " + std::string(color_mode_name(out.raster.mode)) +
                    ", metadata entries: " + std::to_string(out.metadata.entry_count()),
                    "png_codec");
        return out;
    }

    std::vector<std::uint8_t> PngCodec::encode(const Raster& raster) const {
        int color_type = 0;
        switch (raster.mode) {
            case ColorMode::Rgb:       color_type = PNG_COLOR_TYPE_RGB; break;
            case ColorMode::Grayscale: color_type = PNG_COLOR_TYPE_GRAY; break;
            default:
                throw EncodeError("PngCodec: refusing to encode color mode " +
                                  std::string(color_mode_name(raster.mode)));
        }
        if (raster.width == 0 || raster.height == 0 || raster.pixels.size() != raster.expected_size()) {
            throw EncodeError("PngCodec: raster size does not match its dimensions");
        }

        std::vector<std::uint8_t> out;
        try {
            PngWrite wr;
            wr.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
            if (!wr.png) throw std::runtime_error("png_create_write_struct failed");
            wr.info = png_create_info_struct(wr.png);
            if (!wr.info) throw std::runtime_error("png_create_info_struct failed");
            if (setjmp(png_jmpbuf(wr.png))) throw std::runtime_error("libpng write error");

            png_set_write_fn(wr.png, &out, write_to_vector, flush_noop);

            // set max compression
            png_set_compression_level(wr.png, 9);
            png_set_compression_mem_level(wr.png, 9);
            png_set_compression_strategy(wr.png, Z_DEFAULT_STRATEGY);
            png_set_filter(wr.png, PNG_FILTER_TYPE_BASE, PNG_ALL_FILTERS);

            png_set_IHDR(wr.png, wr.info, raster.width, raster.height, 8, color_type,
                         PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);

            // nothing but IHDR is set on wr.info: no iCCP, no text, no eXIf
            png_write_info(wr.png, wr.info);

            const std::size_t rowbytes = raster.row_bytes();
            for (std::uint32_t y = 0; y < raster.height; ++y) {
                png_write_row(wr.png, raster.pixels.data() + y * rowbytes);
            }

            png_write_end(wr.png, nullptr);
        } catch (const std::exception& e) {
            throw EncodeError(std::string("PngCodec: ") + e.what());
        }

        Logger::log(LogLevel::Debug, "PNG encoded: " + std::to_string(out.size()) + " bytes", "png_codec");
        return out;
    }

} // namespace imgscrub
