//
// Created by Giuseppe Francione on 11/12/25.
//

#include "test_images.hpp"
#include "../libimgscrub/include/random_utils.hpp"
#include <webp/decode.h>
#include <webp/encode.h>
#include <webp/mux.h>
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace {

    [[noreturn]] void png_throw(png_structp, const png_const_charp msg) {
        throw std::runtime_error(std::string("fixture libpng: ") + msg);
    }

    void png_quiet(png_structp, png_const_charp) {}

    void png_append(png_structp png, const png_bytep data, const png_size_t len) {
        auto* out = static_cast<std::vector<std::uint8_t>*>(png_get_io_ptr(png));
        out->insert(out->end(), data, data + len);
    }

    void png_flush_noop(png_structp) {}

    struct PngWriter {
        png_structp png = nullptr;
        png_infop info = nullptr;
        ~PngWriter() { if (png) png_destroy_write_struct(&png, &info); }
    };

    [[noreturn]] void jpeg_throw(const j_common_ptr cinfo) {
        char msg[JMSG_LENGTH_MAX];
        (*cinfo->err->format_message)(cinfo, msg);
        throw std::runtime_error(std::string("fixture libjpeg: ") + msg);
    }

    struct JpegWriter {
        jpeg_compress_struct cinfo{};
        jpeg_error_mgr err{};
        unsigned char* buffer = nullptr;
        unsigned long size = 0;

        JpegWriter() {
            cinfo.err = jpeg_std_error(&err);
            err.error_exit = jpeg_throw;
            jpeg_create_compress(&cinfo);
        }
        ~JpegWriter() {
            jpeg_destroy_compress(&cinfo);
            std::free(buffer);
        }
    };

    unsigned png_channels(const int color_type) {
        switch (color_type) {
            case PNG_COLOR_TYPE_GRAY_ALPHA: return 2;
            case PNG_COLOR_TYPE_RGB: return 3;
            case PNG_COLOR_TYPE_RGB_ALPHA: return 4;
            default: return 1;
        }
    }

    void write_marker(JpegWriter& w, const int marker, const std::string& prefix,
                      const std::uint8_t* data, const std::size_t len) {
        std::vector<std::uint8_t> payload(prefix.begin(), prefix.end());
        payload.insert(payload.end(), data, data + len);
        jpeg_write_marker(&w.cinfo, marker, payload.data(), static_cast<unsigned>(payload.size()));
    }

} // namespace

namespace test_images {

std::uint8_t pattern(const std::uint32_t x, const std::uint32_t y, const unsigned channel) {
    return static_cast<std::uint8_t>((x * 7 + y * 13 + channel * 50) & 0xFF);
}

std::vector<std::uint8_t> make_png(const PngFixture& fx) {
    std::vector<std::uint8_t> out;
    PngWriter w;
    w.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, png_throw, png_quiet);
    w.info = png_create_info_struct(w.png);
    png_set_write_fn(w.png, &out, png_append, png_flush_noop);

    png_set_IHDR(w.png, w.info, fx.width, fx.height, fx.bit_depth, fx.color_type,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);

    if (fx.color_type == PNG_COLOR_TYPE_PALETTE) {
        png_set_PLTE(w.png, w.info, fx.palette.data(), static_cast<int>(fx.palette.size()));
        if (!fx.trns.empty()) {
            png_set_tRNS(w.png, w.info, fx.trns.data(), static_cast<int>(fx.trns.size()), nullptr);
        }
    }

    // owned copies, png_text wants mutable char*
    std::vector<std::string> keys, values;
    for (const auto& [k, v] : fx.text) {
        keys.push_back(k);
        values.push_back(v);
    }
    std::string xmp_key = "XML:com.adobe.xmp";
    std::string xmp = fx.xmp;
    std::string empty;

    std::vector<png_text> texts;
    for (std::size_t i = 0; i < keys.size(); ++i) {
        png_text t{};
        t.compression = PNG_TEXT_COMPRESSION_NONE;
        t.key = keys[i].data();
        t.text = values[i].data();
        t.text_length = values[i].size();
        texts.push_back(t);
    }
    if (!xmp.empty()) {
        png_text t{};
        t.compression = PNG_ITXT_COMPRESSION_NONE;
        t.key = xmp_key.data();
        t.text = xmp.data();
        t.itxt_length = xmp.size();
        t.lang = empty.data();
        t.lang_key = empty.data();
        texts.push_back(t);
    }
    if (!texts.empty()) {
        png_set_text(w.png, w.info, texts.data(), static_cast<int>(texts.size()));
    }

    std::vector<std::uint8_t> exif = fx.exif;
    if (!exif.empty()) {
        png_set_eXIf_1(w.png, w.info, static_cast<png_uint_32>(exif.size()), exif.data());
    }
    if (fx.time) {
        png_time t{2023, 5, 17, 10, 20, 30};
        png_set_tIME(w.png, w.info, &t);
    }
    if (fx.gamma) {
        png_set_gAMA(w.png, w.info, 1.0 / 2.2);
    }

    png_unknown_chunk private_chunk{};
    std::uint8_t private_data[] = {'o', 'w', 'n', 'e', 'r', '=', 'j', 'd'};
    if (fx.private_chunk) {
        png_set_keep_unknown_chunks(w.png, PNG_HANDLE_CHUNK_ALWAYS, nullptr, 0);
        std::memcpy(private_chunk.name, "prVt", 5);
        private_chunk.data = private_data;
        private_chunk.size = sizeof(private_data);
        private_chunk.location = PNG_AFTER_IDAT;
        png_set_unknown_chunks(w.png, w.info, &private_chunk, 1);
        png_set_unknown_chunk_location(w.png, w.info, 0, PNG_AFTER_IDAT);
    }

    png_write_info(w.png, w.info);

    const unsigned ch = png_channels(fx.color_type);
    const std::size_t sample_bytes = fx.bit_depth == 16 ? 2 : 1;
    const std::size_t row_bytes = static_cast<std::size_t>(fx.width) * ch * sample_bytes;

    std::vector<std::uint8_t> row(row_bytes);
    for (std::uint32_t y = 0; y < fx.height; ++y) {
        if (!fx.pixels.empty()) {
            std::memcpy(row.data(), fx.pixels.data() + y * row_bytes, row_bytes);
        } else {
            for (std::uint32_t x = 0; x < fx.width; ++x) {
                for (unsigned c = 0; c < ch; ++c) {
                    std::uint8_t v = pattern(x, y, c);
                    if (fx.color_type == PNG_COLOR_TYPE_PALETTE) {
                        v = static_cast<std::uint8_t>((x + y) % fx.palette.size());
                    }
                    const std::size_t at = (static_cast<std::size_t>(x) * ch + c) * sample_bytes;
                    row[at] = v;
                    if (sample_bytes == 2) row[at + 1] = v; // v * 257, big endian
                }
            }
        }
        png_write_row(w.png, row.data());
    }
    png_write_end(w.png, w.info);
    return out;
}

std::vector<std::uint8_t> make_jpeg(const JpegFixture& fx) {
    JpegWriter w;
    jpeg_mem_dest(&w.cinfo, &w.buffer, &w.size);

    const int components = fx.color_space == JCS_GRAYSCALE ? 1 : fx.color_space == JCS_CMYK ? 4 : 3;
    w.cinfo.image_width = fx.width;
    w.cinfo.image_height = fx.height;
    w.cinfo.input_components = components;
    w.cinfo.in_color_space = fx.color_space;
    jpeg_set_defaults(&w.cinfo);
    jpeg_set_quality(&w.cinfo, fx.quality, TRUE);
    jpeg_start_compress(&w.cinfo, TRUE);

    if (!fx.exif.empty()) {
        write_marker(w, JPEG_APP0 + 1, std::string("Exif\0\0", 6), fx.exif.data(), fx.exif.size());
    }
    if (!fx.xmp.empty()) {
        write_marker(w, JPEG_APP0 + 1, std::string("http://ns.adobe.com/xap/1.0/\0", 29),
                     reinterpret_cast<const std::uint8_t*>(fx.xmp.data()), fx.xmp.size());
    }
    if (!fx.icc.empty()) {
        constexpr std::size_t kSegment = 65519;
        const std::size_t count = (fx.icc.size() + kSegment - 1) / kSegment;
        for (std::size_t i = 0; i < count; ++i) {
            std::string prefix("ICC_PROFILE\0", 12);
            prefix.push_back(static_cast<char>(i + 1));
            prefix.push_back(static_cast<char>(count));
            const std::size_t len = std::min(kSegment, fx.icc.size() - i * kSegment);
            write_marker(w, JPEG_APP0 + 2, prefix, fx.icc.data() + i * kSegment, len);
        }
    }
    if (fx.app13) {
        const std::uint8_t irb[] = {'8', 'B', 'I', 'M', 0x04, 0x04, 0, 0, 0, 0, 0, 4, 'j', 'd', 'o', 'e'};
        write_marker(w, JPEG_APP0 + 13, std::string("Photoshop 3.0\0", 14), irb, sizeof(irb));
    }
    if (!fx.comment.empty()) {
        jpeg_write_marker(&w.cinfo, JPEG_COM, reinterpret_cast<const JOCTET*>(fx.comment.data()),
                          static_cast<unsigned>(fx.comment.size()));
    }

    std::vector<std::uint8_t> row(static_cast<std::size_t>(fx.width) * components);
    while (w.cinfo.next_scanline < w.cinfo.image_height) {
        const std::uint32_t y = w.cinfo.next_scanline;
        for (std::uint32_t x = 0; x < fx.width; ++x) {
            for (int c = 0; c < components; ++c) {
                row[static_cast<std::size_t>(x) * components + c] =
                    fx.solid.empty() ? pattern(x, y, static_cast<unsigned>(c)) : fx.solid[c];
            }
        }
        JSAMPROW ptr = row.data();
        jpeg_write_scanlines(&w.cinfo, &ptr, 1);
    }
    jpeg_finish_compress(&w.cinfo);

    return {w.buffer, w.buffer + w.size};
}

std::vector<std::uint8_t> make_webp(const WebpFixture& fx) {
    const unsigned channels = fx.alpha ? 4 : 3;
    std::vector<std::uint8_t> pixels(static_cast<std::size_t>(fx.width) * fx.height * channels);
    for (std::uint32_t y = 0; y < fx.height; ++y) {
        for (std::uint32_t x = 0; x < fx.width; ++x) {
            for (unsigned c = 0; c < channels; ++c) {
                pixels[(static_cast<std::size_t>(y) * fx.width + x) * channels + c] = pattern(x, y, c);
            }
        }
    }

    const int w = static_cast<int>(fx.width);
    const int h = static_cast<int>(fx.height);
    const int stride = w * static_cast<int>(channels);
    std::uint8_t* encoded = nullptr;
    std::size_t size = 0;
    if (fx.lossless) {
        size = fx.alpha ? WebPEncodeLosslessRGBA(pixels.data(), w, h, stride, &encoded)
                        : WebPEncodeLosslessRGB(pixels.data(), w, h, stride, &encoded);
    } else {
        size = fx.alpha ? WebPEncodeRGBA(pixels.data(), w, h, stride, 90.0f, &encoded)
                        : WebPEncodeRGB(pixels.data(), w, h, stride, 90.0f, &encoded);
    }
    if (size == 0 || !encoded) throw std::runtime_error("libwebp failed to encode fixture");
    std::vector<std::uint8_t> bitstream(encoded, encoded + size);
    WebPFree(encoded);

    if (fx.exif.empty() && fx.icc.empty() && fx.xmp.empty()) return bitstream;

    const WebPData image{bitstream.data(), bitstream.size()};
    WebPMux* mux = WebPMuxCreate(&image, 1);
    if (!mux) throw std::runtime_error("WebPMuxCreate failed for fixture");
    auto set_chunk = [mux](const char* fourcc, const std::uint8_t* data, const std::size_t len) {
        const WebPData chunk{data, len};
        if (WebPMuxSetChunk(mux, fourcc, &chunk, 1) != WEBP_MUX_OK) {
            WebPMuxDelete(mux);
            throw std::runtime_error(std::string("WebPMuxSetChunk failed for ") + fourcc);
        }
    };
    if (!fx.exif.empty()) set_chunk("EXIF", fx.exif.data(), fx.exif.size());
    if (!fx.icc.empty()) set_chunk("ICCP", fx.icc.data(), fx.icc.size());
    if (!fx.xmp.empty()) {
        set_chunk("XMP ", reinterpret_cast<const std::uint8_t*>(fx.xmp.data()), fx.xmp.size());
    }

    WebPData assembled{nullptr, 0};
    const WebPMuxError err = WebPMuxAssemble(mux, &assembled);
    WebPMuxDelete(mux);
    if (err != WEBP_MUX_OK) throw std::runtime_error("WebPMuxAssemble failed for fixture");
    std::vector<std::uint8_t> out(assembled.bytes, assembled.bytes + assembled.size);
    WebPDataClear(&assembled);
    return out;
}

std::vector<std::uint8_t> make_exif(const bool big_endian) {
    struct Entry {
        std::uint16_t tag;
        std::uint16_t type;
        std::uint32_t count;
        std::vector<std::uint8_t> value;
    };

    auto put16 = [big_endian](std::vector<std::uint8_t>& v, const std::uint16_t x) {
        if (big_endian) { v.push_back(x >> 8); v.push_back(x & 0xFF); }
        else { v.push_back(x & 0xFF); v.push_back(x >> 8); }
    };
    auto put32 = [big_endian](std::vector<std::uint8_t>& v, const std::uint32_t x) {
        for (int i = 0; i < 4; ++i) {
            const int shift = big_endian ? 24 - 8 * i : 8 * i;
            v.push_back(static_cast<std::uint8_t>(x >> shift));
        }
    };
    auto ascii = [](const std::uint16_t tag, const std::string& s) {
        std::vector<std::uint8_t> v(s.begin(), s.end());
        v.push_back(0);
        return Entry{tag, 2, static_cast<std::uint32_t>(v.size()), v};
    };
    auto long_entry = [&](const std::uint16_t tag, const std::uint32_t x) {
        std::vector<std::uint8_t> v;
        put32(v, x);
        return Entry{tag, 4, 1, v};
    };
    auto short_entry = [&](const std::uint16_t tag, const std::uint16_t x) {
        std::vector<std::uint8_t> v;
        put16(v, x);
        return Entry{tag, 3, 1, v};
    };

    auto ifd_size = [](const std::size_t n) { return static_cast<std::uint32_t>(2 + n * 12 + 4); };
    const std::uint32_t ifd0_off = 8;
    const std::uint32_t exif_off = ifd0_off + ifd_size(6);
    const std::uint32_t gps_off = exif_off + ifd_size(2);
    const std::uint32_t data_off = gps_off + ifd_size(1);

    const std::vector<Entry> ifd0 = {
        ascii(0x010F, "Canon"),
        ascii(0x0110, "EOS 5D Mark IV"),
        ascii(0x0131, "Adobe Lightroom"),
        ascii(0x0132, "2023:05:17 10:20:30"),
        long_entry(0x8769, exif_off),
        long_entry(0x8825, gps_off),
    };
    const std::vector<Entry> exif = {
        ascii(0x9003, "2023:05:17 10:20:30"),
        short_entry(0xC000, 7),
    };
    const std::vector<Entry> gps = {
        ascii(0x0001, "N"),
    };

    std::vector<std::uint8_t> out;
    if (big_endian) { out.push_back('M'); out.push_back('M'); }
    else { out.push_back('I'); out.push_back('I'); }
    put16(out, 42);
    put32(out, ifd0_off);

    std::vector<std::uint8_t> data;
    auto emit = [&](const std::vector<Entry>& ifd) {
        put16(out, static_cast<std::uint16_t>(ifd.size()));
        for (const auto& e : ifd) {
            put16(out, e.tag);
            put16(out, e.type);
            put32(out, e.count);
            if (e.value.size() <= 4) {
                std::vector<std::uint8_t> v = e.value;
                v.resize(4, 0);
                out.insert(out.end(), v.begin(), v.end());
            } else {
                put32(out, data_off + static_cast<std::uint32_t>(data.size()));
                data.insert(data.end(), e.value.begin(), e.value.end());
            }
        }
        put32(out, 0);
    };
    emit(ifd0);
    emit(exif);
    emit(gps);
    out.insert(out.end(), data.begin(), data.end());
    return out;
}

std::vector<std::uint8_t> make_icc(const std::size_t size) {
    std::vector<std::uint8_t> icc(size);
    for (std::size_t i = 0; i < size; ++i) {
        icc[i] = static_cast<std::uint8_t>((i * 31 + 7) & 0xFF);
    }
    if (size >= 40) {
        icc[0] = static_cast<std::uint8_t>(size >> 24);
        icc[1] = static_cast<std::uint8_t>(size >> 16);
        icc[2] = static_cast<std::uint8_t>(size >> 8);
        icc[3] = static_cast<std::uint8_t>(size);
        std::memcpy(icc.data() + 36, "acsp", 4);
    }
    return icc;
}

std::string make_xmp() {
    return R"(<?xpacket begin="" id="W5M0MpCehiHzreSzNTczkc9d"?>)"
           R"(<x:xmpmeta xmlns:x="adobe:ns:meta/"><rdf:RDF xmlns:rdf="http://www.w3.org/1999/02/22-rdf-syntax-ns#">)"
           R"(<rdf:Description xmlns:dc="http://purl.org/dc/elements/1.1/" dc:creator="Jane Doe"/>)"
           R"(</rdf:RDF></x:xmpmeta><?xpacket end="w"?>)";
}

std::vector<std::string> png_chunk_types(const std::span<const std::uint8_t> png) {
    std::vector<std::string> types;
    std::size_t pos = 8;
    while (pos + 8 <= png.size()) {
        const std::uint32_t len = static_cast<std::uint32_t>(png[pos]) << 24 |
                                  static_cast<std::uint32_t>(png[pos + 1]) << 16 |
                                  static_cast<std::uint32_t>(png[pos + 2]) << 8 |
                                  static_cast<std::uint32_t>(png[pos + 3]);
        types.emplace_back(reinterpret_cast<const char*>(png.data() + pos + 4), 4);
        pos += 12 + static_cast<std::size_t>(len);
    }
    return types;
}

std::vector<std::string> riff_chunk_types(const std::span<const std::uint8_t> webp) {
    std::vector<std::string> types;
    std::size_t pos = 12; // "RIFF" size "WEBP"
    while (pos + 8 <= webp.size()) {
        const std::uint32_t len = static_cast<std::uint32_t>(webp[pos + 4]) |
                                  static_cast<std::uint32_t>(webp[pos + 5]) << 8 |
                                  static_cast<std::uint32_t>(webp[pos + 6]) << 16 |
                                  static_cast<std::uint32_t>(webp[pos + 7]) << 24;
        types.emplace_back(reinterpret_cast<const char*>(webp.data() + pos), 4);
        pos += 8 + static_cast<std::size_t>(len) + (len & 1u); // chunks are padded to even size
    }
    return types;
}

std::vector<int> jpeg_markers(const std::span<const std::uint8_t> jpeg) {
    std::vector<int> markers;
    std::size_t pos = 2; // after SOI
    while (pos + 1 < jpeg.size()) {
        if (jpeg[pos] != 0xFF) break;
        while (pos < jpeg.size() && jpeg[pos] == 0xFF) ++pos; // fill bytes
        if (pos >= jpeg.size()) break;
        const int marker = jpeg[pos++];
        markers.push_back(marker);
        if (marker == 0xDA || marker == 0xD9) break;
        if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) continue;
        if (pos + 2 > jpeg.size()) break;
        const std::size_t len = static_cast<std::size_t>(jpeg[pos]) << 8 | jpeg[pos + 1];
        pos += len;
    }
    return markers;
}

bool contains(const std::span<const std::uint8_t> haystack, const std::string_view needle) {
    return std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                       [](const std::uint8_t a, const char b) { return a == static_cast<unsigned char>(b); })
           != haystack.end();
}

void write_file(const std::filesystem::path& path, const std::span<const std::uint8_t> data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) throw std::runtime_error("cannot write fixture " + path.string());
}

TempDir::TempDir()
    : path_(std::filesystem::temp_directory_path() / ("imgscrub-test-" + RandomUtils::random_hex(12))) {
    std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

} // namespace test_images
