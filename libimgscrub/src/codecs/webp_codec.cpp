//
// Created by Giuseppe Francione on 19/10/25.
//

#include "../../include/webp_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <webp/decode.h>
#include <webp/encode.h>
#include <webp/mux.h>
#include <algorithm>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

    // lossless preset, 0 (fast) .. 9 (smallest)
    constexpr int kLosslessLevel = 6;

    struct WebPFreer {
        void operator()(std::uint8_t* p) const { if (p) WebPFree(p); }
    };
    using unique_webp_bytes = std::unique_ptr<std::uint8_t, WebPFreer>;

    struct MuxDeleter {
        void operator()(WebPMux* m) const { if (m) WebPMuxDelete(m); }
    };
    using unique_mux = std::unique_ptr<WebPMux, MuxDeleter>;

    /**
     * @brief RAII wrapper for a WebPPicture and the memory writer it feeds.
     */
    struct PictureWriter {
        WebPPicture picture{};
        WebPMemoryWriter writer{};
        bool picture_ok = false;

        PictureWriter() {
            WebPMemoryWriterInit(&writer);
            picture_ok = WebPPictureInit(&picture) != 0;
        }

        ~PictureWriter() {
            if (picture_ok) WebPPictureFree(&picture);
            WebPMemoryWriterClear(&writer);
        }

        PictureWriter(const PictureWriter&) = delete;
        PictureWriter& operator=(const PictureWriter&) = delete;
    };

    std::vector<std::uint8_t> chunk_bytes(const WebPMux* mux, const char fourcc[4]) {
        WebPData chunk{nullptr, 0};
        if (WebPMuxGetChunk(mux, fourcc, &chunk) != WEBP_MUX_OK || !chunk.bytes) return {};
        return {chunk.bytes, chunk.bytes + chunk.size};
    }

    /**
     * @brief Copies EXIF, XMP and ICCP chunks of an extended file into @p meta.
     *
     * Simple files (no VP8X header) cannot carry them, libwebpmux then
     * reports no chunks and @p meta stays empty.
     */
    void collect_metadata(const std::span<const std::uint8_t> data, imgscrub::ImageMetadata& meta) {
        const WebPData input{data.data(), data.size()};
        const unique_mux mux(WebPMuxCreate(&input, 0));
        if (!mux) {
            Logger::log(LogLevel::Warning, "WebPMuxCreate failed, metadata chunks not inspected", "webp_codec");
            return;
        }

        meta.exif = chunk_bytes(mux.get(), "EXIF");
        // some writers keep the JPEG APP1 prefix in the chunk
        constexpr std::uint8_t kExifPrefix[] = {'E', 'x', 'i', 'f', 0, 0};
        if (meta.exif.size() >= sizeof(kExifPrefix) &&
            std::equal(std::begin(kExifPrefix), std::end(kExifPrefix), meta.exif.begin())) {
            meta.exif.erase(meta.exif.begin(), meta.exif.begin() + sizeof(kExifPrefix));
        }

        const auto xmp = chunk_bytes(mux.get(), "XMP ");
        meta.xmp.assign(xmp.begin(), xmp.end());

        meta.icc_profile = chunk_bytes(mux.get(), "ICCP");
    }

} // namespace

namespace imgscrub {

    ImageBuffer WebpCodec::decode(const std::span<const std::uint8_t> data) const {
        Logger::log(LogLevel::Debug, "Start WebP decode: " + std::to_string(data.size()) + " bytes", "webp_codec");

        ImageBuffer out;
        out.source_mime = "image/webp";

        try {
            // inspect bitstream features
            WebPBitstreamFeatures features;
            if (WebPGetFeatures(data.data(), data.size(), &features) != VP8_STATUS_OK) {
                throw std::runtime_error("feature detection failed");
            }
            if (features.has_animation) {
                throw std::runtime_error("animated WebP is not supported");
            }

            int width = 0, height = 0;
            const bool alpha = features.has_alpha != 0;
            const unique_webp_bytes decoded(
                alpha ? WebPDecodeRGBA(data.data(), data.size(), &width, &height)
                      : WebPDecodeRGB(data.data(), data.size(), &width, &height));
            if (!decoded || width <= 0 || height <= 0) {
                throw std::runtime_error(alpha ? "decode failed (RGBA)" : "decode failed (RGB)");
            }

            Raster& raster = out.raster;
            raster.mode = alpha ? ColorMode::Rgba : ColorMode::Rgb;
            raster.width = static_cast<std::uint32_t>(width);
            raster.height = static_cast<std::uint32_t>(height);
            raster.pixels.assign(decoded.get(), decoded.get() + raster.expected_size());

            collect_metadata(data, out.metadata);
        } catch (const Error&) {
            throw;
        } catch (const std::exception& e) {
            throw DecodeError(std::string("WebpCodec: ") + e.what() +
                              " (" + std::to_string(data.size()) + " bytes)");
        }

        Logger::log(LogLevel::Debug,
                    "WebP decoded: " + std::to_string(out.raster.width) + "x" + std::to_string(out.raster.height) +
                    " " + std::string(color_mode_name(out.raster.mode)) +
                    ", metadata entries: " + std::to_string(out.metadata.entry_count()),
                    "webp_codec");
        return out;
    }

    std::vector<std::uint8_t> WebpCodec::encode(const Raster& raster) const {
        if (raster.mode != ColorMode::Rgb && raster.mode != ColorMode::Grayscale) {
            throw EncodeError("WebpCodec: refusing to encode color mode " +
                              std::string(color_mode_name(raster.mode)));
        }
        if (raster.width == 0 || raster.height == 0 || raster.pixels.size() != raster.expected_size()) {
            throw EncodeError("WebpCodec: raster size does not match its dimensions");
        }
        if (raster.width > WEBP_MAX_DIMENSION || raster.height > WEBP_MAX_DIMENSION) {
            throw EncodeError("WebpCodec: image exceeds the WebP dimension limit");
        }

        // webp has no gray layout, replicate the sample
        std::vector<std::uint8_t> expanded;
        const std::uint8_t* rgb = raster.pixels.data();
        if (raster.mode == ColorMode::Grayscale) {
            expanded.reserve(raster.pixels.size() * 3);
            for (const std::uint8_t v : raster.pixels) {
                expanded.insert(expanded.end(), {v, v, v});
            }
            rgb = expanded.data();
        }

        WebPConfig config;
        if (!WebPConfigInit(&config)) {
            throw EncodeError("WebpCodec: WebPConfigInit failed");
        }
        if (!WebPConfigLosslessPreset(&config, kLosslessLevel)) {
            throw EncodeError("WebpCodec: WebPConfigLosslessPreset failed");
        }

        PictureWriter pw;
        if (!pw.picture_ok) {
            throw EncodeError("WebpCodec: WebPPictureInit failed");
        }
        pw.picture.use_argb = 1;
        pw.picture.width = static_cast<int>(raster.width);
        pw.picture.height = static_cast<int>(raster.height);
        if (!WebPPictureImportRGB(&pw.picture, rgb, static_cast<int>(raster.width) * 3)) {
            throw EncodeError("WebpCodec: WebPPictureImportRGB failed");
        }

        pw.picture.writer = WebPMemoryWrite;
        pw.picture.custom_ptr = &pw.writer;

        // no mux step: the encoder writes RIFF + VP8L and nothing else
        if (!WebPEncode(&config, &pw.picture)) {
            throw EncodeError("WebpCodec: WebPEncode failed (error " +
                              std::to_string(static_cast<int>(pw.picture.error_code)) + ")");
        }

        std::vector<std::uint8_t> out(pw.writer.mem, pw.writer.mem + pw.writer.size);
        Logger::log(LogLevel::Debug, "WebP encoded: " + std::to_string(out.size()) + " bytes", "webp_codec");
        return out;
    }

} // namespace imgscrub
