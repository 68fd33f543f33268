//
// Created by Giuseppe Francione on 08/12/25.
//

#include "../../include/exif_reader.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <sstream>
#include <unordered_map>

namespace {

    constexpr std::uint16_t kExifIfdPointer = 0x8769;
    constexpr std::uint16_t kGpsIfdPointer = 0x8825;
    constexpr std::size_t kEntrySize = 12;
    constexpr std::size_t kMaxEntriesPerIfd = 1024;

    enum TiffType : std::uint16_t {
        Byte = 1, Ascii = 2, Short = 3, Long = 4, Rational = 5,
        SByte = 6, Undefined = 7, SShort = 8, SLong = 9, SRational = 10,
        Float = 11, Double = 12
    };

    std::size_t type_size(const std::uint16_t type) {
        switch (type) {
            case Byte: case Ascii: case SByte: case Undefined: return 1;
            case Short: case SShort: return 2;
            case Long: case SLong: case Float: return 4;
            case Rational: case SRational: case Double: return 8;
            default: return 0;
        }
    }

    const std::unordered_map<std::uint16_t, std::string_view> kTagNames = {
        {0x0100, "ImageWidth"}, {0x0101, "ImageLength"}, {0x0102, "BitsPerSample"},
        {0x0103, "Compression"}, {0x0106, "PhotometricInterpretation"},
        {0x010E, "ImageDescription"}, {0x010F, "Make"}, {0x0110, "Model"},
        {0x0111, "StripOffsets"}, {0x0112, "Orientation"}, {0x0115, "SamplesPerPixel"},
        {0x0116, "RowsPerStrip"}, {0x0117, "StripByteCounts"}, {0x011A, "XResolution"},
        {0x011B, "YResolution"}, {0x011C, "PlanarConfiguration"}, {0x0128, "ResolutionUnit"},
        {0x0131, "Software"}, {0x0132, "DateTime"}, {0x013B, "Artist"},
        {0x013C, "HostComputer"}, {0x013E, "WhitePoint"}, {0x013F, "PrimaryChromaticities"},
        {0x0201, "JpegIFOffset"}, {0x0202, "JpegIFByteCount"}, {0x0211, "YCbCrCoefficients"},
        {0x0213, "YCbCrPositioning"}, {0x0214, "ReferenceBlackWhite"}, {0x8298, "Copyright"},
        {0x829A, "ExposureTime"}, {0x829D, "FNumber"}, {0x8769, "ExifOffset"},
        {0x8822, "ExposureProgram"}, {0x8825, "GPSInfo"}, {0x8827, "ISOSpeedRatings"},
        {0x9000, "ExifVersion"}, {0x9003, "DateTimeOriginal"}, {0x9004, "DateTimeDigitized"},
        {0x9010, "OffsetTime"}, {0x9011, "OffsetTimeOriginal"}, {0x9012, "OffsetTimeDigitized"},
        {0x9101, "ComponentsConfiguration"}, {0x9102, "CompressedBitsPerPixel"},
        {0x9201, "ShutterSpeedValue"}, {0x9202, "ApertureValue"}, {0x9203, "BrightnessValue"},
        {0x9204, "ExposureBiasValue"}, {0x9205, "MaxApertureValue"}, {0x9206, "SubjectDistance"},
        {0x9207, "MeteringMode"}, {0x9208, "LightSource"}, {0x9209, "Flash"},
        {0x920A, "FocalLength"}, {0x927C, "MakerNote"}, {0x9286, "UserComment"},
        {0x9290, "SubsecTime"}, {0x9291, "SubsecTimeOriginal"}, {0x9292, "SubsecTimeDigitized"},
        {0xA000, "FlashPixVersion"}, {0xA001, "ColorSpace"}, {0xA002, "ExifImageWidth"},
        {0xA003, "ExifImageHeight"}, {0xA005, "ExifInteroperabilityOffset"},
        {0xA20E, "FocalPlaneXResolution"}, {0xA20F, "FocalPlaneYResolution"},
        {0xA210, "FocalPlaneResolutionUnit"}, {0xA217, "SensingMethod"}, {0xA300, "FileSource"},
        {0xA301, "SceneType"}, {0xA401, "CustomRendered"}, {0xA402, "ExposureMode"},
        {0xA403, "WhiteBalance"}, {0xA404, "DigitalZoomRatio"}, {0xA405, "FocalLengthIn35mmFilm"},
        {0xA406, "SceneCaptureType"}, {0xA420, "ImageUniqueID"}, {0xA430, "CameraOwnerName"},
        {0xA431, "BodySerialNumber"}, {0xA432, "LensSpecification"}, {0xA433, "LensMake"},
        {0xA434, "LensModel"}, {0xA435, "LensSerialNumber"},
    };

    /**
     * @brief Bounds-checked, byte-order aware view over a TIFF block.
     */
    class TiffView {
    public:
        explicit TiffView(const std::span<const std::uint8_t> data) : data_(data) {}

        bool init() {
            if (data_.size() < 8) return false;
            if (data_[0] == 'I' && data_[1] == 'I') little_ = true;
            else if (data_[0] == 'M' && data_[1] == 'M') little_ = false;
            else return false;
            return u16(2) == 42;
        }

        [[nodiscard]] bool has(const std::size_t offset, const std::size_t len) const {
            return offset <= data_.size() && len <= data_.size() - offset;
        }

        [[nodiscard]] std::uint16_t u16(const std::size_t off) const {
            if (!has(off, 2)) return 0;
            return little_ ? static_cast<std::uint16_t>(data_[off] | data_[off + 1] << 8)
                           : static_cast<std::uint16_t>(data_[off] << 8 | data_[off + 1]);
        }

        [[nodiscard]] std::uint32_t u32(const std::size_t off) const {
            if (!has(off, 4)) return 0;
            const std::uint32_t b0 = data_[off], b1 = data_[off + 1], b2 = data_[off + 2], b3 = data_[off + 3];
            return little_ ? (b0 | b1 << 8 | b2 << 16 | b3 << 24)
                           : (b0 << 24 | b1 << 16 | b2 << 8 | b3);
        }

        [[nodiscard]] std::uint64_t u64(const std::size_t off) const {
            const std::uint64_t first = u32(off);
            const std::uint64_t second = u32(off + 4);
            return little_ ? (second << 32 | first) : (first << 32 | second);
        }

        [[nodiscard]] std::span<const std::uint8_t> bytes(const std::size_t off, const std::size_t len) const {
            return data_.subspan(off, len);
        }

    private:
        std::span<const std::uint8_t> data_;
        bool little_ = true;
    };

    std::string format_number(const TiffView& tiff, const std::uint16_t type, const std::size_t off) {
        std::ostringstream os;
        switch (type) {
            case Short:  os << tiff.u16(off); break;
            case SShort: os << static_cast<std::int16_t>(tiff.u16(off)); break;
            case Long:   os << tiff.u32(off); break;
            case SLong:  os << static_cast<std::int32_t>(tiff.u32(off)); break;
            case Rational:
            case SRational: {
                const std::uint32_t num = tiff.u32(off);
                const std::uint32_t den = tiff.u32(off + 4);
                if (den == 0) {
                    os << "nan";
                } else if (type == Rational) {
                    os << static_cast<double>(num) / den;
                } else {
                    os << static_cast<double>(static_cast<std::int32_t>(num)) / static_cast<std::int32_t>(den);
                }
                break;
            }
            case Float: {
                const std::uint32_t bits = tiff.u32(off);
                float f;
                std::memcpy(&f, &bits, sizeof(f));
                os << f;
                break;
            }
            case Double: {
                const std::uint64_t bits = tiff.u64(off);
                double d;
                std::memcpy(&d, &bits, sizeof(d));
                os << d;
                break;
            }
            default: break;
        }
        return os.str();
    }

    std::string format_value(const TiffView& tiff, const std::uint16_t type, const std::uint32_t count,
                             const std::size_t value_off) {
        if (type == Byte || type == SByte || type == Undefined) {
            return "<bytes:" + std::to_string(count) + ">";
        }
        if (type == Ascii) {
            const auto raw = tiff.bytes(value_off, count);
            std::string s(raw.begin(), raw.end());
            s.erase(std::find(s.begin(), s.end(), '\0'), s.end());
            return s;
        }

        const std::size_t step = type_size(type);
        if (count == 1) return format_number(tiff, type, value_off);

        std::string out = "(";
        for (std::uint32_t i = 0; i < count; ++i) {
            if (i) out += ", ";
            out += format_number(tiff, type, value_off + i * step);
        }
        return out + ")";
    }

    /**
     * @brief Reads the entries of the IFD at @p ifd_off into @p out.
     * @return Offsets of the Exif and GPS sub-IFDs found (0 when absent).
     */
    std::pair<std::uint32_t, std::uint32_t> walk_ifd(const TiffView& tiff, const std::uint32_t ifd_off,
                                                     std::map<std::string, std::string>& out) {
        std::uint32_t exif_ifd = 0;
        std::uint32_t gps_ifd = 0;

        if (!tiff.has(ifd_off, 2)) return {0, 0};
        const std::size_t count = std::min<std::size_t>(tiff.u16(ifd_off), kMaxEntriesPerIfd);

        for (std::size_t i = 0; i < count; ++i) {
            const std::size_t entry = ifd_off + 2 + i * kEntrySize;
            if (!tiff.has(entry, kEntrySize)) {
                Logger::log(LogLevel::Debug, "EXIF IFD truncated after " + std::to_string(i) + " entries",
                            "exif_reader");
                break;
            }

            const std::uint16_t tag = tiff.u16(entry);
            const std::uint16_t type = tiff.u16(entry + 2);
            const std::uint32_t n = tiff.u32(entry + 4);
            const std::size_t size = type_size(type);
            if (size == 0) continue;

            const std::uint64_t total = static_cast<std::uint64_t>(size) * n;
            const std::size_t value_off = total <= 4 ? entry + 8 : tiff.u32(entry + 8);
            if (!tiff.has(value_off, static_cast<std::size_t>(std::min<std::uint64_t>(total, SIZE_MAX)))) {
                continue;
            }

            if (tag == kExifIfdPointer) exif_ifd = tiff.u32(entry + 8);
            if (tag == kGpsIfdPointer) {
                gps_ifd = tiff.u32(entry + 8);
                continue;
            }
            out[imgscrub::ExifReader::tag_name(tag)] = format_value(tiff, type, n, value_off);
        }
        return {exif_ifd, gps_ifd};
    }

} // namespace

namespace imgscrub {

std::string ExifReader::tag_name(const std::uint16_t tag) {
    const auto it = kTagNames.find(tag);
    return it != kTagNames.end() ? std::string(it->second) : "Unknown_" + std::to_string(tag);
}

std::map<std::string, std::string> ExifReader::read(const std::span<const std::uint8_t> tiff_bytes) {
    std::map<std::string, std::string> out;
    TiffView tiff(tiff_bytes);
    if (!tiff.init()) {
        Logger::log(LogLevel::Debug, "EXIF block without a TIFF header", "exif_reader");
        return out;
    }

    const std::uint32_t ifd0 = tiff.u32(4);
    const auto [exif_ifd, gps_ifd] = walk_ifd(tiff, ifd0, out);

    if (exif_ifd != 0 && exif_ifd != ifd0) {
        walk_ifd(tiff, exif_ifd, out);
    }
    if (gps_ifd != 0) {
        const std::uint16_t entries = tiff.has(gps_ifd, 2) ? tiff.u16(gps_ifd) : 0;
        out["GPSInfo"] = "<ifd:" + std::to_string(entries) + " entries>";
    }
    return out;
}

} // namespace imgscrub
