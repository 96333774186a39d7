#include "core/exif_reader.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <set>
#include <sstream>
#include <unordered_map>

namespace
{
    constexpr uint16_t TAG_EXIF_IFD = 0x8769;
    constexpr size_t MAX_IFD_ENTRIES = 1024;
    constexpr uint32_t MAX_LISTED_VALUES = 64;

    const std::unordered_map<uint16_t, const char *> &exifTagNames()
    {
        static const std::unordered_map<uint16_t, const char *> names = {
            {0x000B, "ProcessingSoftware"},
            {0x00FE, "NewSubfileType"},
            {0x0100, "ImageWidth"},
            {0x0101, "ImageLength"},
            {0x0102, "BitsPerSample"},
            {0x0103, "Compression"},
            {0x0106, "PhotometricInterpretation"},
            {0x010E, "ImageDescription"},
            {0x010F, "Make"},
            {0x0110, "Model"},
            {0x0112, "Orientation"},
            {0x0115, "SamplesPerPixel"},
            {0x011A, "XResolution"},
            {0x011B, "YResolution"},
            {0x0128, "ResolutionUnit"},
            {0x0131, "Software"},
            {0x0132, "DateTime"},
            {0x013B, "Artist"},
            {0x013C, "HostComputer"},
            {0x0213, "YCbCrPositioning"},
            {0x8298, "Copyright"},
            {0x829A, "ExposureTime"},
            {0x829D, "FNumber"},
            {0x8769, "ExifOffset"},
            {0x8822, "ExposureProgram"},
            {0x8825, "GPSInfo"},
            {0x8827, "ISOSpeedRatings"},
            {0x9000, "ExifVersion"},
            {0x9003, "DateTimeOriginal"},
            {0x9004, "DateTimeDigitized"},
            {0x9010, "OffsetTime"},
            {0x9011, "OffsetTimeOriginal"},
            {0x9012, "OffsetTimeDigitized"},
            {0x9101, "ComponentsConfiguration"},
            {0x9201, "ShutterSpeedValue"},
            {0x9202, "ApertureValue"},
            {0x9203, "BrightnessValue"},
            {0x9204, "ExposureBiasValue"},
            {0x9205, "MaxApertureValue"},
            {0x9207, "MeteringMode"},
            {0x9208, "LightSource"},
            {0x9209, "Flash"},
            {0x920A, "FocalLength"},
            {0x927C, "MakerNote"},
            {0x9286, "UserComment"},
            {0x9290, "SubsecTime"},
            {0x9291, "SubsecTimeOriginal"},
            {0x9292, "SubsecTimeDigitized"},
            {0xA000, "FlashPixVersion"},
            {0xA001, "ColorSpace"},
            {0xA002, "ExifImageWidth"},
            {0xA003, "ExifImageHeight"},
            {0xA005, "ExifInteroperabilityOffset"},
            {0xA217, "SensingMethod"},
            {0xA300, "FileSource"},
            {0xA301, "SceneType"},
            {0xA401, "CustomRendered"},
            {0xA402, "ExposureMode"},
            {0xA403, "WhiteBalance"},
            {0xA404, "DigitalZoomRatio"},
            {0xA405, "FocalLengthIn35mmFilm"},
            {0xA406, "SceneCaptureType"},
            {0xA420, "ImageUniqueID"},
            {0xA430, "CameraOwnerName"},
            {0xA431, "BodySerialNumber"},
            {0xA432, "LensSpecification"},
            {0xA433, "LensMake"},
            {0xA434, "LensModel"},
        };
        return names;
    }

    // Bounds-checked reader over a TIFF block in either byte order
    class TiffView
    {
    public:
        TiffView(const uint8_t *base, size_t size, bool little_endian)
            : base_(base), size_(size), little_endian_(little_endian) {}

        size_t size() const { return size_; }
        bool littleEndian() const { return little_endian_; }
        const uint8_t *at(size_t offset) const { return base_ + offset; }

        bool contains(size_t offset, size_t length) const
        {
            return offset <= size_ && length <= size_ - offset;
        }

        bool readU16(size_t offset, uint16_t &value) const
        {
            if (!contains(offset, 2))
                return false;
            const uint8_t *p = base_ + offset;
            value = little_endian_ ? static_cast<uint16_t>(p[0] | (p[1] << 8))
                                   : static_cast<uint16_t>((p[0] << 8) | p[1]);
            return true;
        }

        bool readU32(size_t offset, uint32_t &value) const
        {
            if (!contains(offset, 4))
                return false;
            const uint8_t *p = base_ + offset;
            if (little_endian_)
                value = static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
                        (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
            else
                value = (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
                        (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
            return true;
        }

    private:
        const uint8_t *base_;
        size_t size_;
        bool little_endian_;
    };

    size_t typeSize(uint16_t type)
    {
        switch (type)
        {
        case 1: // BYTE
        case 2: // ASCII
        case 6: // SBYTE
        case 7: // UNDEFINED
            return 1;
        case 3: // SHORT
        case 8: // SSHORT
            return 2;
        case 4:  // LONG
        case 9:  // SLONG
        case 11: // FLOAT
        case 13: // IFD
            return 4;
        case 5:  // RATIONAL
        case 10: // SRATIONAL
        case 12: // DOUBLE
            return 8;
        default:
            return 0;
        }
    }

    // Python-style float text: 72 -> "72.0", 0.5 -> "0.5"
    std::string formatDecimal(double value)
    {
        if (std::isnan(value))
            return "nan";
        std::ostringstream ss;
        ss << std::setprecision(12) << value;
        std::string text = ss.str();
        if (text.find_first_of(".eni") == std::string::npos)
            text += ".0";
        return text;
    }

    std::string formatScalar(const TiffView &view, uint16_t type, size_t offset)
    {
        uint16_t u16 = 0;
        uint32_t u32 = 0;
        uint32_t den = 0;
        switch (type)
        {
        case 1:
            return std::to_string(*view.at(offset));
        case 6:
            return std::to_string(static_cast<int8_t>(*view.at(offset)));
        case 3:
            view.readU16(offset, u16);
            return std::to_string(u16);
        case 8:
            view.readU16(offset, u16);
            return std::to_string(static_cast<int16_t>(u16));
        case 4:
        case 13:
            view.readU32(offset, u32);
            return std::to_string(u32);
        case 9:
            view.readU32(offset, u32);
            return std::to_string(static_cast<int32_t>(u32));
        case 5:
            view.readU32(offset, u32);
            view.readU32(offset + 4, den);
            return formatDecimal(den == 0 ? std::nan("") : static_cast<double>(u32) / den);
        case 10:
        {
            view.readU32(offset, u32);
            view.readU32(offset + 4, den);
            const auto num = static_cast<int32_t>(u32);
            const auto sden = static_cast<int32_t>(den);
            return formatDecimal(sden == 0 ? std::nan("") : static_cast<double>(num) / sden);
        }
        case 11:
        {
            view.readU32(offset, u32);
            float f;
            std::memcpy(&f, &u32, sizeof(f));
            return formatDecimal(f);
        }
        case 12:
        {
            uint32_t first = 0, second = 0;
            view.readU32(offset, first);
            view.readU32(offset + 4, second);
            const uint64_t bits = view.littleEndian()
                                      ? (static_cast<uint64_t>(second) << 32) | first
                                      : (static_cast<uint64_t>(first) << 32) | second;
            double d;
            std::memcpy(&d, &bits, sizeof(d));
            return formatDecimal(d);
        }
        default:
            return "";
        }
    }

    std::string formatValue(const TiffView &view, uint16_t type, uint32_t count, size_t offset)
    {
        if (type == 2 || type == 7)
        {
            const char *text = reinterpret_cast<const char *>(view.at(offset));
            size_t length = count;
            if (type == 2)
            {
                const void *nul = std::memchr(text, '\0', count);
                if (nul)
                    length = static_cast<size_t>(static_cast<const char *>(nul) - text);
            }
            else
            {
                while (length > 0 && text[length - 1] == '\0')
                    --length;
            }
            return std::string(text, length);
        }

        const size_t size = typeSize(type);
        if (count == 1)
            return formatScalar(view, type, offset);

        std::string joined = "(";
        const uint32_t listed = std::min(count, MAX_LISTED_VALUES);
        for (uint32_t i = 0; i < listed; ++i)
        {
            if (i > 0)
                joined += ", ";
            joined += formatScalar(view, type, offset + i * size);
        }
        if (listed < count)
            joined += ", ...";
        joined += ")";
        return joined;
    }

    // Only IFD0 may link to the EXIF sub-IFD, and only once; nested links are recorded but not followed
    void readIfd(const TiffView &view, size_t ifd_offset, std::map<std::string, std::string> &fields,
                 std::set<size_t> &visited, bool follow_exif_ifd)
    {
        if (!visited.insert(ifd_offset).second)
            return; // IFD loop

        uint16_t entry_count = 0;
        if (!view.readU16(ifd_offset, entry_count))
            return;

        const size_t entries = std::min<size_t>(entry_count, MAX_IFD_ENTRIES);
        for (size_t i = 0; i < entries; ++i)
        {
            const size_t entry = ifd_offset + 2 + i * 12;
            uint16_t tag = 0, type = 0;
            uint32_t count = 0, value_field = 0;
            if (!view.readU16(entry, tag) || !view.readU16(entry + 2, type) ||
                !view.readU32(entry + 4, count) || !view.readU32(entry + 8, value_field))
            {
                return; // truncated directory, keep what was read
            }

            const size_t size = typeSize(type);
            if (size == 0 || count == 0 || count > view.size() / size)
                continue;

            const size_t total = size * count;
            const size_t data_offset = total <= 4 ? entry + 8 : value_field;
            if (!view.contains(data_offset, total))
                continue;

            fields[ExifReader::tagName(tag)] = formatValue(view, type, count, data_offset);

            if (follow_exif_ifd && tag == TAG_EXIF_IFD && (type == 4 || type == 13) && count == 1)
            {
                follow_exif_ifd = false;
                readIfd(view, value_field, fields, visited, false);
            }
        }
    }
}

std::string ExifReader::tagName(uint16_t tag)
{
    const auto &names = exifTagNames();
    auto it = names.find(tag);
    if (it != names.end())
        return it->second;
    return std::to_string(tag);
}

bool ExifReader::parseTiff(const uint8_t *tiff, size_t size, std::map<std::string, std::string> &fields)
{
    if (tiff == nullptr || size < 8)
        return false;

    bool little_endian;
    if (tiff[0] == 'I' && tiff[1] == 'I' && tiff[2] == 0x2A && tiff[3] == 0x00)
        little_endian = true;
    else if (tiff[0] == 'M' && tiff[1] == 'M' && tiff[2] == 0x00 && tiff[3] == 0x2A)
        little_endian = false;
    else
        return false;

    TiffView view(tiff, size, little_endian);
    uint32_t ifd0 = 0;
    if (!view.readU32(4, ifd0))
        return false;

    std::set<size_t> visited;
    readIfd(view, ifd0, fields, visited, true);
    return true;
}

bool ExifReader::findJpegExif(const std::vector<uint8_t> &data, size_t &offset, size_t &length)
{
    if (data.size() < 4 || data[0] != 0xFF || data[1] != 0xD8)
        return false;

    size_t pos = 2;
    while (pos + 4 <= data.size())
    {
        if (data[pos] != 0xFF)
            return false;
        // Fill bytes
        while (pos < data.size() && data[pos] == 0xFF)
            ++pos;
        if (pos >= data.size())
            return false;

        const uint8_t marker = data[pos++];
        if (marker == 0xD9 || marker == 0xDA)
            return false; // EOI / start of scan: metadata segments come first
        if ((marker >= 0xD0 && marker <= 0xD7) || marker == 0x01)
            continue;

        if (pos + 2 > data.size())
            return false;
        const size_t segment_length = (static_cast<size_t>(data[pos]) << 8) | data[pos + 1];
        if (segment_length < 2 || pos + segment_length > data.size())
            return false;

        const size_t payload = pos + 2;
        const size_t payload_length = segment_length - 2;
        if (marker == 0xE1 && payload_length >= 10 && std::memcmp(&data[payload], "Exif", 4) == 0 &&
            data[payload + 4] == 0)
        {
            offset = payload + 6;
            length = payload_length - 6;
            return true;
        }
        pos += segment_length;
    }
    return false;
}

bool ExifReader::findPngExif(const std::vector<uint8_t> &data, size_t &offset, size_t &length)
{
    static const uint8_t signature[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    if (data.size() < 8 || std::memcmp(data.data(), signature, 8) != 0)
        return false;

    size_t pos = 8;
    while (pos + 12 <= data.size())
    {
        const size_t chunk_length = (static_cast<size_t>(data[pos]) << 24) | (static_cast<size_t>(data[pos + 1]) << 16) |
                                    (static_cast<size_t>(data[pos + 2]) << 8) | data[pos + 3];
        const char *type = reinterpret_cast<const char *>(&data[pos + 4]);
        const size_t chunk_data = pos + 8;
        if (chunk_length > data.size() - chunk_data)
            return false;

        if (std::memcmp(type, "eXIf", 4) == 0)
        {
            offset = chunk_data;
            length = chunk_length;
            // Some writers keep the JPEG preamble inside the chunk
            if (length >= 6 && std::memcmp(&data[offset], "Exif\0\0", 6) == 0)
            {
                offset += 6;
                length -= 6;
            }
            return true;
        }
        if (std::memcmp(type, "IEND", 4) == 0)
            return false;

        pos = chunk_data + chunk_length + 4; // skip CRC
    }
    return false;
}

CaptureMetadataExtraction ExifReader::extract(const std::vector<uint8_t> &data)
{
    if (data.empty())
        return NoCaptureMetadata{"empty input"};

    try
    {
        size_t offset = 0;
        size_t length = 0;
        if (!findJpegExif(data, offset, length) && !findPngExif(data, offset, length))
        {
            const bool bare_tiff = data.size() >= 4 &&
                                   ((data[0] == 'I' && data[1] == 'I' && data[2] == 0x2A && data[3] == 0x00) ||
                                    (data[0] == 'M' && data[1] == 'M' && data[2] == 0x00 && data[3] == 0x2A));
            if (!bare_tiff)
                return NoCaptureMetadata{"no EXIF block"};
            offset = 0;
            length = data.size();
        }

        CaptureMetadata metadata;
        if (!parseTiff(data.data() + offset, length, metadata.fields))
            return NoCaptureMetadata{"malformed EXIF header"};
        if (metadata.fields.empty())
            return NoCaptureMetadata{"EXIF block has no fields"};

        Logger::debug("ExifReader: read " + std::to_string(metadata.fields.size()) + " EXIF fields");
        return metadata;
    }
    catch (const std::exception &e)
    {
        Logger::warn("ExifReader: failed to parse EXIF block: " + std::string(e.what()));
        return NoCaptureMetadata{std::string("EXIF parse error: ") + e.what()};
    }
}
