#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "core/invoice_image.hpp"

/**
 * @brief Reads EXIF capture metadata straight from encoded image bytes
 *
 * Independent of the raster decoder: the same bytes handed to cv::imdecode
 * are scanned here for an EXIF/TIFF block. Supported containers are JPEG
 * (APP1 "Exif\0\0"), PNG (eXIf chunk) and bare TIFF files.
 */
class ExifReader
{
public:
    /**
     * @brief Extract capture metadata from an encoded image
     * @param data Encoded file contents
     * @return CaptureMetadata when at least one field was read, otherwise
     *         NoCaptureMetadata with the reason. Never throws on malformed data.
     */
    static CaptureMetadataExtraction extract(const std::vector<uint8_t> &data);

    /**
     * @brief Parse a TIFF structure (the payload of an EXIF block)
     * @param tiff Pointer to the TIFF header ("II*\0" or "MM\0*")
     * @param size Number of bytes available from tiff
     * @param fields Output map of tag name to value; partial on malformed input
     * @return false if the header is not a TIFF header
     */
    static bool parseTiff(const uint8_t *tiff, size_t size, std::map<std::string, std::string> &fields);

    /**
     * @brief Standard EXIF tag name for an id, or the decimal id if unknown
     */
    static std::string tagName(uint16_t tag);

private:
    static bool findJpegExif(const std::vector<uint8_t> &data, size_t &offset, size_t &length);
    static bool findPngExif(const std::vector<uint8_t> &data, size_t &offset, size_t &length);
};
