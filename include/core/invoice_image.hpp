#pragma once

#include <map>
#include <utility>
#include <string>
#include <variant>
#include <opencv2/core.hpp>

/**
 * @brief Capture metadata fields read from an image container
 *
 * Keys are standard EXIF tag names ("Make", "DateTimeOriginal", ...), or the
 * decimal tag id for tags without a known name. Values are raw strings and
 * are not yet truncated for display.
 */
struct CaptureMetadata
{
    std::map<std::string, std::string> fields;
};

/**
 * @brief Marker for images that carry no capture metadata
 */
struct NoCaptureMetadata
{
    std::string reason;
};

using CaptureMetadataExtraction = std::variant<NoCaptureMetadata, CaptureMetadata>;

/**
 * @brief One decoded invoice page handed to the detectors
 */
struct InvoiceImage
{
    cv::Mat pixels; // BGR (or gray/BGRA) 8-bit raster
    CaptureMetadataExtraction capture_metadata = NoCaptureMetadata{"not extracted"};
    bool is_pdf = false;

    InvoiceImage() = default;
    explicit InvoiceImage(cv::Mat image) : pixels(std::move(image)) {}
    InvoiceImage(cv::Mat image, CaptureMetadataExtraction metadata)
        : pixels(std::move(image)), capture_metadata(std::move(metadata)) {}

    int width() const { return pixels.cols; }
    int height() const { return pixels.rows; }

    /**
     * @brief Normalize any supported raster to 8-bit, 3-channel BGR
     *
     * Gray and BGRA inputs are converted, 16-bit inputs scaled down and
     * floating point inputs taken as [0, 1].
     * @throws std::invalid_argument for unsupported channel counts
     */
    static cv::Mat toBgr8(const cv::Mat &image);
};
