#pragma once

#include <map>
#include <optional>
#include <string>
#include "core/forensic_result.hpp"
#include "core/invoice_image.hpp"

/**
 * @brief Additive EXIF heuristics for signs of editing
 *
 * Works on a CaptureMetadataExtraction, so it never touches pixels and
 * never depends on how the raster was decoded.
 */
class MetadataInspector
{
public:
    static constexpr const char *NO_EXIF_VERDICT = "SUSPICIOUS - No EXIF metadata found";

    virtual ~MetadataInspector() = default;

    /**
     * @brief Score the capture metadata of one image
     *
     * No fields -> score 50 with a single "no EXIF" flag. Otherwise the
     * editing-software (+30), timestamp mismatch (+20) and missing critical
     * field (+15) checks are applied independently.
     */
    virtual MetadataOutcome inspect(const CaptureMetadataExtraction &extraction) const;

    /**
     * @brief Read an image file and inspect its capture metadata
     * @return INPUT_UNREADABLE failure when the file cannot be read or is not an image
     */
    MetadataOutcome inspectFile(const std::string &image_path) const;

    /**
     * @brief Fixed result used for PDF inputs, which never carry EXIF
     */
    static MetadataFindings pdfFindings();

    /**
     * @brief Software string naming a known image editor, if any
     *
     * Looks at Software, falling back to ProcessingSoftware when Software is
     * absent or empty.
     */
    static std::optional<std::string> detectEditingSoftware(const std::map<std::string, std::string> &fields);
};
