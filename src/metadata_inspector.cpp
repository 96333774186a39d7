#include "core/metadata_inspector.hpp"
#include "core/exif_reader.hpp"
#include "core/file_utils.hpp"
#include "core/text_utils.hpp"
#include "core/verdict.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <vector>
#include <opencv2/imgcodecs.hpp>

namespace
{
    const std::vector<std::string> EDITING_MARKERS = {"photoshop", "gimp", "paint.net", "paint shop", "adobe"};
    const std::vector<std::string> CRITICAL_FIELDS = {"Make", "Model", "DateTime"};

    std::string fieldOrEmpty(const std::map<std::string, std::string> &fields, const std::string &key)
    {
        auto it = fields.find(key);
        return it == fields.end() ? std::string() : it->second;
    }

    MetadataFindings noExifFindings()
    {
        MetadataFindings findings;
        findings.score = 50.0;
        findings.verdict = MetadataInspector::NO_EXIF_VERDICT;
        findings.flags.push_back("No EXIF metadata present (often stripped by editors or screenshots).");
        return findings;
    }
}

MetadataOutcome MetadataInspector::inspectFile(const std::string &image_path) const
{
    try
    {
        const std::vector<uint8_t> data = FileUtils::readFileBytes(image_path);
        const cv::Mat probe = cv::imdecode(data, cv::IMREAD_REDUCED_GRAYSCALE_8 | cv::IMREAD_IGNORE_ORIENTATION);
        if (probe.empty())
        {
            Logger::warn("Metadata inspection: not a readable image: " + image_path);
            return MetadataOutcome::failure(FailureReason::INPUT_UNREADABLE,
                                            "Cannot identify image file: " + image_path);
        }
        return inspect(ExifReader::extract(data));
    }
    catch (const cv::Exception &e)
    {
        Logger::error("OpenCV error reading " + image_path + " for metadata: " + e.what());
        return MetadataOutcome::failure(FailureReason::INPUT_UNREADABLE, e.what());
    }
    catch (const std::exception &e)
    {
        Logger::warn("Metadata inspection could not read " + image_path + ": " + e.what());
        return MetadataOutcome::failure(FailureReason::INPUT_UNREADABLE, e.what());
    }
}

MetadataOutcome MetadataInspector::inspect(const CaptureMetadataExtraction &extraction) const
{
    try
    {
        if (const auto *none = std::get_if<NoCaptureMetadata>(&extraction))
        {
            Logger::info("Metadata inspection: no EXIF (" + none->reason + ")");
            return MetadataOutcome::success(noExifFindings());
        }

        const auto &raw_fields = std::get<CaptureMetadata>(extraction).fields;
        if (raw_fields.empty())
        {
            Logger::info("Metadata inspection: EXIF block is empty");
            return MetadataOutcome::success(noExifFindings());
        }

        MetadataFindings findings;
        for (const auto &[name, value] : raw_fields)
        {
            findings.metadata[name] = TextUtils::truncateDisplayValue(value);
        }

        double score = 0.0;

        if (auto software = detectEditingSoftware(findings.metadata))
        {
            score += 30.0;
            findings.flags.push_back("Edited with: " + *software);
        }

        const std::string date_time = fieldOrEmpty(findings.metadata, "DateTime");
        const std::string date_time_original = fieldOrEmpty(findings.metadata, "DateTimeOriginal");
        if (!date_time.empty() && !date_time_original.empty() && date_time != date_time_original)
        {
            score += 20.0;
            findings.flags.push_back("DateTime differs from DateTimeOriginal (possible re-save or edit).");
        }

        std::string missing;
        for (const auto &field : CRITICAL_FIELDS)
        {
            if (fieldOrEmpty(findings.metadata, field).empty())
            {
                missing += (missing.empty() ? "" : ", ") + field;
            }
        }
        if (!missing.empty())
        {
            score += 15.0;
            findings.flags.push_back("Missing critical EXIF fields: " + missing);
        }

        score = std::min(100.0, score);
        findings.score = score;
        findings.verdict = Verdict::riskVerdict(score, "METADATA");

        Logger::info("Metadata inspection finished: " + std::to_string(raw_fields.size()) +
                     " fields, score " + std::to_string(score));
        return MetadataOutcome::success(std::move(findings));
    }
    catch (const std::exception &e)
    {
        Logger::error("Metadata inspection failed: " + std::string(e.what()));
        return MetadataOutcome::failure(FailureReason::PROCESSING_FAILED, e.what());
    }
}

MetadataFindings MetadataInspector::pdfFindings()
{
    MetadataFindings findings;
    findings.score = 50.0;
    findings.verdict = NO_EXIF_VERDICT;
    findings.flags.push_back("PDF input has no EXIF metadata; metadata checks are limited.");
    return findings;
}

std::optional<std::string> MetadataInspector::detectEditingSoftware(const std::map<std::string, std::string> &fields)
{
    std::string software = fieldOrEmpty(fields, "Software");
    if (software.empty())
        software = fieldOrEmpty(fields, "ProcessingSoftware");
    if (software.empty())
        return std::nullopt;

    const std::string searchable = TextUtils::toLower(software);
    for (const auto &marker : EDITING_MARKERS)
    {
        if (searchable.find(marker) != std::string::npos)
            return software;
    }
    return std::nullopt;
}
