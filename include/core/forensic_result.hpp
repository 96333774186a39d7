#pragma once

#include <cmath>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/detector_outcome.hpp"

// Scores are reported with two decimals
inline double roundScore(double score)
{
    return std::round(score * 100.0) / 100.0;
}

/**
 * @brief Statistics measured on the ELA difference image
 */
struct ElaMetrics
{
    double brightness_mean = 0.0;
    double brightness_variance = 0.0;
    int max_pixel_difference = 0;
    int jpeg_quality = 0;
};

/**
 * @brief Recompression artifact analysis findings
 */
struct ElaFindings
{
    double score = 0.0;
    std::string verdict;
    std::optional<std::string> visualization_path; // Public or raw path of the saved PNG
    std::optional<ElaMetrics> metrics;             // Absent on fallback payloads
};

/**
 * @brief Capture metadata (EXIF) inspection findings
 */
struct MetadataFindings
{
    double score = 0.0;
    std::string verdict;
    std::vector<std::string> flags;
    std::map<std::string, std::string> metadata; // Display-safe field values
};

/**
 * @brief One currency-like token found in OCR text
 */
struct ParsedAmount
{
    std::string raw;
    double value = 0.0;
};

/**
 * @brief OCR arithmetic validation findings
 */
struct OcrFindings
{
    double score = 0.0;
    std::string verdict;
    std::vector<std::string> flags;
    std::string extracted_text;
    std::vector<ParsedAmount> amounts;
};

template <>
struct FallbackPolicy<ElaFindings>
{
    static constexpr double SCORE = 50.0;
    static ElaFindings fallback(const DetectorFailure &failure);
};

template <>
struct FallbackPolicy<MetadataFindings>
{
    static constexpr double SCORE = 50.0;
    static MetadataFindings fallback(const DetectorFailure &failure);
};

template <>
struct FallbackPolicy<OcrFindings>
{
    static constexpr double SCORE = 40.0;
    static OcrFindings fallback(const DetectorFailure &failure);
};

using ElaOutcome = DetectorOutcome<ElaFindings>;
using MetadataOutcome = DetectorOutcome<MetadataFindings>;
using OcrOutcome = DetectorOutcome<OcrFindings>;

/**
 * @brief Final per-invoice report, built once per analysis call
 */
struct FraudReport
{
    double final_score;
    std::string verdict;
    ElaOutcome ela;
    MetadataOutcome metadata;
    OcrOutcome ocr;

    FraudReport(double score, std::string final_verdict, ElaOutcome ela_outcome,
                MetadataOutcome metadata_outcome, OcrOutcome ocr_outcome)
        : final_score(score), verdict(std::move(final_verdict)), ela(std::move(ela_outcome)),
          metadata(std::move(metadata_outcome)), ocr(std::move(ocr_outcome)) {}
};
