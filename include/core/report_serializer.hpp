#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/forensic_result.hpp"

/**
 * @brief JSON rendering of analysis results
 *
 * Failed detectors are rendered through their fallback payload with the
 * failure message in "error"; successful ones carry "error": null.
 */
class ReportSerializer
{
public:
    static nlohmann::json toJson(const FraudReport &report);

    static nlohmann::json elaToJson(const ElaOutcome &outcome);
    static nlohmann::json metadataToJson(const MetadataOutcome &outcome);
    static nlohmann::json ocrToJson(const OcrOutcome &outcome);

    // Serialize with invalid UTF-8 replaced by U+FFFD instead of throwing
    static std::string dump(const nlohmann::json &document, bool pretty = false);
};
