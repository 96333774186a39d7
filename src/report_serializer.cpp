#include "core/report_serializer.hpp"

using json = nlohmann::json;

namespace
{
    json errorField(const std::optional<std::string> &error)
    {
        return error ? json(*error) : json(nullptr);
    }
}

json ReportSerializer::toJson(const FraudReport &report)
{
    return json{
        {"final_score", report.final_score},
        {"verdict", report.verdict},
        {"ela", elaToJson(report.ela)},
        {"metadata", metadataToJson(report.metadata)},
        {"ocr", ocrToJson(report.ocr)}};
}

json ReportSerializer::elaToJson(const ElaOutcome &outcome)
{
    const ElaFindings findings = outcome.resolved();

    json metrics = json::object();
    if (findings.metrics)
    {
        metrics["brightness_mean"] = findings.metrics->brightness_mean;
        metrics["brightness_variance"] = findings.metrics->brightness_variance;
        metrics["max_pixel_difference"] = findings.metrics->max_pixel_difference;
        metrics["jpeg_quality"] = findings.metrics->jpeg_quality;
    }

    return json{
        {"score", findings.score},
        {"verdict", findings.verdict},
        {"visualization_path", findings.visualization_path ? json(*findings.visualization_path) : json(nullptr)},
        {"metrics", metrics},
        {"error", errorField(outcome.errorMessage())}};
}

json ReportSerializer::metadataToJson(const MetadataOutcome &outcome)
{
    const MetadataFindings findings = outcome.resolved();
    return json{
        {"score", findings.score},
        {"verdict", findings.verdict},
        {"flags", findings.flags},
        {"metadata", findings.metadata.empty() ? json::object() : json(findings.metadata)},
        {"error", errorField(outcome.errorMessage())}};
}

json ReportSerializer::ocrToJson(const OcrOutcome &outcome)
{
    const OcrFindings findings = outcome.resolved();

    json amounts = json::array();
    for (const auto &amount : findings.amounts)
    {
        amounts.push_back({{"raw", amount.raw}, {"value", amount.value}});
    }

    return json{
        {"score", findings.score},
        {"verdict", findings.verdict},
        {"flags", findings.flags},
        {"extracted_text", findings.extracted_text},
        {"amounts", amounts},
        {"error", errorField(outcome.errorMessage())}};
}

std::string ReportSerializer::dump(const json &document, bool pretty)
{
    return document.dump(pretty ? 2 : -1, ' ', false, json::error_handler_t::replace);
}
