#include "core/ocr_validator.hpp"
#include "core/invoice_image.hpp"
#include "core/text_utils.hpp"
#include "core/verdict.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <locale>
#include <map>
#include <numeric>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace
{
    const std::regex AMOUNT_PATTERN(R"(\$?\d+[,.]?\d*\.?\d{2})");

    std::string formatAmount(double value)
    {
        std::ostringstream ss;
        ss.imbue(std::locale::classic());
        ss << std::fixed << std::setprecision(2) << value;
        return ss.str();
    }
}

OcrValidator::OcrValidator(std::shared_ptr<const OcrEngine> engine) : engine_(std::move(engine))
{
    if (!engine_)
    {
        throw std::invalid_argument("OcrValidator requires an OCR engine");
    }
}

OcrEngineStatus OcrValidator::engineStatus() const
{
    return engine_->probe();
}

OcrOutcome OcrValidator::validateFile(const std::string &image_path, double tolerance_ratio) const
{
    cv::Mat image;
    try
    {
        image = cv::imread(image_path, cv::IMREAD_COLOR | cv::IMREAD_IGNORE_ORIENTATION);
    }
    catch (const cv::Exception &e)
    {
        Logger::error("OpenCV error reading " + image_path + " for OCR: " + e.what());
        return OcrOutcome::failure(FailureReason::INPUT_UNREADABLE, e.what());
    }

    if (image.empty())
    {
        Logger::warn("OCR could not read image: " + image_path);
        return OcrOutcome::failure(FailureReason::INPUT_UNREADABLE, "Failed to load image: " + image_path);
    }
    return validate(image, tolerance_ratio);
}

OcrOutcome OcrValidator::validate(const cv::Mat &image, double tolerance_ratio) const
{
    const OcrEngineStatus status = engine_->probe();
    if (!status.available)
    {
        Logger::warn("OCR skipped: " + status.error);
        return OcrOutcome::failure(FailureReason::ENGINE_UNAVAILABLE,
                                   status.error.empty() ? "Tesseract not found" : status.error);
    }

    std::string text;
    try
    {
        Logger::info("Running OCR (" + status.version + ") with tolerance " + std::to_string(tolerance_ratio));
        text = engine_->extractText(preprocess(image));
    }
    catch (const cv::Exception &e)
    {
        Logger::error("OCR preprocessing failed: " + std::string(e.what()));
        return OcrOutcome::failure(FailureReason::EXTRACTION_FAILED, e.what());
    }
    catch (const std::exception &e)
    {
        Logger::error("OCR extraction failed: " + std::string(e.what()));
        return OcrOutcome::failure(FailureReason::EXTRACTION_FAILED, e.what());
    }

    try
    {
        OcrFindings findings;
        findings.amounts = extractAmounts(text);

        std::vector<double> values;
        values.reserve(findings.amounts.size());
        for (const auto &amount : findings.amounts)
            values.push_back(amount.value);

        AmountScore amount_score = scoreAmounts(values, tolerance_ratio);
        findings.score = std::min(100.0, amount_score.score);
        findings.verdict = Verdict::riskVerdict(amount_score.score, "OCR");
        findings.flags = std::move(amount_score.flags);
        findings.extracted_text = TextUtils::truncateCodePoints(TextUtils::stripNullBytes(text), MAX_TEXT_CODE_POINTS);

        Logger::info("OCR finished: " + std::to_string(values.size()) + " amounts, score " +
                     std::to_string(findings.score));
        return OcrOutcome::success(std::move(findings));
    }
    catch (const std::exception &e)
    {
        Logger::error("OCR validation failed: " + std::string(e.what()));
        return OcrOutcome::failure(FailureReason::PROCESSING_FAILED, e.what());
    }
}

cv::Mat OcrValidator::preprocess(const cv::Mat &image)
{
    if (image.empty())
    {
        throw std::invalid_argument("Empty image supplied to OCR preprocessing");
    }

    cv::Mat grayscale;
    cv::cvtColor(InvoiceImage::toBgr8(image), grayscale, cv::COLOR_BGR2GRAY);

    cv::Mat thresholded;
    cv::threshold(grayscale, thresholded, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);

    cv::Mat filtered;
    cv::medianBlur(thresholded, filtered, 3);
    return filtered;
}

std::optional<double> OcrValidator::parseCurrencyAmount(const std::string &amount_text)
{
    std::string cleaned;
    cleaned.reserve(amount_text.size());
    for (char c : amount_text)
    {
        if (c != '$' && c != ' ')
            cleaned.push_back(c);
    }

    const bool has_comma = cleaned.find(',') != std::string::npos;
    const bool has_dot = cleaned.find('.') != std::string::npos;
    if (has_comma && has_dot)
    {
        cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), ','), cleaned.end());
    }
    else if (has_comma)
    {
        std::replace(cleaned.begin(), cleaned.end(), ',', '.');
    }

    if (cleaned.empty())
        return std::nullopt;

    std::istringstream stream(cleaned);
    stream.imbue(std::locale::classic());
    double value = 0.0;
    stream >> value;
    if (stream.fail() || stream.peek() != std::char_traits<char>::eof())
        return std::nullopt;
    return value;
}

std::vector<ParsedAmount> OcrValidator::extractAmounts(const std::string &text)
{
    std::vector<ParsedAmount> amounts;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), AMOUNT_PATTERN); it != std::sregex_iterator(); ++it)
    {
        const std::string raw = it->str();
        if (auto value = parseCurrencyAmount(raw))
        {
            amounts.push_back(ParsedAmount{raw, *value});
        }
        else
        {
            Logger::debug("Skipping unparsable amount token: " + raw);
        }
    }
    return amounts;
}

OcrValidator::AmountScore OcrValidator::scoreAmounts(const std::vector<double> &values, double tolerance_ratio)
{
    AmountScore result;

    if (values.size() < 2)
    {
        result.score += 40.0;
        result.flags.push_back("Too few amounts detected by OCR (< 2).");
    }

    std::map<double, int> occurrences;
    for (double value : values)
        ++occurrences[std::round(value * 100.0) / 100.0];

    std::string duplicates;
    for (const auto &[value, count] : occurrences)
    {
        if (count > 1)
            duplicates += (duplicates.empty() ? "" : ", ") + formatAmount(value);
    }
    if (!duplicates.empty())
    {
        result.score += 20.0;
        result.flags.push_back("Duplicate amounts detected: " + duplicates);
    }

    if (hasSumMismatch(values, tolerance_ratio))
    {
        result.score += 35.0;
        result.flags.push_back("Line items do not sum to the total within the allowed tolerance.");
    }

    return result;
}

bool OcrValidator::hasSumMismatch(const std::vector<double> &values, double tolerance_ratio)
{
    if (values.size() < 3)
        return false;

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());
    const double total = sorted.back();
    if (total <= 0.0)
        return false;

    const double line_items = std::accumulate(sorted.begin(), sorted.end() - 1, 0.0);
    return std::abs(line_items - total) / total > tolerance_ratio;
}
