#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "core/forensic_result.hpp"
#include "core/ocr_engine.hpp"

/**
 * @brief Checks that the amounts printed on an invoice add up
 *
 * Runs OCR on a binarized copy of the invoice, pulls out currency-like
 * tokens and scores how plausible they are as line items plus a total.
 */
class OcrValidator
{
public:
    static constexpr double DEFAULT_TOLERANCE_RATIO = 0.15;
    static constexpr size_t MAX_TEXT_CODE_POINTS = 500;

    struct AmountScore
    {
        double score = 0.0;
        std::vector<std::string> flags;
    };

    explicit OcrValidator(std::shared_ptr<const OcrEngine> engine);
    virtual ~OcrValidator() = default;

    /**
     * @brief OCR the image and score amount consistency
     * @param image Decoded invoice raster
     * @param tolerance_ratio Allowed relative gap between the total and the line item sum
     * @return Findings with at most MAX_TEXT_CODE_POINTS characters of text;
     *         ENGINE_UNAVAILABLE or EXTRACTION_FAILED failures when OCR cannot run
     */
    virtual OcrOutcome validate(const cv::Mat &image, double tolerance_ratio) const;

    // validate() on an image read from disk; INPUT_UNREADABLE if it cannot be decoded
    OcrOutcome validateFile(const std::string &image_path,
                            double tolerance_ratio = DEFAULT_TOLERANCE_RATIO) const;

    OcrEngineStatus engineStatus() const;

    // Grayscale, Otsu binarization, 3x3 median filter
    static cv::Mat preprocess(const cv::Mat &image);

    /**
     * @brief Best-effort parse of an OCR'd currency token
     *
     * Drops '$' and spaces. With both ',' and '.' present the commas are
     * thousands separators; with only ',' present it is the decimal point.
     * @return nullopt when the cleaned token is not a number
     */
    static std::optional<double> parseCurrencyAmount(const std::string &amount_text);

    // Every currency-like token in text, in order, skipping unparsable ones
    static std::vector<ParsedAmount> extractAmounts(const std::string &text);

    static AmountScore scoreAmounts(const std::vector<double> &values, double tolerance_ratio);

    /**
     * @brief True when the largest amount (the total) is not the sum of the others
     *
     * Needs at least three amounts and a positive total.
     */
    static bool hasSumMismatch(const std::vector<double> &values, double tolerance_ratio);

private:
    std::shared_ptr<const OcrEngine> engine_;
};
