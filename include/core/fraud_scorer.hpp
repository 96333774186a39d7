#pragma once

#include <memory>
#include <string>
#include <opencv2/core.hpp>
#include "core/ela_analyzer.hpp"
#include "core/forensic_result.hpp"
#include "core/invoice_image.hpp"
#include "core/metadata_inspector.hpp"
#include "core/ocr_validator.hpp"

struct FraudScorerOptions
{
    int max_image_width_px = 2000;  // <= 0 disables downscaling
    double tolerance_ratio = OcrValidator::DEFAULT_TOLERANCE_RATIO;
    int pdf_dpi = 200;
    bool parallel_detectors = true; // Run the three detectors with tbb::parallel_invoke
};

/**
 * @brief Runs all three detectors on one invoice and combines their scores
 *
 * Each detector is isolated: whatever it throws becomes its fallback result,
 * so analyzeImage() always returns a complete report.
 */
class FraudScorer
{
public:
    static constexpr double ELA_WEIGHT = 0.4;
    static constexpr double METADATA_WEIGHT = 0.3;
    static constexpr double OCR_WEIGHT = 0.3;

    FraudScorer(std::shared_ptr<const ElaAnalyzer> ela,
                std::shared_ptr<const MetadataInspector> metadata,
                std::shared_ptr<const OcrValidator> ocr,
                FraudScorerOptions options = FraudScorerOptions());

    // Default detectors with a Tesseract OCR engine
    FraudScorer(const ElaOptions &ela_options, const OcrOptions &ocr_options,
                FraudScorerOptions options = FraudScorerOptions());

    /**
     * @brief Score one decoded invoice
     * @param invoice Pixels plus capture metadata from the original decode
     * @return Report with weighted final score and per-detector results
     */
    FraudReport analyzeImage(const InvoiceImage &invoice) const;

    /**
     * @brief Load a file (raster or PDF first page) and score it
     * @throws InvalidInvoiceError if the file cannot be loaded
     */
    FraudReport analyzeFile(const std::string &file_path) const;

    const OcrValidator &ocrValidator() const { return *ocr_; }
    const FraudScorerOptions &options() const { return options_; }

    /**
     * @brief Resize to max_width keeping the aspect ratio (Lanczos)
     *
     * Images at or under max_width, and any image when max_width <= 0, are
     * returned unchanged. The new height is floor(h * max_width / w), at least 1.
     */
    static cv::Mat shrinkToMaxWidth(const cv::Mat &image, int max_width);

    // Weighted, unrounded final score
    static double combineScores(double ela_score, double metadata_score, double ocr_score);

private:
    std::shared_ptr<const ElaAnalyzer> ela_;
    std::shared_ptr<const MetadataInspector> metadata_;
    std::shared_ptr<const OcrValidator> ocr_;
    FraudScorerOptions options_;
};
