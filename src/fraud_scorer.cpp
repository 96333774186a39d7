#include "core/fraud_scorer.hpp"
#include "core/invoice_loader.hpp"
#include "core/verdict.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <optional>
#include <stdexcept>
#include <opencv2/imgproc.hpp>
#include <tbb/parallel_invoke.h>

namespace
{
    // Detector boundary: anything that escapes a detector becomes its failure outcome
    template <typename Findings, typename Detector>
    DetectorOutcome<Findings> runIsolated(const std::string &name, Detector &&detector)
    {
        try
        {
            return detector();
        }
        catch (const cv::Exception &e)
        {
            Logger::error(name + " raised an OpenCV error: " + e.what());
            return DetectorOutcome<Findings>::failure(FailureReason::UNEXPECTED_ERROR, e.what());
        }
        catch (const std::exception &e)
        {
            Logger::error(name + " raised: " + e.what());
            return DetectorOutcome<Findings>::failure(FailureReason::UNEXPECTED_ERROR, e.what());
        }
        catch (...)
        {
            Logger::error(name + " raised a non-standard exception");
            return DetectorOutcome<Findings>::failure(FailureReason::UNEXPECTED_ERROR, "Unknown error in " + name);
        }
    }

    template <typename Findings>
    void logFallback(const std::string &name, const DetectorOutcome<Findings> &outcome)
    {
        if (!outcome.ok())
        {
            Logger::warn(name + " result is inconclusive (" + failureReasonName(outcome.error().reason) +
                         "): " + outcome.error().message);
        }
    }
}

FraudScorer::FraudScorer(std::shared_ptr<const ElaAnalyzer> ela,
                         std::shared_ptr<const MetadataInspector> metadata,
                         std::shared_ptr<const OcrValidator> ocr,
                         FraudScorerOptions options)
    : ela_(std::move(ela)), metadata_(std::move(metadata)), ocr_(std::move(ocr)), options_(options)
{
    if (!ela_ || !metadata_ || !ocr_)
    {
        throw std::invalid_argument("FraudScorer requires all three detectors");
    }
}

FraudScorer::FraudScorer(const ElaOptions &ela_options, const OcrOptions &ocr_options, FraudScorerOptions options)
    : FraudScorer(std::make_shared<ElaAnalyzer>(ela_options),
                  std::make_shared<MetadataInspector>(),
                  std::make_shared<OcrValidator>(std::make_shared<TesseractOcrEngine>(ocr_options)),
                  options)
{
}

FraudReport FraudScorer::analyzeFile(const std::string &file_path) const
{
    Logger::info("Analyzing invoice file: " + file_path);
    return analyzeImage(InvoiceLoader::loadFile(file_path, options_.pdf_dpi));
}

FraudReport FraudScorer::analyzeImage(const InvoiceImage &invoice) const
{
    cv::Mat working = invoice.pixels;
    if (!working.empty())
    {
        try
        {
            working = shrinkToMaxWidth(invoice.pixels, options_.max_image_width_px);
        }
        catch (const cv::Exception &e)
        {
            Logger::warn("Downscaling failed, analyzing at full size: " + std::string(e.what()));
        }
    }

    std::optional<ElaOutcome> ela;
    std::optional<MetadataOutcome> metadata;
    std::optional<OcrOutcome> ocr;

    auto run_ela = [&]()
    {
        ela = runIsolated<ElaFindings>("ELA", [&]()
                                       { return ela_->analyze(working); });
    };
    auto run_metadata = [&]()
    {
        if (invoice.is_pdf)
        {
            metadata = MetadataOutcome::success(MetadataInspector::pdfFindings());
            return;
        }
        metadata = runIsolated<MetadataFindings>("Metadata inspection", [&]()
                                                 { return metadata_->inspect(invoice.capture_metadata); });
    };
    auto run_ocr = [&]()
    {
        ocr = runIsolated<OcrFindings>("OCR validation", [&]()
                                       { return ocr_->validate(working, options_.tolerance_ratio); });
    };

    if (options_.parallel_detectors)
    {
        tbb::parallel_invoke(run_ela, run_metadata, run_ocr);
    }
    else
    {
        run_ela();
        run_metadata();
        run_ocr();
    }

    logFallback("ELA", *ela);
    logFallback("Metadata", *metadata);
    logFallback("OCR", *ocr);

    const double raw_score = combineScores(ela->score(), metadata->score(), ocr->score());
    FraudReport report(roundScore(raw_score), Verdict::finalVerdict(raw_score),
                       std::move(*ela), std::move(*metadata), std::move(*ocr));

    Logger::info("Final score " + std::to_string(report.final_score) + ": " + report.verdict);
    return report;
}

cv::Mat FraudScorer::shrinkToMaxWidth(const cv::Mat &image, int max_width)
{
    if (max_width <= 0 || image.empty() || image.cols <= max_width)
        return image;

    const double ratio = static_cast<double>(max_width) / image.cols;
    const int new_height = std::max(1, static_cast<int>(image.rows * ratio));

    cv::Mat resized;
    cv::resize(image, resized, cv::Size(max_width, new_height), 0, 0, cv::INTER_LANCZOS4);
    Logger::debug("Downscaled " + std::to_string(image.cols) + "x" + std::to_string(image.rows) + " to " +
                  std::to_string(max_width) + "x" + std::to_string(new_height));
    return resized;
}

double FraudScorer::combineScores(double ela_score, double metadata_score, double ocr_score)
{
    return ELA_WEIGHT * ela_score + METADATA_WEIGHT * metadata_score + OCR_WEIGHT * ocr_score;
}
