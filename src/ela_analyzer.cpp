#include "core/ela_analyzer.hpp"
#include "core/file_utils.hpp"
#include "core/invoice_image.hpp"
#include "core/verdict.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

ElaAnalyzer::ElaAnalyzer(ElaOptions options) : options_(std::move(options))
{
}

ElaOutcome ElaAnalyzer::analyzeFile(const std::string &image_path) const
{
    cv::Mat image;
    try
    {
        image = cv::imread(image_path, cv::IMREAD_COLOR | cv::IMREAD_IGNORE_ORIENTATION);
    }
    catch (const cv::Exception &e)
    {
        Logger::error("OpenCV error reading " + image_path + " for ELA: " + e.what());
        return ElaOutcome::failure(FailureReason::INPUT_UNREADABLE, e.what());
    }

    if (image.empty())
    {
        Logger::warn("ELA could not read image: " + image_path);
        return ElaOutcome::failure(FailureReason::INPUT_UNREADABLE, "Failed to load image: " + image_path);
    }
    return analyze(image);
}

ElaOutcome ElaAnalyzer::analyze(const cv::Mat &image) const
{
    const int quality = options_.jpeg_quality;
    try
    {
        if (image.empty())
        {
            return ElaOutcome::failure(FailureReason::PROCESSING_FAILED, "Empty image supplied to ELA");
        }
        if (quality < 1 || quality > 100)
        {
            return ElaOutcome::failure(FailureReason::PROCESSING_FAILED,
                                       "JPEG quality out of range: " + std::to_string(quality));
        }

        Logger::info("Running ELA at JPEG quality " + std::to_string(quality) + " on " +
                     std::to_string(image.cols) + "x" + std::to_string(image.rows) + " image");

        const cv::Mat original = InvoiceImage::toBgr8(image);
        const cv::Mat recompressed = recompress(original, quality);
        if (recompressed.size() != original.size() || recompressed.type() != original.type())
        {
            return ElaOutcome::failure(FailureReason::PROCESSING_FAILED,
                                       "Recompressed image does not match the original geometry");
        }

        cv::Mat difference;
        cv::absdiff(original, recompressed, difference);

        double max_value = 0.0;
        cv::minMaxLoc(difference.reshape(1), nullptr, &max_value);
        const int max_difference = static_cast<int>(max_value);

        cv::Mat ela_image;
        if (max_difference > 0)
        {
            difference.convertTo(ela_image, CV_8U, 255.0 / max_difference);
        }
        else
        {
            ela_image = difference;
        }

        cv::Mat luminance;
        cv::cvtColor(ela_image, luminance, cv::COLOR_BGR2GRAY);
        cv::Scalar mean, stddev;
        cv::meanStdDev(luminance, mean, stddev);

        ElaMetrics metrics;
        metrics.brightness_mean = mean[0];
        metrics.brightness_variance = stddev[0] * stddev[0];
        metrics.max_pixel_difference = max_difference;
        metrics.jpeg_quality = quality;

        const double score = scoreFromMetrics(metrics);

        ElaFindings findings;
        findings.score = roundScore(score);
        findings.verdict = max_difference == 0 ? NO_ARTIFACTS_VERDICT : Verdict::riskVerdict(score, "ELA");
        findings.visualization_path = persistVisualization(ela_image);
        findings.metrics = metrics;

        Logger::debug("ELA metrics: mean=" + std::to_string(metrics.brightness_mean) +
                      " variance=" + std::to_string(metrics.brightness_variance) +
                      " max_diff=" + std::to_string(max_difference));
        Logger::info("ELA finished: score " + std::to_string(findings.score) + ", " + findings.verdict);
        return ElaOutcome::success(std::move(findings));
    }
    catch (const cv::Exception &e)
    {
        Logger::error("OpenCV error during ELA: " + std::string(e.what()));
        return ElaOutcome::failure(FailureReason::PROCESSING_FAILED, e.what());
    }
    catch (const std::exception &e)
    {
        Logger::error("ELA processing failed: " + std::string(e.what()));
        return ElaOutcome::failure(FailureReason::PROCESSING_FAILED, e.what());
    }
}

double ElaAnalyzer::scoreFromMetrics(const ElaMetrics &metrics)
{
    if (metrics.max_pixel_difference == 0)
        return 50.0;

    const double brightness_part = (metrics.brightness_mean / 255.0) * 50.0;
    const double variance_part = (metrics.brightness_variance / 1000.0) * 50.0;
    return std::min(100.0, brightness_part + variance_part);
}

cv::Mat ElaAnalyzer::recompress(const cv::Mat &bgr, int jpeg_quality) const
{
    std::vector<uchar> encoded;
    const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, jpeg_quality};
    if (!cv::imencode(".jpg", bgr, encoded, params))
    {
        throw std::runtime_error("JPEG re-encode failed");
    }

    cv::Mat decoded = cv::imdecode(encoded, cv::IMREAD_COLOR);
    if (decoded.empty())
    {
        throw std::runtime_error("Could not decode re-encoded JPEG");
    }
    return decoded;
}

std::string ElaAnalyzer::persistVisualization(const cv::Mat &ela_image) const
{
    FileUtils::ensureDirectory(options_.results_directory);

    const std::string filename = FileUtils::uniqueArtifactName("ela", "png");
    const std::string file_path = (fs::path(options_.results_directory) / filename).string();
    if (!cv::imwrite(file_path, ela_image))
    {
        throw std::runtime_error("Failed to save ELA visualization: " + file_path);
    }
    Logger::debug("Saved ELA visualization to " + file_path);

    if (options_.public_results_prefix && !options_.public_results_prefix->empty())
    {
        std::string prefix = *options_.public_results_prefix;
        while (!prefix.empty() && prefix.back() == '/')
            prefix.pop_back();
        return prefix + "/" + filename;
    }
    return file_path;
}
