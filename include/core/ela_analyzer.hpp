#pragma once

#include <optional>
#include <string>
#include <opencv2/core.hpp>
#include "core/forensic_result.hpp"

/**
 * @brief ELA configuration
 */
struct ElaOptions
{
    std::string results_directory = "static/results";                  // Where visualizations are written
    std::optional<std::string> public_results_prefix = "/static/results"; // nullopt or empty -> raw file path
    int jpeg_quality = 90;                                             // Re-encode quality (1-100)
};

/**
 * @brief Recompression artifact analyzer (Error Level Analysis)
 *
 * Re-encodes the invoice as JPEG, diffs it against the original and scores
 * the brightness and spatial variance of the difference image. Regions edited
 * after the last save recompress differently from their surroundings and
 * show up as bright, uneven patches.
 *
 * analyze() never throws: any failure becomes an inconclusive outcome.
 */
class ElaAnalyzer
{
public:
    static constexpr const char *NO_ARTIFACTS_VERDICT = "SUSPICIOUS - No compression artifacts detected";

    explicit ElaAnalyzer(ElaOptions options = ElaOptions());
    virtual ~ElaAnalyzer() = default;

    /**
     * @brief Run ELA on a decoded image and save the visualization PNG
     * @param image Decoded raster (gray, BGR or BGRA; 8, 16-bit or float)
     * @return Findings with score, verdict, visualization path and metrics
     */
    virtual ElaOutcome analyze(const cv::Mat &image) const;

    /**
     * @brief Load an image from disk and run analyze() on it
     * @param image_path Path to a raster image
     * @return INPUT_UNREADABLE failure if the file cannot be decoded
     */
    ElaOutcome analyzeFile(const std::string &image_path) const;

    const ElaOptions &options() const { return options_; }

    /**
     * @brief Score in [0, 100] from the difference-image statistics
     *
     * Brightness and variance each contribute up to 50 points. A difference
     * image with no non-zero pixel scores a flat 50.
     */
    static double scoreFromMetrics(const ElaMetrics &metrics);

protected:
    /**
     * @brief JPEG round trip of the original at the given quality
     *
     * The encoded buffer only lives for the duration of this call.
     * @throws std::runtime_error if encoding or decoding fails
     */
    virtual cv::Mat recompress(const cv::Mat &bgr, int jpeg_quality) const;

private:
    std::string persistVisualization(const cv::Mat &ela_image) const;

    ElaOptions options_;
};
