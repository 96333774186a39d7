#pragma once

#include <mutex>
#include <string>
#include <opencv2/core.hpp>

/**
 * @brief Result of probing an OCR engine before use
 */
struct OcrEngineStatus
{
    bool available = false;
    std::string version;
    std::string error; // Set when available is false
};

/**
 * @brief Text extraction backend used by the OCR validator
 *
 * Implementations must be safe to call from several threads at once.
 */
class OcrEngine
{
public:
    virtual ~OcrEngine() = default;

    // Check that the engine and its language data can be loaded. Called before every validation.
    virtual OcrEngineStatus probe() const = 0;

    /**
     * @brief Recognize text in a preprocessed image
     * @param image 8-bit gray or BGR image
     * @return UTF-8 text (may be empty)
     * @throws std::runtime_error if recognition fails
     */
    virtual std::string extractText(const cv::Mat &image) const = 0;
};

struct OcrOptions
{
    std::string language = "eng";
    std::string tessdata_path; // Empty -> TESSDATA_PREFIX or the build default
    int page_seg_mode = 3;     // tesseract::PSM_AUTO
};

/**
 * @brief Tesseract backed OCR engine
 *
 * Each extraction creates its own TessBaseAPI, so one engine can serve
 * concurrent requests. probe() initializes the language data once per engine
 * and returns the cached status afterwards.
 */
class TesseractOcrEngine : public OcrEngine
{
public:
    explicit TesseractOcrEngine(OcrOptions options = OcrOptions());

    OcrEngineStatus probe() const override;
    std::string extractText(const cv::Mat &image) const override;

    const OcrOptions &options() const { return options_; }

private:
    OcrEngineStatus initialProbe() const;

    OcrOptions options_;
    mutable std::once_flag probe_once_;
    mutable OcrEngineStatus probe_status_;
};
