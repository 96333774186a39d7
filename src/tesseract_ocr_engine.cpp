#include "core/ocr_engine.hpp"
#include "logging/logger.hpp"
#include <memory>
#include <stdexcept>
#include <opencv2/imgproc.hpp>
#include <tesseract/baseapi.h>

namespace
{
    // Owns one initialised TessBaseAPI; End() runs on every exit path
    class TesseractSession
    {
    public:
        TesseractSession() : api_(std::make_unique<tesseract::TessBaseAPI>()) {}
        ~TesseractSession()
        {
            if (initialized_)
                api_->End();
        }

        TesseractSession(const TesseractSession &) = delete;
        TesseractSession &operator=(const TesseractSession &) = delete;

        bool init(const OcrOptions &options)
        {
            const char *datapath = options.tessdata_path.empty() ? nullptr : options.tessdata_path.c_str();
            initialized_ = api_->Init(datapath, options.language.c_str(), tesseract::OEM_DEFAULT) == 0;
            return initialized_;
        }

        tesseract::TessBaseAPI *get() { return api_.get(); }

    private:
        std::unique_ptr<tesseract::TessBaseAPI> api_;
        bool initialized_ = false;
    };

    struct TextDeleter
    {
        void operator()(char *text) const { delete[] text; }
    };
}

TesseractOcrEngine::TesseractOcrEngine(OcrOptions options) : options_(std::move(options))
{
}

OcrEngineStatus TesseractOcrEngine::probe() const
{
    std::call_once(probe_once_, [this]()
                   { probe_status_ = initialProbe(); });
    return probe_status_;
}

OcrEngineStatus TesseractOcrEngine::initialProbe() const
{
    OcrEngineStatus status;
    status.version = tesseract::TessBaseAPI::Version();

    TesseractSession session;
    if (!session.init(options_))
    {
        status.error = "Could not initialize tesseract with language '" + options_.language + "'" +
                       (options_.tessdata_path.empty() ? "" : " from " + options_.tessdata_path);
        Logger::warn("Tesseract unavailable: " + status.error);
        return status;
    }

    status.available = true;
    Logger::debug("Tesseract " + status.version + " available for language " + options_.language);
    return status;
}

std::string TesseractOcrEngine::extractText(const cv::Mat &image) const
{
    if (image.empty() || image.depth() != CV_8U)
    {
        throw std::runtime_error("OCR input must be a non-empty 8-bit image");
    }

    cv::Mat pixels;
    switch (image.channels())
    {
    case 1:
        pixels = image.isContinuous() ? image : image.clone();
        break;
    case 3:
        cv::cvtColor(image, pixels, cv::COLOR_BGR2RGB);
        break;
    case 4:
        cv::cvtColor(image, pixels, cv::COLOR_BGRA2RGB);
        break;
    default:
        throw std::runtime_error("Unsupported channel count for OCR: " + std::to_string(image.channels()));
    }

    TesseractSession session;
    if (!session.init(options_))
    {
        throw std::runtime_error("Could not initialize tesseract with language '" + options_.language + "'");
    }

    tesseract::TessBaseAPI *api = session.get();
    api->SetPageSegMode(static_cast<tesseract::PageSegMode>(options_.page_seg_mode));
    api->SetImage(pixels.data, pixels.cols, pixels.rows, static_cast<int>(pixels.elemSize()),
                  static_cast<int>(pixels.step));

    if (api->Recognize(nullptr) != 0)
    {
        throw std::runtime_error("Tesseract recognition failed");
    }

    std::unique_ptr<char[], TextDeleter> text(api->GetUTF8Text());
    if (!text)
    {
        throw std::runtime_error("Tesseract returned no text buffer");
    }
    return std::string(text.get());
}
