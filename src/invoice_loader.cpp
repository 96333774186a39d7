#include "core/invoice_loader.hpp"
#include "core/exif_reader.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <memory>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <poppler-document.h>
#include <poppler-image.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>

bool InvoiceLoader::isPdfName(const std::string &filename)
{
    return FileUtils::getFileExtension(filename) == "pdf";
}

InvoiceImage InvoiceLoader::loadFile(const std::string &file_path, int pdf_dpi)
{
    std::vector<uint8_t> data;
    try
    {
        data = FileUtils::readFileBytes(file_path);
    }
    catch (const std::runtime_error &e)
    {
        throw InvalidInvoiceError(e.what());
    }
    return loadFromMemory(data, file_path, pdf_dpi);
}

InvoiceImage InvoiceLoader::loadFromMemory(const std::vector<uint8_t> &data, const std::string &filename,
                                           int pdf_dpi)
{
    if (data.empty())
    {
        throw InvalidInvoiceError("Uploaded file is empty: " + filename);
    }

    if (isPdfName(filename))
    {
        InvoiceImage invoice(renderPdfFirstPage(data, pdf_dpi), NoCaptureMetadata{"PDF input"});
        invoice.is_pdf = true;
        Logger::info("Rendered first PDF page of " + filename + " at " + std::to_string(pdf_dpi) +
                     " dpi: " + std::to_string(invoice.width()) + "x" + std::to_string(invoice.height()));
        return invoice;
    }

    cv::Mat pixels;
    try
    {
        pixels = cv::imdecode(data, cv::IMREAD_COLOR | cv::IMREAD_IGNORE_ORIENTATION);
    }
    catch (const cv::Exception &e)
    {
        throw InvalidInvoiceError("Could not decode image " + filename + ": " + e.what());
    }
    if (pixels.empty())
    {
        throw InvalidInvoiceError("Could not decode image: " + filename);
    }

    Logger::info("Decoded " + filename + ": " + std::to_string(pixels.cols) + "x" + std::to_string(pixels.rows));
    return InvoiceImage(std::move(pixels), ExifReader::extract(data));
}

cv::Mat InvoiceLoader::renderPdfFirstPage(const std::vector<uint8_t> &data, int dpi)
{
    if (dpi <= 0)
    {
        throw std::invalid_argument("PDF render DPI must be positive: " + std::to_string(dpi));
    }

    // poppler keeps a pointer into data for the lifetime of the document
    std::unique_ptr<poppler::document> doc(poppler::document::load_from_raw_data(
        reinterpret_cast<const char *>(data.data()), static_cast<int>(data.size())));
    if (!doc)
    {
        throw InvalidInvoiceError("Failed to load PDF document");
    }
    if (doc->is_locked())
    {
        throw InvalidInvoiceError("PDF document is password protected");
    }
    if (doc->pages() < 1)
    {
        throw InvalidInvoiceError("PDF has no pages");
    }

    std::unique_ptr<poppler::page> page(doc->create_page(0));
    if (!page)
    {
        throw InvalidInvoiceError("Failed to open first PDF page");
    }

    poppler::page_renderer renderer;
    renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
    renderer.set_image_format(poppler::image::format_argb32);

    poppler::image rendered = renderer.render_page(page.get(), dpi, dpi);
    if (!rendered.is_valid())
    {
        throw InvalidInvoiceError("Failed to render first PDF page");
    }

    const int width = rendered.width();
    const int height = rendered.height();
    const size_t stride = static_cast<size_t>(rendered.bytes_per_row());
    char *pixels = const_cast<char *>(rendered.const_data());

    cv::Mat bgr;
    switch (rendered.format())
    {
    case poppler::image::format_argb32:
        // Native-endian ARGB32 is BGRA in memory
        cv::cvtColor(cv::Mat(height, width, CV_8UC4, pixels, stride), bgr, cv::COLOR_BGRA2BGR);
        break;
    case poppler::image::format_rgb24:
        cv::cvtColor(cv::Mat(height, width, CV_8UC3, pixels, stride), bgr, cv::COLOR_RGB2BGR);
        break;
    case poppler::image::format_bgr24:
        bgr = cv::Mat(height, width, CV_8UC3, pixels, stride).clone();
        break;
    case poppler::image::format_gray8:
        cv::cvtColor(cv::Mat(height, width, CV_8UC1, pixels, stride), bgr, cv::COLOR_GRAY2BGR);
        break;
    default:
        throw InvalidInvoiceError("Unsupported PDF render format");
    }
    return bgr;
}
