#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/invoice_image.hpp"

/**
 * @brief The input could not be turned into an invoice image
 *
 * Raised before any detector runs; callers report it as a rejected input.
 */
class InvalidInvoiceError : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Turns uploaded or on-disk files into InvoiceImage values
 *
 * Raster files are decoded with OpenCV and their EXIF block is read from the
 * same bytes. PDFs are rendered page-one-only with poppler.
 */
class InvoiceLoader
{
public:
    static constexpr int DEFAULT_PDF_DPI = 200;

    /**
     * @brief Load an invoice from disk
     * @throws InvalidInvoiceError if the file is missing, empty or not decodable
     */
    static InvoiceImage loadFile(const std::string &file_path, int pdf_dpi = DEFAULT_PDF_DPI);

    /**
     * @brief Load an invoice from an in-memory upload
     * @param data Raw file contents
     * @param filename Original name; only its extension is used (".pdf" selects the PDF path)
     * @throws InvalidInvoiceError if the data is empty or not decodable
     */
    static InvoiceImage loadFromMemory(const std::vector<uint8_t> &data, const std::string &filename,
                                       int pdf_dpi = DEFAULT_PDF_DPI);

    static bool isPdfName(const std::string &filename);

private:
    static cv::Mat renderPdfFirstPage(const std::vector<uint8_t> &data, int dpi);
};
