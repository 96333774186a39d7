#include "core/invoice_image.hpp"
#include <stdexcept>
#include <opencv2/imgproc.hpp>

cv::Mat InvoiceImage::toBgr8(const cv::Mat &image)
{
    cv::Mat eight_bit;
    switch (image.depth())
    {
    case CV_8U:
        eight_bit = image;
        break;
    case CV_16U:
        image.convertTo(eight_bit, CV_8U, 1.0 / 257.0);
        break;
    case CV_32F:
    case CV_64F:
        // Floating point rasters are expected in [0, 1]
        image.convertTo(eight_bit, CV_8U, 255.0);
        break;
    default:
        image.convertTo(eight_bit, CV_8U);
        break;
    }

    cv::Mat bgr;
    switch (eight_bit.channels())
    {
    case 1:
        cv::cvtColor(eight_bit, bgr, cv::COLOR_GRAY2BGR);
        break;
    case 3:
        bgr = eight_bit.clone();
        break;
    case 4:
        cv::cvtColor(eight_bit, bgr, cv::COLOR_BGRA2BGR);
        break;
    default:
        throw std::invalid_argument("Unsupported channel count for analysis: " +
                                    std::to_string(eight_bit.channels()));
    }
    return bgr;
}
