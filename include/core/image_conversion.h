#ifndef IMAGE_CONVERSION_H
#define IMAGE_CONVERSION_H

#include <QImage>
#include <opencv2/opencv.hpp>

// Presentation boundary: deep-copying conversions between OpenCV and Qt rasters
QImage cvMatToQImage(const cv::Mat &mat);
cv::Mat qImageToCvMat(const QImage &image);

/**
 * @brief Normalise a single-channel mask into an AlphaMask
 *
 * Accepts 8-bit, 16-bit and floating point buffers. Integer masks are scaled
 * to [0,1]; float masks are clamped. Throws CutoutError(InvalidInput) for
 * empty or multi-channel input.
 */
cv::Mat toAlphaMask(const cv::Mat &mask);

// Convert any supported source image (gray, BGR, BGRA) to 8-bit BGRA
cv::Mat toBgra(const cv::Mat &image);

#endif // IMAGE_CONVERSION_H
