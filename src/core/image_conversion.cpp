#include "core/image_conversion.h"
#include "core/cutout_error.h"
#include <QDebug>

QImage cvMatToQImage(const cv::Mat &mat)
{
    switch (mat.type()) {
    case CV_8UC4: {
        // Little-endian ARGB32 stores bytes as B,G,R,A which matches BGRA
        QImage image(mat.data, mat.cols, mat.rows, static_cast<qsizetype>(mat.step), QImage::Format_ARGB32);
        return image.copy();
    }
    case CV_8UC3: {
        QImage image(mat.data, mat.cols, mat.rows, static_cast<qsizetype>(mat.step), QImage::Format_RGB888);
        return image.rgbSwapped();
    }
    case CV_8UC1: {
        QImage image(mat.data, mat.cols, mat.rows, static_cast<qsizetype>(mat.step), QImage::Format_Grayscale8);
        return image.copy();
    }
    default:
        qWarning() << "ImageConversion: Unsupported cv::Mat format:" << mat.type();
        return QImage();
    }
}

cv::Mat qImageToCvMat(const QImage &image)
{
    if (image.isNull()) {
        return cv::Mat();
    }

    QImage argb = image.convertToFormat(QImage::Format_ARGB32);
    cv::Mat view(argb.height(), argb.width(), CV_8UC4,
                 const_cast<uchar *>(argb.constBits()), static_cast<size_t>(argb.bytesPerLine()));
    return view.clone();
}

cv::Mat toAlphaMask(const cv::Mat &mask)
{
    if (mask.empty() || mask.cols <= 0 || mask.rows <= 0) {
        throw CutoutError(CutoutError::Kind::InvalidInput, QStringLiteral("mask is empty"));
    }
    if (mask.channels() != 1) {
        throw CutoutError(CutoutError::Kind::InvalidInput,
                          QStringLiteral("mask must be single-channel, got %1 channels").arg(mask.channels()));
    }

    cv::Mat alpha;
    switch (mask.depth()) {
    case CV_8U:
        mask.convertTo(alpha, CV_32F, 1.0 / 255.0);
        break;
    case CV_16U:
        mask.convertTo(alpha, CV_32F, 1.0 / 65535.0);
        break;
    case CV_32F:
    case CV_64F:
        mask.convertTo(alpha, CV_32F);
        break;
    default:
        throw CutoutError(CutoutError::Kind::InvalidInput,
                          QStringLiteral("unsupported mask depth %1").arg(mask.depth()));
    }

    // NaN compares false against both bounds, so patch it first
    cv::patchNaNs(alpha, 0.0);
    cv::min(alpha, 1.0, alpha);
    cv::max(alpha, 0.0, alpha);
    return alpha;
}

cv::Mat toBgra(const cv::Mat &image)
{
    if (image.empty()) {
        throw CutoutError(CutoutError::Kind::InvalidInput, QStringLiteral("image is empty"));
    }
    if (image.depth() != CV_8U) {
        throw CutoutError(CutoutError::Kind::InvalidInput,
                          QStringLiteral("image must be 8-bit, got depth %1").arg(image.depth()));
    }

    cv::Mat bgra;
    switch (image.channels()) {
    case 1:
        cv::cvtColor(image, bgra, cv::COLOR_GRAY2BGRA);
        break;
    case 3:
        cv::cvtColor(image, bgra, cv::COLOR_BGR2BGRA);
        break;
    case 4:
        bgra = image.clone();
        break;
    default:
        throw CutoutError(CutoutError::Kind::InvalidInput,
                          QStringLiteral("unsupported channel count %1").arg(image.channels()));
    }
    return bgra;
}
