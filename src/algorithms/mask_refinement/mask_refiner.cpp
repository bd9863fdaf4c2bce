#include "algorithms/mask_refinement/mask_refiner.h"
#include "core/cancellation_token.h"
#include "core/cutout_error.h"
#include "core/image_conversion.h"
#include <QDebug>
#include <QElapsedTimer>
#include <algorithm>
#include <cmath>

namespace {

void throwIfCancelled(const CancellationToken *token, const char *stage)
{
    if (token && token->isCancelled()) {
        throw CutoutError(CutoutError::Kind::Cancelled,
                          QStringLiteral("mask refinement cancelled before %1").arg(QLatin1String(stage)));
    }
}

void clampUnit(cv::Mat &mask)
{
    cv::min(mask, 1.0, mask);
    cv::max(mask, 0.0, mask);
}

} // namespace

MaskRefiner::MaskRefiner(const MaskRefinerSettings &settings)
{
    setSettings(settings);
}

void MaskRefiner::setSettings(const MaskRefinerSettings &settings)
{
    m_settings = settings;
    m_settings.erosionRadius = qMax(0.0, settings.erosionRadius);
    m_settings.dilationRadius = qMax(0.0, settings.dilationRadius);
    m_settings.gammaPower = qMax(0.01, settings.gammaPower);
    m_settings.blurRadius = qMax(0.0, settings.blurRadius);
    m_settings.contrast = qMax(0.0, settings.contrast);
}

cv::Mat MaskRefiner::diskKernel(double radius)
{
    const int reach = static_cast<int>(std::ceil(qMax(0.0, radius)));
    const int size = 2 * reach + 1;
    cv::Mat kernel = cv::Mat::zeros(size, size, CV_8U);
    const double r2 = radius * radius;
    for (int dy = -reach; dy <= reach; ++dy) {
        for (int dx = -reach; dx <= reach; ++dx) {
            if (dx * dx + dy * dy <= r2) {
                kernel.at<uchar>(dy + reach, dx + reach) = 1;
            }
        }
    }
    return kernel;
}

cv::Mat MaskRefiner::refine(const cv::Mat &raw, const cv::Size &targetSize, const CancellationToken *token) const
{
    if (raw.empty() || raw.cols <= 0 || raw.rows <= 0) {
        throw CutoutError(CutoutError::Kind::InvalidInput, QStringLiteral("raw mask has zero area"));
    }
    if (!targetSize.empty() && (targetSize.width <= 0 || targetSize.height <= 0)) {
        throw CutoutError(CutoutError::Kind::InvalidInput,
                          QStringLiteral("target size %1x%2 has zero area").arg(targetSize.width).arg(targetSize.height));
    }

    QElapsedTimer timer;
    timer.start();

    cv::Mat mask = toAlphaMask(raw);

    try {
        throwIfCancelled(token, "resampling");
        mask = resampleToTarget(mask, targetSize);

        throwIfCancelled(token, "erosion");
        erode(mask);

        throwIfCancelled(token, "dilation");
        dilate(mask);

        throwIfCancelled(token, "gamma");
        adjustGamma(mask);

        throwIfCancelled(token, "blur");
        feather(mask);

        throwIfCancelled(token, "contrast");
        boostContrast(mask);
    } catch (const cv::Exception &e) {
        qWarning() << "MaskRefiner: OpenCV error during refinement:" << e.what();
        throw CutoutError(CutoutError::Kind::CompositingFailed,
                          QStringLiteral("mask refinement failed: %1").arg(QString::fromStdString(e.msg)));
    }

    qint64 elapsed = timer.elapsed();
    if (elapsed > 5) {
        qDebug() << "MaskRefiner: Refined" << raw.cols << "x" << raw.rows << "->"
                 << mask.cols << "x" << mask.rows << "in" << elapsed << "ms";
    }

    return mask;
}

cv::Mat MaskRefiner::resampleToTarget(const cv::Mat &mask, const cv::Size &targetSize) const
{
    if (targetSize.empty() || targetSize == mask.size()) {
        return mask;
    }

    cv::Mat resized;
    cv::resize(mask, resized, targetSize, 0, 0, cv::INTER_CUBIC);
    // Bicubic overshoots near hard edges
    clampUnit(resized);
    return resized;
}

void MaskRefiner::erode(cv::Mat &mask) const
{
    if (m_settings.erosionRadius <= 0.0) {
        return;
    }
    cv::erode(mask, mask, diskKernel(m_settings.erosionRadius), cv::Point(-1, -1), 1, cv::BORDER_REPLICATE);
}

void MaskRefiner::dilate(cv::Mat &mask) const
{
    if (m_settings.dilationRadius <= 0.0) {
        return;
    }
    cv::dilate(mask, mask, diskKernel(m_settings.dilationRadius), cv::Point(-1, -1), 1, cv::BORDER_REPLICATE);
}

void MaskRefiner::adjustGamma(cv::Mat &mask) const
{
    cv::pow(mask, m_settings.gammaPower, mask);
}

void MaskRefiner::feather(cv::Mat &mask) const
{
    const double sigma = m_settings.blurRadius;
    if (sigma <= 0.0) {
        return;
    }
    const int kernelSize = 2 * static_cast<int>(std::ceil(3.0 * sigma)) + 1;
    cv::GaussianBlur(mask, mask, cv::Size(kernelSize, kernelSize), sigma, sigma, cv::BORDER_REPLICATE);
}

void MaskRefiner::boostContrast(cv::Mat &mask) const
{
    const double contrast = m_settings.contrast;
    mask.convertTo(mask, CV_32F, contrast, 0.5 * (1.0 - contrast));
    clampUnit(mask);
}

cv::Mat MaskRefiner::mergeInstanceMasks(const std::vector<cv::Mat> &instances, bool allowMultipleSubjects)
{
    if (instances.empty()) {
        throw CutoutError(CutoutError::Kind::NoSubjectDetected, QStringLiteral("segmentation returned no instances"));
    }

    cv::Mat merged;
    int subjectCount = 0;
    for (const cv::Mat &instance : instances) {
        if (instance.empty()) {
            continue;
        }
        cv::Mat alpha = toAlphaMask(instance);
        if (cv::countNonZero(alpha) == 0) {
            continue;
        }
        if (merged.empty()) {
            merged = alpha;
        } else if (alpha.size() != merged.size()) {
            throw CutoutError(CutoutError::Kind::InvalidInput,
                              QStringLiteral("instance masks differ in size (%1x%2 vs %3x%4)")
                                  .arg(alpha.cols).arg(alpha.rows).arg(merged.cols).arg(merged.rows));
        } else {
            cv::max(merged, alpha, merged);
        }
        ++subjectCount;
    }

    if (subjectCount == 0) {
        throw CutoutError(CutoutError::Kind::NoSubjectDetected, QStringLiteral("no instance contains foreground"));
    }
    if (subjectCount > 1 && !allowMultipleSubjects) {
        throw CutoutError(CutoutError::Kind::MultipleSubjectsDetected,
                          QStringLiteral("%1 subjects detected, only one allowed").arg(subjectCount));
    }

    qDebug() << "MaskRefiner: Merged" << subjectCount << "subject instance(s)";
    return merged;
}
