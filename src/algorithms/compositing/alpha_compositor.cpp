#include "algorithms/compositing/alpha_compositor.h"
#include "core/cancellation_token.h"
#include "core/cutout_error.h"
#include "core/image_conversion.h"
#include <QDebug>
#include <QElapsedTimer>
#include <cmath>
#include <new>
#include <vector>

namespace {

void throwIfCancelled(const CancellationToken *token, const char *stage)
{
    if (token && token->isCancelled()) {
        throw CutoutError(CutoutError::Kind::Cancelled,
                          QStringLiteral("compositing cancelled before %1").arg(QLatin1String(stage)));
    }
}

} // namespace

cv::Mat premultiplyBgra(const cv::Mat &bgra)
{
    CV_Assert(bgra.type() == CV_8UC4);

    cv::Mat unit;
    bgra.convertTo(unit, CV_32F, 1.0 / 255.0);

    std::vector<cv::Mat> channels;
    cv::split(unit, channels);
    for (int c = 0; c < 3; ++c) {
        channels[c] = channels[c].mul(channels[3]);
    }

    cv::Mat premultiplied;
    cv::merge(channels, premultiplied);
    return premultiplied;
}

cv::Mat unpremultiplyBgra(const cv::Mat &premultiplied)
{
    CV_Assert(premultiplied.type() == CV_32FC4);

    std::vector<cv::Mat> channels;
    cv::split(premultiplied, channels);

    cv::Mat &alpha = channels[3];
    cv::min(alpha, 1.0, alpha);
    cv::max(alpha, 0.0, alpha);

    cv::Mat transparent = alpha <= 0.0f;
    cv::Mat safeAlpha;
    cv::max(alpha, 1e-6, safeAlpha);

    for (int c = 0; c < 3; ++c) {
        cv::min(channels[c], alpha, channels[c]);
        cv::max(channels[c], 0.0, channels[c]);
        cv::divide(channels[c], safeAlpha, channels[c]);
        channels[c].setTo(0.0f, transparent);
    }

    cv::Mat unit;
    cv::merge(channels, unit);

    cv::Mat bgra;
    unit.convertTo(bgra, CV_8U, 255.0);
    return bgra;
}

void compositeOver(cv::Mat &destination, const cv::Mat &source)
{
    CV_Assert(destination.type() == CV_32FC4 && source.type() == CV_32FC4);
    CV_Assert(destination.size() == source.size());

    cv::Mat sourceAlpha;
    cv::extractChannel(source, sourceAlpha, 3);

    cv::Mat inverse = 1.0 - sourceAlpha;
    cv::Mat inverse4;
    cv::merge(std::vector<cv::Mat>{inverse, inverse, inverse, inverse}, inverse4);

    destination = source + destination.mul(inverse4);
}

AlphaCompositor::AlphaCompositor(const CompositorSettings &settings)
{
    setSettings(settings);
}

void AlphaCompositor::setSettings(const CompositorSettings &settings)
{
    m_settings.sharpenRadius = qMax(0.0, settings.sharpenRadius);
    m_settings.sharpenIntensity = qBound(0.0, settings.sharpenIntensity, 4.0);
}

cv::Mat AlphaCompositor::composite(const cv::Mat &mask, const cv::Mat &image, const CancellationToken *token) const
{
    return maskImage(mask, image, token);
}

cv::Mat AlphaCompositor::applyExternalMask(const cv::Mat &mask, const cv::Mat &image,
                                           const CancellationToken *token) const
{
    qDebug() << "AlphaCompositor: Applying edited mask" << mask.cols << "x" << mask.rows
             << "to image" << image.cols << "x" << image.rows;
    return maskImage(mask, image, token);
}

cv::Mat AlphaCompositor::maskImage(const cv::Mat &mask, const cv::Mat &image, const CancellationToken *token) const
{
    if (mask.empty() || mask.total() == 0) {
        throw CutoutError(CutoutError::Kind::CompositingFailed, QStringLiteral("mask buffer is empty"));
    }
    if (image.empty() || image.total() == 0) {
        throw CutoutError(CutoutError::Kind::CompositingFailed, QStringLiteral("image buffer is empty"));
    }

    cv::Mat alpha = toAlphaMask(mask);
    cv::Mat bgra = toBgra(image);

    QElapsedTimer timer;
    timer.start();

    try {
        throwIfCancelled(token, "resampling");
        alpha = resampleMask(alpha, bgra.size());

        cv::Mat alpha8;
        alpha.convertTo(alpha8, CV_8U, 255.0);
        cv::insertChannel(alpha8, bgra, 3);

        throwIfCancelled(token, "sharpening");
        cv::Mat premultiplied = premultiplyBgra(bgra);
        sharpenEdges(premultiplied);

        throwIfCancelled(token, "un-premultiply");
        cv::Mat cutout = unpremultiplyBgra(premultiplied);

        qint64 elapsed = timer.elapsed();
        if (elapsed > 5) {
            qDebug() << "AlphaCompositor: Cutout" << cutout.cols << "x" << cutout.rows << "in" << elapsed << "ms";
        }
        return cutout;
    } catch (const cv::Exception &e) {
        qWarning() << "AlphaCompositor: OpenCV error while masking:" << e.what();
        throw CutoutError(CutoutError::Kind::CompositingFailed, QString::fromStdString(e.msg));
    } catch (const std::bad_alloc &) {
        qWarning() << "AlphaCompositor: Out of memory for" << image.cols << "x" << image.rows << "cutout";
        throw CutoutError(CutoutError::Kind::CompositingFailed, QStringLiteral("out of memory"));
    }
}

cv::Mat AlphaCompositor::resampleMask(const cv::Mat &alpha, const cv::Size &size) const
{
    if (alpha.size() == size) {
        return alpha;
    }

    cv::Mat resized;
    cv::resize(alpha, resized, size, 0, 0, cv::INTER_LANCZOS4);
    cv::min(resized, 1.0, resized);
    cv::max(resized, 0.0, resized);
    return resized;
}

void AlphaCompositor::sharpenEdges(cv::Mat &premultiplied) const
{
    const double sigma = m_settings.sharpenRadius;
    const double amount = m_settings.sharpenIntensity;
    if (sigma <= 0.0 || amount <= 0.0) {
        return;
    }

    const int kernelSize = 2 * static_cast<int>(std::ceil(3.0 * sigma)) + 1;
    cv::Mat blurred;
    cv::GaussianBlur(premultiplied, blurred, cv::Size(kernelSize, kernelSize), sigma, sigma, cv::BORDER_REPLICATE);

    // src + amount * (src - blurred)
    cv::addWeighted(premultiplied, 1.0 + amount, blurred, -amount, 0.0, premultiplied);
    cv::min(premultiplied, cv::Scalar::all(1.0), premultiplied);
    cv::max(premultiplied, cv::Scalar::all(0.0), premultiplied);
}

cv::Mat AlphaCompositor::compositeOntoOverlay(const cv::Mat &subject, const cv::Mat &overlay) const
{
    if (subject.empty() || overlay.empty()) {
        throw CutoutError(CutoutError::Kind::CompositingFailed, QStringLiteral("subject or overlay is empty"));
    }

    cv::Mat subjectBgra = toBgra(subject);
    cv::Mat overlayBgra = toBgra(overlay);

    try {
        const cv::Size target = subjectBgra.size();
        const double scale = std::max(static_cast<double>(target.width) / overlayBgra.cols,
                                      static_cast<double>(target.height) / overlayBgra.rows);
        const cv::Size scaled(std::max(target.width, static_cast<int>(std::lround(overlayBgra.cols * scale))),
                              std::max(target.height, static_cast<int>(std::lround(overlayBgra.rows * scale))));

        cv::Mat overlayPremultiplied = premultiplyBgra(overlayBgra);
        cv::Mat resized;
        cv::resize(overlayPremultiplied, resized, scaled, 0, 0, scale < 1.0 ? cv::INTER_AREA : cv::INTER_CUBIC);

        cv::Rect crop((scaled.width - target.width) / 2, (scaled.height - target.height) / 2,
                      target.width, target.height);
        cv::Mat canvas = resized(crop).clone();
        cv::min(canvas, cv::Scalar::all(1.0), canvas);
        cv::max(canvas, cv::Scalar::all(0.0), canvas);

        compositeOver(canvas, premultiplyBgra(subjectBgra));
        return unpremultiplyBgra(canvas);
    } catch (const cv::Exception &e) {
        qWarning() << "AlphaCompositor: Overlay compositing failed:" << e.what();
        throw CutoutError(CutoutError::Kind::CompositingFailed, QString::fromStdString(e.msg));
    }
}
