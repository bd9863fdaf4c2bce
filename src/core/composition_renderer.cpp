#include "core/composition_renderer.h"
#include "algorithms/compositing/alpha_compositor.h"
#include "core/cancellation_token.h"
#include "core/cutout_error.h"
#include "core/image_conversion.h"
#include "core/layer_model.h"
#include <QDebug>
#include <QElapsedTimer>
#include <algorithm>
#include <cmath>
#include <new>

namespace {

cv::Matx33d translation(double x, double y)
{
    return cv::Matx33d(1.0, 0.0, x,
                       0.0, 1.0, y,
                       0.0, 0.0, 1.0);
}

void throwIfCancelled(const CancellationToken *token, int drawnLayers)
{
    if (token && token->isCancelled()) {
        throw CutoutError(CutoutError::Kind::Cancelled,
                          QStringLiteral("render cancelled after %1 layer(s)").arg(drawnLayers));
    }
}

} // namespace

CompositionRenderer::CompositionRenderer(const RenderSettings &settings)
    : m_settings(settings)
{
}

cv::Matx23d CompositionRenderer::layerTransformMatrix(const Layer &layer, const cv::Size &canvasSize)
{
    const double radians = layer.transform.rotationDegrees * CV_PI / 180.0;
    const double c = std::cos(radians);
    const double s = std::sin(radians);
    const double k = layer.transform.scale;

    const cv::Matx33d rotate(c, -s, 0.0,
                             s, c, 0.0,
                             0.0, 0.0, 1.0);
    const cv::Matx33d scale(k, 0.0, 0.0,
                            0.0, k, 0.0,
                            0.0, 0.0, 1.0);

    const cv::Matx33d continuous =
        translation(canvasSize.width / 2.0 + layer.transform.offsetX,
                    canvasSize.height / 2.0 + layer.transform.offsetY)
        * rotate * scale
        * translation(-layer.pixels.cols / 2.0, -layer.pixels.rows / 2.0);

    // Pixel index i covers [i, i+1) in continuous space
    const cv::Matx33d indexed = translation(-0.5, -0.5) * continuous * translation(0.5, 0.5);

    return cv::Matx23d(indexed(0, 0), indexed(0, 1), indexed(0, 2),
                       indexed(1, 0), indexed(1, 1), indexed(1, 2));
}

cv::Mat CompositionRenderer::render(const Composition &composition, const CancellationToken *token) const
{
    const cv::Size canvasSize = composition.canvasSize();
    if (canvasSize.width <= 0 || canvasSize.height <= 0) {
        throw CutoutError(CutoutError::Kind::InvalidGeometry,
                          QStringLiteral("canvas size %1x%2 has zero area").arg(canvasSize.width).arg(canvasSize.height));
    }

    QElapsedTimer timer;
    timer.start();

    const QList<Layer> layers = composition.layersInPaintOrder();
    int drawnLayers = 0;

    try {
        const cv::Scalar &base = m_settings.baseColor;
        const double baseAlpha = qBound(0.0, base[3] / 255.0, 1.0);
        cv::Mat canvas(canvasSize, CV_32FC4,
                       cv::Scalar(base[0] / 255.0 * baseAlpha, base[1] / 255.0 * baseAlpha,
                                  base[2] / 255.0 * baseAlpha, baseAlpha));

        throwIfCancelled(token, drawnLayers);
        if (composition.hasBackground()) {
            drawBackground(canvas, composition.background());
        }

        for (const Layer &layer : layers) {
            if (!layer.visible) {
                continue;
            }
            if (layer.pixels.empty()) {
                qWarning() << "CompositionRenderer: Skipping layer" << layer.name << "with no pixels";
                continue;
            }
            if (!(layer.transform.scale > 0.0)) {
                qWarning() << "CompositionRenderer: Skipping layer" << layer.name
                           << "with invalid scale" << layer.transform.scale;
                continue;
            }
            if (layer.opacity <= 0.0) {
                continue;
            }
            throwIfCancelled(token, drawnLayers);
            drawLayer(canvas, layer);
            ++drawnLayers;
        }

        cv::Mat result = unpremultiplyBgra(canvas);

        qDebug() << "CompositionRenderer: Rendered" << composition.name() << canvasSize.width << "x"
                 << canvasSize.height << "layers drawn:" << drawnLayers << "of" << layers.size()
                 << "background:" << composition.hasBackground() << "in" << timer.elapsed() << "ms";
        return result;
    } catch (const cv::Exception &e) {
        qWarning() << "CompositionRenderer: OpenCV error while rendering:" << e.what();
        throw CutoutError(CutoutError::Kind::CompositingFailed, QString::fromStdString(e.msg));
    } catch (const std::bad_alloc &) {
        qWarning() << "CompositionRenderer: Out of memory for" << canvasSize.width << "x" << canvasSize.height;
        throw CutoutError(CutoutError::Kind::CompositingFailed, QStringLiteral("out of memory"));
    }
}

void CompositionRenderer::drawBackground(cv::Mat &canvas, const cv::Mat &background) const
{
    const cv::Mat bgra = toBgra(background);
    const cv::Size target = canvas.size();

    // Aspect-fill: uniform scale so the background covers the canvas
    const double scale = std::max(static_cast<double>(target.width) / bgra.cols,
                                  static_cast<double>(target.height) / bgra.rows);
    const cv::Size scaled(std::max(target.width, static_cast<int>(std::lround(bgra.cols * scale))),
                          std::max(target.height, static_cast<int>(std::lround(bgra.rows * scale))));

    cv::Mat resized;
    cv::resize(premultiplyBgra(bgra), resized, scaled, 0, 0, scale < 1.0 ? cv::INTER_AREA : cv::INTER_CUBIC);

    const cv::Rect crop((scaled.width - target.width) / 2, (scaled.height - target.height) / 2,
                        target.width, target.height);
    cv::Mat cropped = resized(crop).clone();
    cv::min(cropped, cv::Scalar::all(1.0), cropped);
    cv::max(cropped, cv::Scalar::all(0.0), cropped);

    compositeOver(canvas, cropped);
}

void CompositionRenderer::drawLayer(cv::Mat &canvas, const Layer &layer) const
{
    const cv::Mat premultiplied = premultiplyBgra(toBgra(layer.pixels));
    const cv::Matx23d transform = layerTransformMatrix(layer, canvas.size());

    cv::Mat warped;
    cv::warpAffine(premultiplied, warped, cv::Mat(transform), canvas.size(),
                   cv::INTER_LINEAR, cv::BORDER_CONSTANT, cv::Scalar::all(0.0));

    const double opacity = qBound(0.0, layer.opacity, 1.0);
    if (opacity < 1.0) {
        warped *= opacity;
    }

    compositeOver(canvas, warped);
}
