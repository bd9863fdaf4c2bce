#include "algorithms/compositing/auto_fit_scaler.h"
#include "core/layer_model.h"
#include <QDebug>
#include <algorithm>

double AutoFitScaler::computeScale(const cv::Size2d &subjectSize,
                                   const cv::Size2d &canvasSize,
                                   const AutoFitSettings &settings)
{
    if (!(subjectSize.width > 0.0) || !(subjectSize.height > 0.0)
        || !(canvasSize.width > 0.0) || !(canvasSize.height > 0.0)) {
        return 1.0;
    }

    const double targetHeight = canvasSize.height * settings.targetHeightFraction;
    const double heightScale = targetHeight / subjectSize.height;

    const double maxWidth = canvasSize.width * settings.maxWidthFraction;
    const double scaledWidth = subjectSize.width * heightScale;
    const double fitScale = scaledWidth > maxWidth ? maxWidth / subjectSize.width : heightScale;

    const double lower = std::min(settings.minScale, settings.maxScale);
    const double upper = std::max(settings.minScale, settings.maxScale);
    const double clamped = std::clamp(fitScale, lower, upper);

    qDebug() << "AutoFitScaler: subject" << subjectSize.width << "x" << subjectSize.height
             << "canvas" << canvasSize.width << "x" << canvasSize.height
             << "heightScale" << heightScale << "fitScale" << fitScale << "clamped" << clamped;
    return clamped;
}

void AutoFitScaler::fitLayer(Layer &layer, const cv::Size &canvasSize, const AutoFitSettings &settings)
{
    layer.transform.offsetX = 0.0;
    layer.transform.offsetY = 0.0;
    layer.transform.rotationDegrees = 0.0;
    layer.transform.scale = computeScale(cv::Size2d(layer.pixels.cols, layer.pixels.rows),
                                         cv::Size2d(canvasSize.width, canvasSize.height),
                                         settings);
}
