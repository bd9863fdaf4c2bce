#ifndef AUTO_FIT_SCALER_H
#define AUTO_FIT_SCALER_H

#include <opencv2/core.hpp>
#include "core/cutout_settings.h"

struct Layer;

/**
 * @brief Initial placement scale for a subject on a canvas
 *
 * Targets the subject height to a fraction of the canvas height, falls back
 * to a width-driven scale when that would overflow horizontally, then clamps
 * to [minScale, maxScale]. Degenerate sizes give a neutral 1.0.
 */
class AutoFitScaler
{
public:
    static double computeScale(const cv::Size2d &subjectSize,
                               const cv::Size2d &canvasSize,
                               const AutoFitSettings &settings = AutoFitSettings());

    // Centre the layer and give it the fitted scale for its pixel size
    static void fitLayer(Layer &layer,
                         const cv::Size &canvasSize,
                         const AutoFitSettings &settings = AutoFitSettings());
};

#endif // AUTO_FIT_SCALER_H
