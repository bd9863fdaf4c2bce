#ifndef COMPOSITION_BUILDER_H
#define COMPOSITION_BUILDER_H

#include <QList>
#include <QString>
#include <opencv2/opencv.hpp>
#include "core/composition_renderer.h"
#include "core/cutout_settings.h"
#include "core/layer_model.h"

/**
 * @brief Creates subject compositions and keeps their placement up to date
 *
 * Each committed cutout becomes its own composition: one subject layer at
 * order 0, centred, scaled by AutoFitScaler, over a shared background.
 */
class CompositionBuilder
{
public:
    explicit CompositionBuilder(const CutoutSettings &settings = CutoutSettings());

    Composition createSubjectComposition(const QString &name,
                                         const cv::Mat &cutout,
                                         const cv::Mat &background,
                                         const cv::Size &canvasSize) const;

    // One composition per non-empty cutout; empty cutouts are skipped
    QList<Composition> createCompositionsForSubjects(const QList<cv::Mat> &cutouts,
                                                     const cv::Mat &background,
                                                     const cv::Size &canvasSize) const;

    /**
     * @brief Re-run auto-fit on every subject layer
     * @return Number of layers whose scale moved by more than the threshold
     */
    int rescaleSubjectLayers(Composition &composition, const cv::Size &canvasSize) const;

    // Render every composition; failures are logged and skipped
    QList<cv::Mat> exportCompositions(const QList<Composition> &compositions) const;

    static constexpr double kRescaleThreshold = 0.05;

private:
    CutoutSettings m_settings;
    CompositionRenderer m_renderer;
};

#endif // COMPOSITION_BUILDER_H
