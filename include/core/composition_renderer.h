#ifndef COMPOSITION_RENDERER_H
#define COMPOSITION_RENDERER_H

#include <opencv2/opencv.hpp>
#include "core/cutout_settings.h"

class CancellationToken;
class Composition;
struct Layer;

/**
 * @brief Deterministic rasterizer for a Composition
 *
 * Draw order:
 * 1. Fill with the base colour
 * 2. Background, aspect-fill scaled and centre-cropped
 * 3. Visible layers in ascending order, each under
 *    translate(canvasCentre + offset) * rotate(degrees) * scale(s),
 *    drawn centred on its own origin with opacity as a uniform alpha multiply
 *
 * render() never mutates the composition. Two renders of an unchanged
 * composition are byte-identical. An optional token is polled before the
 * background and before each layer.
 */
class CompositionRenderer
{
public:
    explicit CompositionRenderer(const RenderSettings &settings = RenderSettings());

    /**
     * @return CV_8UC4 BGRA raster of exactly composition.canvasSize()
     * @throws CutoutError InvalidGeometry when the canvas has zero area,
     *         Cancelled when the token fires mid-render
     */
    cv::Mat render(const Composition &composition, const CancellationToken *token = nullptr) const;

    /**
     * @brief 2x3 affine that maps layer pixel indices to canvas pixel indices
     *
     * Built in continuous coordinates (pixel centres at +0.5) so the layer
     * centre lands exactly on canvasCentre + offset.
     */
    static cv::Matx23d layerTransformMatrix(const Layer &layer, const cv::Size &canvasSize);

    void setSettings(const RenderSettings &settings) { m_settings = settings; }
    const RenderSettings &settings() const { return m_settings; }

private:
    void drawBackground(cv::Mat &canvas, const cv::Mat &background) const;
    void drawLayer(cv::Mat &canvas, const Layer &layer) const;

    RenderSettings m_settings;
};

#endif // COMPOSITION_RENDERER_H
