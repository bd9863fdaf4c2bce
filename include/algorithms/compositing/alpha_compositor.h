#ifndef ALPHA_COMPOSITOR_H
#define ALPHA_COMPOSITOR_H

#include <opencv2/opencv.hpp>
#include "core/cutout_settings.h"

class CancellationToken;

/**
 * @brief Masks a source image with an AlphaMask to produce a CutoutImage
 *
 * The mask is resampled to the image resolution (Lanczos), used as the
 * alpha channel over a fully transparent background, and the result gets a
 * mild unsharp mask to counter the feathering blur. Output resolution always
 * equals the source image resolution.
 *
 * An optional token is polled between the resampling, sharpening and
 * un-premultiply stages; a cancelled call throws CutoutError(Cancelled).
 */
class AlphaCompositor
{
public:
    explicit AlphaCompositor(const CompositorSettings &settings = CompositorSettings());

    // Mask straight out of MaskRefiner
    cv::Mat composite(const cv::Mat &mask, const cv::Mat &image, const CancellationToken *token = nullptr) const;

    // Mask produced by manual editing; same algorithm as composite()
    cv::Mat applyExternalMask(const cv::Mat &mask, const cv::Mat &image,
                              const CancellationToken *token = nullptr) const;

    /**
     * @brief Place a cutout over an overlay image
     *
     * The overlay is aspect-fill scaled and centered underneath the subject.
     * The result has the subject's size; areas the overlay does not cover
     * stay transparent.
     */
    cv::Mat compositeOntoOverlay(const cv::Mat &subject, const cv::Mat &overlay) const;

    void setSettings(const CompositorSettings &settings);
    const CompositorSettings &settings() const { return m_settings; }

private:
    cv::Mat maskImage(const cv::Mat &mask, const cv::Mat &image, const CancellationToken *token) const;
    cv::Mat resampleMask(const cv::Mat &alpha, const cv::Size &size) const;
    void sharpenEdges(cv::Mat &premultiplied) const;

    CompositorSettings m_settings;
};

// Straight BGRA 8-bit <-> premultiplied BGRA float in [0,1]
cv::Mat premultiplyBgra(const cv::Mat &bgra);
cv::Mat unpremultiplyBgra(const cv::Mat &premultiplied);

// Porter-Duff "over" on premultiplied float BGRA buffers of equal size
void compositeOver(cv::Mat &destination, const cv::Mat &source);

#endif // ALPHA_COMPOSITOR_H
