#ifndef MASK_REFINER_H
#define MASK_REFINER_H

#include <opencv2/opencv.hpp>
#include <vector>
#include "core/cutout_settings.h"

class CancellationToken;

/**
 * @brief Turns a raw foreground probability map into a feathered AlphaMask
 *
 * Fixed stage order:
 * 1. Erosion   - pulls the boundary inward to drop the detector halo
 * 2. Dilation  - smaller radius, recovers detail lost to erosion
 * 3. Gamma     - tightens the visual boundary
 * 4. Blur      - soft feathered transition band
 * 5. Contrast  - sharpens the band around mid-gray
 *
 * refine() is pure: the input is never modified and the same input always
 * produces the same output.
 */
class MaskRefiner
{
public:
    explicit MaskRefiner(const MaskRefinerSettings &settings = MaskRefinerSettings());

    /**
     * @brief Refine a raw mask
     * @param raw Single-channel probability map (8/16-bit or float)
     * @param targetSize Source image resolution; empty keeps the raw resolution
     * @param token Optional cancellation token polled between stages
     * @return CV_32FC1 AlphaMask with values in [0,1]
     * @throws CutoutError InvalidInput for zero-area or malformed masks,
     *         Cancelled when the token fires
     */
    cv::Mat refine(const cv::Mat &raw,
                   const cv::Size &targetSize = cv::Size(),
                   const CancellationToken *token = nullptr) const;

    /**
     * @brief Merge per-instance probability maps from the segmentation oracle
     *
     * Pixel-wise maximum of all instances. Throws NoSubjectDetected when no
     * instance carries any foreground, MultipleSubjectsDetected when more than
     * one instance is given and multiple subjects are not allowed.
     */
    static cv::Mat mergeInstanceMasks(const std::vector<cv::Mat> &instances, bool allowMultipleSubjects);

    void setSettings(const MaskRefinerSettings &settings);
    const MaskRefinerSettings &settings() const { return m_settings; }

    // Disk structuring element holding every offset with dx^2 + dy^2 <= radius^2
    static cv::Mat diskKernel(double radius);

private:
    cv::Mat resampleToTarget(const cv::Mat &mask, const cv::Size &targetSize) const;
    void erode(cv::Mat &mask) const;
    void dilate(cv::Mat &mask) const;
    void adjustGamma(cv::Mat &mask) const;
    void feather(cv::Mat &mask) const;
    void boostContrast(cv::Mat &mask) const;

    MaskRefinerSettings m_settings;
};

#endif // MASK_REFINER_H
