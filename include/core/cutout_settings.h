#ifndef CUTOUT_SETTINGS_H
#define CUTOUT_SETTINGS_H

#include <opencv2/core.hpp>

/**
 * @brief Tunable constants of the cutout pipeline
 *
 * The defaults reproduce the look of the shipped capture flow. Stage order in
 * MaskRefiner is fixed; only the magnitudes below are tunable.
 */

struct MaskRefinerSettings {
    double erosionRadius = 3.0;   // px, morphological minimum
    double dilationRadius = 1.5;  // px, morphological maximum (smaller than erosion)
    double gammaPower = 0.75;     // v^power
    double blurRadius = 2.5;      // Gaussian sigma in px
    double contrast = 1.3;        // around mid-gray 0.5
};

struct CompositorSettings {
    double sharpenRadius = 0.6;    // unsharp mask sigma
    double sharpenIntensity = 0.4; // unsharp mask amount
};

struct EditorSettings {
    int historyCapacity = 15; // undo snapshots kept per session
};

struct AutoFitSettings {
    double targetHeightFraction = 0.5; // subject height vs canvas height
    double maxWidthFraction = 0.85;    // horizontal margin guard
    double minScale = 0.3;
    double maxScale = 1.0;
};

struct RenderSettings {
    cv::Scalar baseColor = cv::Scalar(255, 255, 255, 255); // BGRA
};

struct CutoutSettings {
    MaskRefinerSettings refiner;
    CompositorSettings compositor;
    EditorSettings editor;
    AutoFitSettings autoFit;
    RenderSettings render;
};

#endif // CUTOUT_SETTINGS_H
