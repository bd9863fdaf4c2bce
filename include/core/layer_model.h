#ifndef LAYER_MODEL_H
#define LAYER_MODEL_H

#include <QList>
#include <QString>
#include <QUuid>
#include <opencv2/opencv.hpp>

enum class LayerKind {
    Subject,
    UploadedImage,
    Background,
    Text,
    GeneratedObject,
    Adjustment
};

struct LayerTransform {
    double offsetX = 0.0;         // px from canvas centre
    double offsetY = 0.0;
    double scale = 1.0;           // > 0
    double rotationDegrees = 0.0; // clockwise on screen

    bool operator==(const LayerTransform &other) const
    {
        return offsetX == other.offsetX && offsetY == other.offsetY && scale == other.scale
               && rotationDegrees == other.rotationDegrees;
    }
    bool operator!=(const LayerTransform &other) const { return !(*this == other); }
};

/**
 * @brief One positioned visual element of a composition
 *
 * pixels is the authoritative raster for rendering (BGRA). For subject
 * layers, mask and sourceImage keep what is needed to reopen an edit
 * session; pixels is then the committed cutout derived from them.
 */
struct Layer {
    QUuid id;
    QString name;
    LayerKind kind = LayerKind::Subject;
    cv::Mat pixels;      // CV_8UC4 BGRA
    cv::Mat mask;        // CV_32FC1 AlphaMask, may be empty
    cv::Mat sourceImage; // original capture, may be empty
    int order = 0;
    LayerTransform transform;
    double opacity = 1.0;
    bool visible = true;
    bool locked = false;

    Layer() : id(QUuid::createUuid()) {}
};

/**
 * @brief Ordered stack of layers plus optional background and a canvas size
 *
 * Order indices are always exactly {0, 1, ..., count-1}: every structural
 * mutation renormalises them. Lower order paints first. The layer list is
 * kept sorted by order, so list position and order index always agree.
 * Layers are only handed out const; all writes go through the setters below
 * so id and order stay owned by the composition.
 *
 * Not thread-safe; structural mutations must come from one owner.
 */
class Composition
{
public:
    Composition() = default;
    Composition(const QString &name, const cv::Size &canvasSize);

    const QString &name() const { return m_name; }
    void setName(const QString &name) { m_name = name; }

    const cv::Size &canvasSize() const { return m_canvasSize; }
    void setCanvasSize(const cv::Size &size) { m_canvasSize = size; }

    // Background is drawn aspect-fill behind every layer
    void setBackground(const cv::Mat &background);
    void clearBackground();
    bool hasBackground() const { return !m_background.empty(); }
    const cv::Mat &background() const { return m_background; }

    // Structural operations
    QUuid append(Layer layer);
    bool remove(const QUuid &id);
    bool reorder(const QUuid &id, int newIndex);
    bool moveUp(const QUuid &id);   // one step toward the top of the stack
    bool moveDown(const QUuid &id); // one step toward the bottom

    // Layer state
    bool setTransform(const QUuid &id, const LayerTransform &transform);
    bool setOpacity(const QUuid &id, double opacity);
    bool toggleVisibility(const QUuid &id);
    bool toggleLock(const QUuid &id);
    bool replacePixels(const QUuid &id, const cv::Mat &pixels);
    // Committed edit result; mask and sourceImage may be empty
    bool setLayerContent(const QUuid &id, const cv::Mat &pixels, const cv::Mat &mask, const cv::Mat &sourceImage);
    // Programmatic refit, applied to locked layers as well
    bool setScale(const QUuid &id, double scale);

    // Lookup
    int count() const { return static_cast<int>(m_layers.size()); }
    bool isEmpty() const { return m_layers.isEmpty(); }
    bool contains(const QUuid &id) const { return indexOf(id) >= 0; }
    int indexOf(const QUuid &id) const;
    const Layer *layer(const QUuid &id) const;
    const QList<Layer> &layers() const { return m_layers; }
    QList<Layer> layersInPaintOrder() const;

    QString defaultLayerName(LayerKind kind) const;

    // Only subject and uploaded layers can be re-cut
    static bool canClean(const Layer &layer);

private:
    Layer *findLayer(const QUuid &id);
    void normalizeOrder();

    QString m_name;
    cv::Size m_canvasSize;
    cv::Mat m_background;
    QList<Layer> m_layers;
};

#endif // LAYER_MODEL_H
