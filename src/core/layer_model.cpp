#include "core/layer_model.h"
#include <QDebug>
#include <algorithm>

Composition::Composition(const QString &name, const cv::Size &canvasSize)
    : m_name(name)
    , m_canvasSize(canvasSize)
{
}

void Composition::setBackground(const cv::Mat &background)
{
    m_background = background;
    qDebug() << "Composition:" << m_name << "background set to" << background.cols << "x" << background.rows;
}

void Composition::clearBackground()
{
    m_background.release();
}

QUuid Composition::append(Layer layer)
{
    if (layer.id.isNull() || contains(layer.id)) {
        layer.id = QUuid::createUuid();
    }
    if (layer.name.isEmpty()) {
        layer.name = defaultLayerName(layer.kind);
    }
    if (layer.transform.scale <= 0.0) {
        qWarning() << "Composition: Layer" << layer.name << "had non-positive scale, reset to 1.0";
        layer.transform.scale = 1.0;
    }
    layer.opacity = qBound(0.0, layer.opacity, 1.0);
    layer.order = m_layers.size();

    const QUuid id = layer.id;
    m_layers.append(std::move(layer));
    qDebug() << "Composition: Appended layer" << m_layers.last().name << "at order" << m_layers.last().order;
    return id;
}

bool Composition::remove(const QUuid &id)
{
    const int index = indexOf(id);
    if (index < 0) {
        return false;
    }
    m_layers.removeAt(index);
    normalizeOrder();
    return true;
}

bool Composition::reorder(const QUuid &id, int newIndex)
{
    const int index = indexOf(id);
    if (index < 0) {
        return false;
    }
    const int target = qBound(0, newIndex, static_cast<int>(m_layers.size()) - 1);
    if (target != index) {
        m_layers.move(index, target);
    }
    normalizeOrder();
    return true;
}

bool Composition::moveUp(const QUuid &id)
{
    const int index = indexOf(id);
    if (index < 0 || index >= m_layers.size() - 1) {
        return false;
    }
    return reorder(id, index + 1);
}

bool Composition::moveDown(const QUuid &id)
{
    const int index = indexOf(id);
    if (index <= 0) {
        return false;
    }
    return reorder(id, index - 1);
}

bool Composition::setTransform(const QUuid &id, const LayerTransform &transform)
{
    Layer *target = findLayer(id);
    if (!target) {
        return false;
    }
    if (target->locked) {
        qDebug() << "Composition: Ignoring transform on locked layer" << target->name;
        return false;
    }
    if (!(transform.scale > 0.0)) {
        qWarning() << "Composition: Rejecting non-positive scale" << transform.scale << "for" << target->name;
        return false;
    }
    target->transform = transform;
    return true;
}

bool Composition::setOpacity(const QUuid &id, double opacity)
{
    Layer *target = findLayer(id);
    if (!target) {
        return false;
    }
    target->opacity = qBound(0.0, opacity, 1.0);
    return true;
}

bool Composition::toggleVisibility(const QUuid &id)
{
    Layer *target = findLayer(id);
    if (!target) {
        return false;
    }
    target->visible = !target->visible;
    return true;
}

bool Composition::toggleLock(const QUuid &id)
{
    Layer *target = findLayer(id);
    if (!target) {
        return false;
    }
    target->locked = !target->locked;
    return true;
}

bool Composition::replacePixels(const QUuid &id, const cv::Mat &pixels)
{
    Layer *target = findLayer(id);
    if (!target || pixels.empty()) {
        return false;
    }
    target->pixels = pixels;
    return true;
}

bool Composition::setLayerContent(const QUuid &id, const cv::Mat &pixels, const cv::Mat &mask,
                                  const cv::Mat &sourceImage)
{
    Layer *target = findLayer(id);
    if (!target || pixels.empty()) {
        return false;
    }
    target->pixels = pixels;
    target->mask = mask;
    target->sourceImage = sourceImage;
    return true;
}

bool Composition::setScale(const QUuid &id, double scale)
{
    Layer *target = findLayer(id);
    if (!target) {
        return false;
    }
    if (!(scale > 0.0)) {
        qWarning() << "Composition: Rejecting non-positive scale" << scale << "for" << target->name;
        return false;
    }
    target->transform.scale = scale;
    return true;
}

int Composition::indexOf(const QUuid &id) const
{
    for (int i = 0; i < m_layers.size(); ++i) {
        if (m_layers.at(i).id == id) {
            return i;
        }
    }
    return -1;
}

const Layer *Composition::layer(const QUuid &id) const
{
    const int index = indexOf(id);
    return index >= 0 ? &m_layers.at(index) : nullptr;
}

Layer *Composition::findLayer(const QUuid &id)
{
    const int index = indexOf(id);
    return index >= 0 ? &m_layers[index] : nullptr;
}

QList<Layer> Composition::layersInPaintOrder() const
{
    QList<Layer> sorted = m_layers;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const Layer &a, const Layer &b) { return a.order < b.order; });
    return sorted;
}

QString Composition::defaultLayerName(LayerKind kind) const
{
    const int number = m_layers.size() + 1;
    switch (kind) {
    case LayerKind::Subject:
        return QStringLiteral("Subject %1").arg(number);
    case LayerKind::UploadedImage:
        return QStringLiteral("Imported Layer %1").arg(number);
    case LayerKind::Background:
        return QStringLiteral("Background %1").arg(number);
    case LayerKind::Text:
        return QStringLiteral("Text %1").arg(number);
    case LayerKind::GeneratedObject:
        return QStringLiteral("Object %1").arg(number);
    case LayerKind::Adjustment:
        return QStringLiteral("Adjustment %1").arg(number);
    }
    return QStringLiteral("Layer %1").arg(number);
}

bool Composition::canClean(const Layer &layer)
{
    return layer.kind == LayerKind::Subject || layer.kind == LayerKind::UploadedImage;
}

void Composition::normalizeOrder()
{
    for (int i = 0; i < m_layers.size(); ++i) {
        m_layers[i].order = i;
    }
}
