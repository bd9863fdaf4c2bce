#include "core/composition_builder.h"
#include "algorithms/compositing/auto_fit_scaler.h"
#include "core/cutout_error.h"
#include "core/image_conversion.h"
#include <QDebug>
#include <cmath>

namespace {

void requireCanvas(const cv::Size &canvasSize)
{
    if (canvasSize.width <= 0 || canvasSize.height <= 0) {
        throw CutoutError(CutoutError::Kind::InvalidGeometry,
                          QStringLiteral("invalid canvas size %1x%2").arg(canvasSize.width).arg(canvasSize.height));
    }
}

} // namespace

CompositionBuilder::CompositionBuilder(const CutoutSettings &settings)
    : m_settings(settings)
    , m_renderer(settings.render)
{
}

Composition CompositionBuilder::createSubjectComposition(const QString &name,
                                                         const cv::Mat &cutout,
                                                         const cv::Mat &background,
                                                         const cv::Size &canvasSize) const
{
    requireCanvas(canvasSize);
    if (cutout.empty()) {
        throw CutoutError(CutoutError::Kind::InvalidInput, QStringLiteral("subject cutout is empty"));
    }

    Composition composition(name, canvasSize);
    if (!background.empty()) {
        composition.setBackground(background);
    }

    Layer subject;
    subject.kind = LayerKind::Subject;
    subject.name = name;
    subject.pixels = toBgra(cutout);
    AutoFitScaler::fitLayer(subject, canvasSize, m_settings.autoFit);
    composition.append(subject);

    qDebug() << "CompositionBuilder: Created composition" << name << "subject" << cutout.cols << "x"
             << cutout.rows << "scale" << subject.transform.scale;
    return composition;
}

QList<Composition> CompositionBuilder::createCompositionsForSubjects(const QList<cv::Mat> &cutouts,
                                                                     const cv::Mat &background,
                                                                     const cv::Size &canvasSize) const
{
    requireCanvas(canvasSize);

    QList<Composition> compositions;
    for (int i = 0; i < cutouts.size(); ++i) {
        if (cutouts.at(i).empty()) {
            qWarning() << "CompositionBuilder: Skipping empty cutout at index" << i;
            continue;
        }
        compositions.append(createSubjectComposition(QStringLiteral("Subject %1").arg(compositions.size() + 1),
                                                     cutouts.at(i), background, canvasSize));
    }

    if (compositions.isEmpty()) {
        throw CutoutError(CutoutError::Kind::NoSubjectDetected, QStringLiteral("no usable subject cutouts"));
    }
    return compositions;
}

int CompositionBuilder::rescaleSubjectLayers(Composition &composition, const cv::Size &canvasSize) const
{
    requireCanvas(canvasSize);

    int updated = 0;
    for (const Layer &layer : composition.layersInPaintOrder()) {
        if (layer.kind != LayerKind::Subject || layer.pixels.empty()) {
            continue;
        }

        const double scale = AutoFitScaler::computeScale(cv::Size2d(layer.pixels.cols, layer.pixels.rows),
                                                         cv::Size2d(canvasSize.width, canvasSize.height),
                                                         m_settings.autoFit);
        if (std::abs(layer.transform.scale - scale) <= kRescaleThreshold) {
            continue;
        }

        qDebug() << "CompositionBuilder: Rescaling" << layer.name << layer.transform.scale << "->" << scale;
        if (composition.setScale(layer.id, scale)) {
            ++updated;
        }
    }

    if (updated > 0) {
        qDebug() << "CompositionBuilder: Updated" << updated << "subject layer(s) in" << composition.name();
    }
    return updated;
}

QList<cv::Mat> CompositionBuilder::exportCompositions(const QList<Composition> &compositions) const
{
    QList<cv::Mat> rendered;
    for (const Composition &composition : compositions) {
        try {
            rendered.append(m_renderer.render(composition));
        } catch (const CutoutError &e) {
            qWarning() << "CompositionBuilder: Failed to render" << composition.name() << ":" << e.what();
        }
    }
    qDebug() << "CompositionBuilder: Exported" << rendered.size() << "of" << compositions.size() << "compositions";
    return rendered;
}
