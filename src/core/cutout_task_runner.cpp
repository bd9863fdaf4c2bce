#include "core/cutout_task_runner.h"
#include <QDebug>
#include <QElapsedTimer>
#include <QtConcurrent/QtConcurrent>
#include <new>

namespace {

// Runs one pipeline step and folds every failure into the outcome
template <typename Step>
CutoutTaskOutcome runStep(const char *label, Step step)
{
    CutoutTaskOutcome outcome;
    QElapsedTimer timer;
    timer.start();
    try {
        outcome.image = step();
        outcome.succeeded = true;
        qDebug() << "CutoutTaskRunner:" << label << "finished in" << timer.elapsed() << "ms";
    } catch (const CutoutError &e) {
        outcome.errorKind = e.kind();
        outcome.errorMessage = QString::fromUtf8(e.what());
    } catch (const cv::Exception &e) {
        outcome.errorKind = CutoutError::Kind::CompositingFailed;
        outcome.errorMessage = QString::fromStdString(e.msg);
    } catch (const std::bad_alloc &) {
        outcome.errorKind = CutoutError::Kind::CompositingFailed;
        outcome.errorMessage = QStringLiteral("out of memory");
    }
    return outcome;
}

// Composition copies share pixel buffers with the caller; detach them
Composition snapshot(const Composition &composition)
{
    Composition copy(composition.name(), composition.canvasSize());
    if (composition.hasBackground()) {
        copy.setBackground(composition.background().clone());
    }
    for (const Layer &layer : composition.layers()) {
        Layer detached = layer;
        detached.pixels = layer.pixels.clone();
        detached.mask = layer.mask.clone();
        detached.sourceImage.release();
        copy.append(detached);
    }
    return copy;
}

} // namespace

CutoutTaskRunner::CutoutTaskRunner(const CutoutSettings &settings, QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_refiner(settings.refiner)
    , m_compositor(settings.compositor)
    , m_renderer(settings.render)
    , m_generations{{0, 0, 0}}
    , m_pending(0)
{
    qRegisterMetaType<cv::Mat>("cv::Mat");
    qRegisterMetaType<CutoutError::Kind>("CutoutError::Kind");
    qRegisterMetaType<CutoutTaskRunner::TaskKind>("CutoutTaskRunner::TaskKind");
}

CutoutTaskRunner::~CutoutTaskRunner()
{
    cancelAll();
    waitForAll();
}

void CutoutTaskRunner::setSettings(const CutoutSettings &settings)
{
    m_settings = settings;
    m_refiner.setSettings(settings.refiner);
    m_compositor.setSettings(settings.compositor);
    m_renderer.setSettings(settings.render);
}

quint64 CutoutTaskRunner::nextGeneration(TaskKind kind)
{
    return ++m_generations[index(kind)];
}

CancellationToken CutoutTaskRunner::renewToken(TaskKind kind)
{
    CancellationToken &token = m_tokens[index(kind)];
    token.cancel();
    token = CancellationToken();
    return token;
}

quint64 CutoutTaskRunner::submitRefine(const cv::Mat &rawMask, const cv::Size &targetSize)
{
    const CancellationToken token = renewToken(TaskKind::Refine);
    const quint64 generation = nextGeneration(TaskKind::Refine);
    const cv::Mat raw = rawMask.clone();
    const MaskRefiner refiner = m_refiner;

    QFuture<CutoutTaskOutcome> future = QtConcurrent::run([raw, targetSize, refiner, token]() {
        return runStep("refine", [&]() { return refiner.refine(raw, targetSize, &token); });
    });
    watch(TaskKind::Refine, generation, future);
    return generation;
}

quint64 CutoutTaskRunner::submitComposite(const cv::Mat &mask, const cv::Mat &image)
{
    const CancellationToken token = renewToken(TaskKind::Composite);
    const quint64 generation = nextGeneration(TaskKind::Composite);
    const cv::Mat maskCopy = mask.clone();
    const cv::Mat imageCopy = image.clone();
    const AlphaCompositor compositor = m_compositor;

    QFuture<CutoutTaskOutcome> future = QtConcurrent::run([maskCopy, imageCopy, compositor, token]() {
        return runStep("composite", [&]() { return compositor.composite(maskCopy, imageCopy, &token); });
    });
    watch(TaskKind::Composite, generation, future);
    return generation;
}

quint64 CutoutTaskRunner::submitRender(const Composition &composition)
{
    const CancellationToken token = renewToken(TaskKind::Render);
    const quint64 generation = nextGeneration(TaskKind::Render);
    const Composition copy = snapshot(composition);
    const CompositionRenderer renderer = m_renderer;

    QFuture<CutoutTaskOutcome> future = QtConcurrent::run([copy, renderer, token]() {
        return runStep("render", [&]() { return renderer.render(copy, &token); });
    });
    watch(TaskKind::Render, generation, future);
    return generation;
}

void CutoutTaskRunner::watch(TaskKind kind, quint64 generation, const QFuture<CutoutTaskOutcome> &future)
{
    auto *watcher = new QFutureWatcher<CutoutTaskOutcome>(this);
    connect(watcher, &QFutureWatcher<CutoutTaskOutcome>::finished, this,
            [this, kind, generation, watcher]() { onTaskFinished(kind, generation, watcher); });
    m_watchers.append(watcher);
    ++m_pending;
    watcher->setFuture(future);
}

void CutoutTaskRunner::onTaskFinished(TaskKind kind, quint64 generation, QFutureWatcher<CutoutTaskOutcome> *watcher)
{
    const CutoutTaskOutcome outcome = watcher->result();
    m_watchers.removeOne(watcher);
    watcher->deleteLater();
    --m_pending;

    if (generation != m_generations[index(kind)]) {
        qDebug() << "CutoutTaskRunner: Dropping stale" << kind << "result" << generation
                 << "current" << m_generations[index(kind)];
        emit staleResultDropped(kind, generation);
        return;
    }

    if (!outcome.succeeded) {
        qWarning() << "CutoutTaskRunner:" << kind << "task" << generation << "failed:" << outcome.errorMessage;
        emit taskFailed(kind, generation, outcome.errorKind, outcome.errorMessage);
        return;
    }

    switch (kind) {
    case TaskKind::Refine:
        emit maskRefined(generation, outcome.image);
        break;
    case TaskKind::Composite:
        emit cutoutReady(generation, outcome.image);
        break;
    case TaskKind::Render:
        emit renderReady(generation, outcome.image);
        break;
    }
}

void CutoutTaskRunner::cancelAll()
{
    for (CancellationToken &token : m_tokens) {
        token.cancel();
        token = CancellationToken();
    }
    for (quint64 &generation : m_generations) {
        ++generation;
    }
    if (m_pending > 0) {
        qDebug() << "CutoutTaskRunner: Cancelled" << m_pending << "pending task(s)";
    }
}

void CutoutTaskRunner::waitForAll()
{
    for (QFutureWatcher<CutoutTaskOutcome> *watcher : m_watchers) {
        watcher->waitForFinished();
    }
}
