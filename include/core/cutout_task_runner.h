#ifndef CUTOUT_TASK_RUNNER_H
#define CUTOUT_TASK_RUNNER_H

#include <QFutureWatcher>
#include <QMetaType>
#include <QObject>
#include <QString>
#include <array>
#include <opencv2/opencv.hpp>
#include "algorithms/compositing/alpha_compositor.h"
#include "algorithms/mask_refinement/mask_refiner.h"
#include "core/cancellation_token.h"
#include "core/composition_renderer.h"
#include "core/cutout_error.h"
#include "core/cutout_settings.h"
#include "core/layer_model.h"

Q_DECLARE_METATYPE(cv::Mat)
Q_DECLARE_METATYPE(CutoutError::Kind)

/**
 * @brief Result of one background task, produced on a worker thread
 */
struct CutoutTaskOutcome {
    cv::Mat image;
    bool succeeded = false;
    CutoutError::Kind errorKind = CutoutError::Kind::CompositingFailed;
    QString errorMessage;
};

/**
 * @brief Runs refinement, compositing and rendering off the calling thread
 *
 * Every submission gets a generation number per task kind. Only the newest
 * generation of a kind is delivered; results of older submissions are
 * dropped with staleResultDropped(). Each kind also owns a cancellation
 * token: a new submission cancels the token of the previous task of that
 * kind, so superseded work stops at its next stage boundary instead of
 * running to completion. Inputs are deep-copied at submission so the caller
 * may keep mutating its own buffers.
 *
 * Results are delivered on the thread that owns the runner.
 */
class CutoutTaskRunner : public QObject
{
    Q_OBJECT

public:
    enum class TaskKind {
        Refine,
        Composite,
        Render
    };
    Q_ENUM(TaskKind)

    explicit CutoutTaskRunner(const CutoutSettings &settings = CutoutSettings(), QObject *parent = nullptr);
    ~CutoutTaskRunner();

    quint64 submitRefine(const cv::Mat &rawMask, const cv::Size &targetSize = cv::Size());
    quint64 submitComposite(const cv::Mat &mask, const cv::Mat &image);
    quint64 submitRender(const Composition &composition);

    // Cancels and invalidates everything in flight; pending results arrive as stale
    void cancelAll();

    bool isIdle() const { return m_pending == 0; }
    quint64 currentGeneration(TaskKind kind) const { return m_generations[index(kind)]; }

    // Applies to tasks submitted afterwards
    void setSettings(const CutoutSettings &settings);
    const CutoutSettings &settings() const { return m_settings; }

    // Blocks until all running tasks are done; used on shutdown
    void waitForAll();

signals:
    void maskRefined(quint64 generation, const cv::Mat &alphaMask);
    void cutoutReady(quint64 generation, const cv::Mat &cutout);
    void renderReady(quint64 generation, const cv::Mat &raster);
    void taskFailed(CutoutTaskRunner::TaskKind kind, quint64 generation, CutoutError::Kind error,
                    const QString &message);
    void staleResultDropped(CutoutTaskRunner::TaskKind kind, quint64 generation);

private:
    static int index(TaskKind kind) { return static_cast<int>(kind); }

    quint64 nextGeneration(TaskKind kind);
    CancellationToken renewToken(TaskKind kind);
    void watch(TaskKind kind, quint64 generation, const QFuture<CutoutTaskOutcome> &future);
    void onTaskFinished(TaskKind kind, quint64 generation, QFutureWatcher<CutoutTaskOutcome> *watcher);

    CutoutSettings m_settings;
    MaskRefiner m_refiner;
    AlphaCompositor m_compositor;
    CompositionRenderer m_renderer;

    std::array<quint64, 3> m_generations;
    std::array<CancellationToken, 3> m_tokens;
    QList<QFutureWatcher<CutoutTaskOutcome> *> m_watchers;
    int m_pending;
};

#endif // CUTOUT_TASK_RUNNER_H
