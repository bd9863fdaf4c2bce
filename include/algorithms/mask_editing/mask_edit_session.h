#ifndef MASK_EDIT_SESSION_H
#define MASK_EDIT_SESSION_H

#include <QObject>
#include <QSet>
#include <QString>
#include <QUuid>
#include <opencv2/opencv.hpp>
#include <vector>
#include "algorithms/compositing/alpha_compositor.h"
#include "algorithms/mask_editing/mask_history.h"
#include "core/cutout_settings.h"

class Composition;
struct Layer;

enum class MaskEditMode {
    Add,
    Erase
};

/**
 * @brief Caller-owned registry of layers that currently have an open session
 *
 * A layer can be edited by one session at a time. Sessions acquire the layer
 * on begin() and release it when they commit, cancel or are destroyed.
 */
class EditSessionTracker
{
public:
    bool acquire(const QUuid &layerId);
    void release(const QUuid &layerId);
    bool isEditing(const QUuid &layerId) const { return m_open.contains(layerId); }
    int openCount() const { return static_cast<int>(m_open.size()); }

private:
    QSet<QUuid> m_open;
};

/**
 * @brief Interactive brush/lasso editing of one layer's AlphaMask
 *
 * State machine: Idle -> Editing -> {Committed | Cancelled}.
 *
 * All points are in the mask's own pixel space; mapping from display
 * coordinates is the caller's job. Non-finite points or radii are rejected.
 * Every edit recomposites the preview synchronously. A failed recomposite
 * keeps the previous preview, emits previewFailed() and leaves the mask and
 * the session untouched.
 *
 * Undo history holds the mask as it was before each edit (or each gesture),
 * so canUndo() is false right after begin(); the mask on entry is kept
 * separately and restored by cancel().
 */
class MaskEditSession : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Idle,
        Editing,
        Committed,
        Cancelled
    };

    MaskEditSession(const QUuid &layerId,
                    const cv::Mat &sourceImage,
                    const cv::Mat &initialMask,
                    const EditorSettings &settings = EditorSettings(),
                    const CompositorSettings &compositorSettings = CompositorSettings(),
                    EditSessionTracker *tracker = nullptr,
                    QObject *parent = nullptr);
    ~MaskEditSession();

    bool begin();

    // Editing operations; return true when the mask changed
    bool paintStroke(const cv::Point2f &center, float brushRadius, MaskEditMode mode);
    bool lassoFill(const std::vector<cv::Point2f> &polygon, MaskEditMode mode = MaskEditMode::Erase);
    bool undo();

    // Group several dabs of one drag into a single undo step
    void beginGesture();
    void endGesture();

    bool commit(Layer &layer);
    // Writes into the composition's layer with this session's layer id
    bool commit(Composition &composition);
    bool cancel();

    State state() const { return m_state; }
    bool isEditing() const { return m_state == State::Editing; }
    bool canUndo() const { return !m_history.isEmpty(); }
    int historySize() const { return m_history.size(); }
    const QUuid &layerId() const { return m_layerId; }

    const cv::Mat &mask() const { return m_mask; }
    const cv::Mat &preview() const { return m_preview; }
    const cv::Mat &sourceImage() const { return m_sourceImage; }
    const QString &lastError() const { return m_lastError; }

signals:
    void stateChanged(MaskEditSession::State state);
    void previewUpdated(const cv::Mat &cutout);
    void previewFailed(const QString &message);
    void canUndoChanged(bool canUndo);

private:
    bool requireEditing(const char *operation) const;
    void recordSnapshot();
    bool refreshPreview();
    void finish(State state);
    void setState(State state);

    QUuid m_layerId;
    cv::Mat m_sourceImage;
    cv::Mat m_mask;         // CV_32FC1 working AlphaMask
    cv::Mat m_sessionStart; // restored on cancel()
    cv::Mat m_preview;      // last valid CutoutImage

    AlphaCompositor m_compositor;
    MaskHistory m_history;
    EditSessionTracker *m_tracker;
    State m_state;
    bool m_inGesture;
    bool m_gestureRecorded;
    bool m_holdsLayer;
    QString m_lastError;
};

#endif // MASK_EDIT_SESSION_H
