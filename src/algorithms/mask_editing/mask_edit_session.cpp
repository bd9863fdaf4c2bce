#include "algorithms/mask_editing/mask_edit_session.h"
#include "core/cutout_error.h"
#include "core/image_conversion.h"
#include "core/layer_model.h"
#include <QDebug>
#include <algorithm>
#include <cmath>

namespace {

// Blend the covered part of the mask toward 1 (Add) or 0 (Erase)
cv::Mat applyCoverage(const cv::Mat &maskRegion, const cv::Mat &coverage, MaskEditMode mode)
{
    cv::Mat result;
    if (mode == MaskEditMode::Add) {
        cv::Mat remaining = 1.0 - maskRegion;
        result = maskRegion + remaining.mul(coverage);
    } else {
        cv::Mat kept = 1.0 - coverage;
        result = maskRegion.mul(kept);
    }
    cv::min(result, 1.0, result);
    cv::max(result, 0.0, result);
    return result;
}

// Fixed-point lasso vertices must stay inside int range
constexpr float kMaxLassoCoordinate = static_cast<float>(1 << 16);

} // namespace

bool EditSessionTracker::acquire(const QUuid &layerId)
{
    if (m_open.contains(layerId)) {
        return false;
    }
    m_open.insert(layerId);
    return true;
}

void EditSessionTracker::release(const QUuid &layerId)
{
    m_open.remove(layerId);
}

MaskEditSession::MaskEditSession(const QUuid &layerId,
                                 const cv::Mat &sourceImage,
                                 const cv::Mat &initialMask,
                                 const EditorSettings &settings,
                                 const CompositorSettings &compositorSettings,
                                 EditSessionTracker *tracker,
                                 QObject *parent)
    : QObject(parent)
    , m_layerId(layerId)
    , m_sourceImage(sourceImage)
    , m_mask(toAlphaMask(initialMask))
    , m_compositor(compositorSettings)
    , m_history(settings.historyCapacity)
    , m_tracker(tracker)
    , m_state(State::Idle)
    , m_inGesture(false)
    , m_gestureRecorded(false)
    , m_holdsLayer(false)
{
}

MaskEditSession::~MaskEditSession()
{
    if (m_holdsLayer && m_tracker) {
        m_tracker->release(m_layerId);
    }
}

bool MaskEditSession::begin()
{
    if (m_state != State::Idle) {
        qWarning() << "MaskEditSession: begin() called in state" << static_cast<int>(m_state);
        return false;
    }

    if (m_tracker) {
        if (!m_tracker->acquire(m_layerId)) {
            m_lastError = QStringLiteral("layer %1 is already being edited").arg(m_layerId.toString());
            qWarning() << "MaskEditSession:" << m_lastError;
            return false;
        }
        m_holdsLayer = true;
    }

    m_sessionStart = m_mask.clone();
    setState(State::Editing);
    qDebug() << "MaskEditSession: Editing layer" << m_layerId.toString() << "mask" << m_mask.cols << "x"
             << m_mask.rows << "history capacity" << m_history.capacity();

    refreshPreview();
    return true;
}

bool MaskEditSession::requireEditing(const char *operation) const
{
    if (m_state != State::Editing) {
        qWarning() << "MaskEditSession:" << operation << "ignored, session is not editing";
        return false;
    }
    return true;
}

void MaskEditSession::beginGesture()
{
    if (!requireEditing("beginGesture")) {
        return;
    }
    m_inGesture = true;
    m_gestureRecorded = false;
}

void MaskEditSession::endGesture()
{
    m_inGesture = false;
    m_gestureRecorded = false;
}

void MaskEditSession::recordSnapshot()
{
    if (m_inGesture && m_gestureRecorded) {
        return;
    }

    const bool couldUndo = canUndo();
    m_history.push(m_mask);
    if (m_inGesture) {
        m_gestureRecorded = true;
    }
    if (!couldUndo) {
        emit canUndoChanged(true);
    }
}

bool MaskEditSession::paintStroke(const cv::Point2f &center, float brushRadius, MaskEditMode mode)
{
    if (!requireEditing("paintStroke")) {
        return false;
    }
    if (!std::isfinite(center.x) || !std::isfinite(center.y) || !std::isfinite(brushRadius)) {
        qWarning() << "MaskEditSession: Ignoring stroke with non-finite centre or radius";
        return false;
    }
    if (!(brushRadius > 0.0f)) {
        return false;
    }

    // Bounds are clamped to the mask before converting to int
    const float extent = brushRadius + 1.0f;
    const float width = static_cast<float>(m_mask.cols);
    const float height = static_cast<float>(m_mask.rows);
    const int x0 = static_cast<int>(std::floor(std::clamp(center.x - extent, 0.0f, width)));
    const int y0 = static_cast<int>(std::floor(std::clamp(center.y - extent, 0.0f, height)));
    const int x1 = static_cast<int>(std::ceil(std::clamp(center.x + extent, 0.0f, width)));
    const int y1 = static_cast<int>(std::ceil(std::clamp(center.y + extent, 0.0f, height)));
    const cv::Rect region = cv::Rect(x0, y0, x1 - x0, y1 - y0) & cv::Rect(0, 0, m_mask.cols, m_mask.rows);
    if (region.empty()) {
        return false;
    }

    // Antialiased disk: full coverage inside, one-pixel ramp at the rim
    cv::Mat coverage(region.size(), CV_32F);
    for (int y = 0; y < region.height; ++y) {
        float *row = coverage.ptr<float>(y);
        const float py = static_cast<float>(region.y + y) + 0.5f - center.y;
        for (int x = 0; x < region.width; ++x) {
            const float px = static_cast<float>(region.x + x) + 0.5f - center.x;
            const float distance = std::sqrt(px * px + py * py);
            row[x] = std::clamp(brushRadius + 0.5f - distance, 0.0f, 1.0f);
        }
    }
    if (cv::countNonZero(coverage) == 0) {
        return false;
    }

    recordSnapshot();
    cv::Mat maskRegion = m_mask(region);
    applyCoverage(maskRegion, coverage, mode).copyTo(maskRegion);

    refreshPreview();
    return true;
}

bool MaskEditSession::lassoFill(const std::vector<cv::Point2f> &polygon, MaskEditMode mode)
{
    if (!requireEditing("lassoFill")) {
        return false;
    }
    if (polygon.size() < 3) {
        return false;
    }

    // 4 fractional bits; integer coordinates address pixel centres
    constexpr int shift = 4;
    constexpr float scale = static_cast<float>(1 << shift);
    std::vector<cv::Point> vertices;
    vertices.reserve(polygon.size());
    for (const cv::Point2f &p : polygon) {
        if (!std::isfinite(p.x) || !std::isfinite(p.y)) {
            qWarning() << "MaskEditSession: Ignoring lasso with non-finite point";
            return false;
        }
        const float x = std::clamp(p.x, -kMaxLassoCoordinate, kMaxLassoCoordinate);
        const float y = std::clamp(p.y, -kMaxLassoCoordinate, kMaxLassoCoordinate);
        vertices.emplace_back(static_cast<int>(std::lround((x - 0.5f) * scale)),
                              static_cast<int>(std::lround((y - 0.5f) * scale)));
    }

    cv::Mat coverage8 = cv::Mat::zeros(m_mask.size(), CV_8U);
    const cv::Point *contours[] = {vertices.data()};
    const int counts[] = {static_cast<int>(vertices.size())};
    cv::fillPoly(coverage8, contours, counts, 1, cv::Scalar(255), cv::LINE_AA, shift);
    if (cv::countNonZero(coverage8) == 0) {
        return false;
    }

    cv::Mat coverage;
    coverage8.convertTo(coverage, CV_32F, 1.0 / 255.0);

    recordSnapshot();
    m_mask = applyCoverage(m_mask, coverage, mode);

    qDebug() << "MaskEditSession: Lasso" << (mode == MaskEditMode::Erase ? "erase" : "add")
             << "with" << polygon.size() << "points";
    refreshPreview();
    return true;
}

bool MaskEditSession::undo()
{
    if (!requireEditing("undo")) {
        return false;
    }
    if (m_history.isEmpty()) {
        return false;
    }

    m_mask = m_history.pop();
    // The next dab of an ongoing drag starts a fresh undo step
    m_gestureRecorded = false;
    if (m_history.isEmpty()) {
        emit canUndoChanged(false);
    }

    refreshPreview();
    return true;
}

bool MaskEditSession::refreshPreview()
{
    try {
        cv::Mat cutout = m_compositor.applyExternalMask(m_mask, m_sourceImage);
        m_preview = cutout;
        m_lastError.clear();
        emit previewUpdated(m_preview);
        return true;
    } catch (const CutoutError &e) {
        m_lastError = e.message();
    } catch (const cv::Exception &e) {
        m_lastError = QString::fromStdString(e.msg);
    }

    qWarning() << "MaskEditSession: Preview refresh failed, keeping previous preview:" << m_lastError;
    emit previewFailed(m_lastError);
    return false;
}

bool MaskEditSession::commit(Layer &layer)
{
    if (!requireEditing("commit")) {
        return false;
    }
    if (layer.id != m_layerId) {
        qWarning() << "MaskEditSession: Refusing to commit into layer" << layer.id.toString()
                   << "session belongs to" << m_layerId.toString();
        return false;
    }

    // Throws CutoutError on failure; the session stays open in that case
    cv::Mat cutout = m_compositor.applyExternalMask(m_mask, m_sourceImage);

    layer.pixels = cutout;
    layer.mask = m_mask.clone();
    layer.sourceImage = m_sourceImage;
    m_preview = cutout;

    qDebug() << "MaskEditSession: Committed layer" << layer.name << "cutout" << cutout.cols << "x" << cutout.rows;
    finish(State::Committed);
    return true;
}

bool MaskEditSession::commit(Composition &composition)
{
    if (!requireEditing("commit")) {
        return false;
    }
    if (!composition.contains(m_layerId)) {
        qWarning() << "MaskEditSession: Layer" << m_layerId.toString() << "is not part of" << composition.name();
        return false;
    }

    // Throws CutoutError on failure; the session stays open in that case
    cv::Mat cutout = m_compositor.applyExternalMask(m_mask, m_sourceImage);
    if (!composition.setLayerContent(m_layerId, cutout, m_mask.clone(), m_sourceImage)) {
        return false;
    }
    m_preview = cutout;

    qDebug() << "MaskEditSession: Committed layer" << m_layerId.toString() << "in" << composition.name();
    finish(State::Committed);
    return true;
}

bool MaskEditSession::cancel()
{
    if (!requireEditing("cancel")) {
        return false;
    }

    m_mask = m_sessionStart.clone();
    refreshPreview();

    qDebug() << "MaskEditSession: Cancelled edits on layer" << m_layerId.toString();
    finish(State::Cancelled);
    return true;
}

void MaskEditSession::finish(State state)
{
    const bool couldUndo = canUndo();
    m_history.clear();
    m_inGesture = false;
    m_gestureRecorded = false;

    if (m_holdsLayer && m_tracker) {
        m_tracker->release(m_layerId);
    }
    m_holdsLayer = false;

    if (couldUndo) {
        emit canUndoChanged(false);
    }
    setState(state);
}

void MaskEditSession::setState(State state)
{
    if (m_state == state) {
        return;
    }
    m_state = state;
    emit stateChanged(m_state);
}
