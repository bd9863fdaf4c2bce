#ifndef MASK_HISTORY_H
#define MASK_HISTORY_H

#include <QList>
#include <opencv2/core.hpp>

/**
 * @brief Bounded undo stack of AlphaMask snapshots
 *
 * Holds at most capacity() snapshots. Pushing onto a full stack evicts the
 * oldest one, so only the most recent capacity() states stay recoverable.
 * Snapshots are deep copies; later edits to the live mask never leak in.
 */
class MaskHistory
{
public:
    explicit MaskHistory(int capacity = 15);

    void push(const cv::Mat &mask);
    cv::Mat pop();
    void clear() { m_snapshots.clear(); }

    bool isEmpty() const { return m_snapshots.isEmpty(); }
    int size() const { return static_cast<int>(m_snapshots.size()); }
    int capacity() const { return m_capacity; }
    int evictedCount() const { return m_evicted; }

private:
    QList<cv::Mat> m_snapshots;
    int m_capacity;
    int m_evicted;
};

#endif // MASK_HISTORY_H
