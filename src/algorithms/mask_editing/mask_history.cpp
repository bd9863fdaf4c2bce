#include "algorithms/mask_editing/mask_history.h"
#include <QtGlobal>

MaskHistory::MaskHistory(int capacity)
    : m_capacity(qMax(1, capacity))
    , m_evicted(0)
{
}

void MaskHistory::push(const cv::Mat &mask)
{
    if (m_snapshots.size() >= m_capacity) {
        m_snapshots.removeFirst();
        ++m_evicted;
    }
    m_snapshots.append(mask.clone());
}

cv::Mat MaskHistory::pop()
{
    if (m_snapshots.isEmpty()) {
        return cv::Mat();
    }
    return m_snapshots.takeLast();
}
