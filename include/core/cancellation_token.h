#ifndef CANCELLATION_TOKEN_H
#define CANCELLATION_TOKEN_H

#include <QAtomicInt>
#include <memory>

/**
 * @brief Shared cancellation flag for background pipeline tasks
 *
 * Copies share the same flag. Long-running stages poll isCancelled() between
 * steps and abandon work without touching caller-visible state.
 */
class CancellationToken
{
public:
    CancellationToken() : m_flag(std::make_shared<QAtomicInt>(0)) {}

    void cancel() { m_flag->storeRelease(1); }
    bool isCancelled() const { return m_flag->loadAcquire() != 0; }

private:
    std::shared_ptr<QAtomicInt> m_flag;
};

#endif // CANCELLATION_TOKEN_H
