#include "TimerState.h"

#include <cmath>

void TimerState::start(qint64 now)
{
    if (m_running)
        return;
    m_startedAt = now;
    m_running   = true;
}

void TimerState::stop(qint64 now)
{
    if (!m_running)
        return;
    m_accumulated += elapsedSinceStart(now);
    m_startedAt    = 0;
    m_running      = false;
}

void TimerState::reset(qint64 now)
{
    m_accumulated = 0.0;
    if (m_running)
        m_startedAt = now;
}

void TimerState::restore(double accumulatedSeconds)
{
    if (!std::isfinite(accumulatedSeconds) || accumulatedSeconds < 0.0)
        accumulatedSeconds = 0.0;
    m_accumulated = accumulatedSeconds;
    m_running     = false;
    m_startedAt   = 0;
}

double TimerState::elapsedSinceStart(qint64 now) const
{
    // A reading from before the session started counts as zero, never
    // negative, so the total cannot step backwards.
    if (!m_running || now <= m_startedAt)
        return 0.0;
    return static_cast<double>(now - m_startedAt) / 1000.0;
}

double TimerState::currentTotal(qint64 now) const
{
    return m_accumulated + elapsedSinceStart(now);
}
