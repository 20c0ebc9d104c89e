#pragma once

#include <QtGlobal>

// Stopwatch state for a single project.
// Instants are monotonic clock readings in milliseconds (see Clock.h).
// All mutation goes through start() / stop() / reset(); restore() only seeds
// a stopped state from a stored total.
class TimerState
{
public:
    TimerState() = default;

    void start(qint64 now);
    void stop(qint64 now);

    // Clears the banked total. A running timer keeps running from zero.
    void reset(qint64 now);

    // Seed a stopped state with a previously saved total.
    void restore(double accumulatedSeconds);

    double currentTotal(qint64 now) const;
    double elapsedSinceStart(qint64 now) const;

    bool   isRunning()          const { return m_running; }
    double accumulatedSeconds() const { return m_accumulated; }
    qint64 startedAt()          const { return m_startedAt; }

private:
    double m_accumulated = 0.0;
    bool   m_running     = false;
    qint64 m_startedAt   = 0;   // meaningful only while m_running
};
