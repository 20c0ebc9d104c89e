#pragma once

#include <QElapsedTimer>
#include <QtGlobal>

// Monotonic time source in milliseconds. ProjectTracker reads "now" only
// through this interface so tests can drive time by hand.
class Clock
{
public:
    virtual ~Clock() = default;
    virtual qint64 nowMs() const = 0;
};

// Production clock backed by QElapsedTimer (monotonic where the platform
// provides it). Readings are relative to construction.
class SteadyClock : public Clock
{
public:
    SteadyClock();
    qint64 nowMs() const override;

private:
    QElapsedTimer m_timer;
};
