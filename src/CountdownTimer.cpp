#include "CountdownTimer.h"

CountdownTimer::CountdownTimer(QObject* parent)
    : QObject(parent)
{
    // 100 ms polling so a late timer event never skips a displayed second.
    m_timer.setInterval(100);
    connect(&m_timer, &QTimer::timeout, this, &CountdownTimer::onTick);
}

void CountdownTimer::startCountdown(int totalSeconds)
{
    if (totalSeconds <= 0) {
        stop();
        emit triggered();
        return;
    }
    m_remaining   = totalSeconds;
    m_target      = QDateTime::currentDateTime().addSecs(totalSeconds);
    m_lastEmitted = totalSeconds;
    m_timer.start();
    emit tick(m_remaining);
}

void CountdownTimer::stop()
{
    m_timer.stop();
    m_remaining   = 0;
    m_lastEmitted = -1;
}

void CountdownTimer::onTick()
{
    // Round up: with 1.4 s left the display still reads 2 until the second
    // boundary passes, and 0 only appears when the target is reached.
    const qint64 msLeft = QDateTime::currentDateTime().msecsTo(m_target);
    m_remaining = msLeft > 0 ? static_cast<int>((msLeft + 999) / 1000) : 0;

    if (m_remaining != m_lastEmitted) {
        m_lastEmitted = m_remaining;
        emit tick(m_remaining);
    }

    if (m_remaining == 0) {
        m_timer.stop();
        emit triggered();
    }
}
