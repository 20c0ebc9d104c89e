#pragma once

#include <QObject>
#include <QTimer>
#include <QDateTime>

// Stand-alone countdown ("time box"). It is independent of the project
// stopwatch and is never persisted.
class CountdownTimer : public QObject
{
    Q_OBJECT
public:
    explicit CountdownTimer(QObject* parent = nullptr);

    // Count down |totalSeconds| from now. Zero or less fires triggered()
    // straight away.
    void startCountdown(int totalSeconds);

    void stop();

    bool isRunning()        const { return m_timer.isActive(); }
    int  remainingSeconds() const { return m_remaining; }

signals:
    // Emitted once per displayed second while running
    void tick(int remainingSeconds);

    // Emitted when the countdown reaches zero
    void triggered();

private slots:
    void onTick();

private:
    QTimer    m_timer;
    int       m_remaining   = 0;
    int       m_lastEmitted = -1;
    QDateTime m_target;
};
