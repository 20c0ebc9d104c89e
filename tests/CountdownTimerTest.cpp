#include "CountdownTimer.h"

#include <QEventLoop>
#include <QTimer>

#include <gtest/gtest.h>

TEST(CountdownTimerTest, NonPositiveDurationTriggersImmediately)
{
    CountdownTimer countdown;
    int triggered = 0;
    QObject::connect(&countdown, &CountdownTimer::triggered, [&triggered] { ++triggered; });

    countdown.startCountdown(0);
    EXPECT_EQ(triggered, 1);
    EXPECT_FALSE(countdown.isRunning());

    countdown.startCountdown(-5);
    EXPECT_EQ(triggered, 2);
}

TEST(CountdownTimerTest, StartEmitsInitialTickAndStopCancels)
{
    CountdownTimer countdown;
    QList<int> ticks;
    QObject::connect(&countdown, &CountdownTimer::tick, [&ticks](int s) { ticks << s; });

    countdown.startCountdown(90);
    EXPECT_TRUE(countdown.isRunning());
    EXPECT_EQ(countdown.remainingSeconds(), 90);
    EXPECT_EQ(ticks, QList<int>({90}));

    countdown.stop();
    EXPECT_FALSE(countdown.isRunning());
    EXPECT_EQ(countdown.remainingSeconds(), 0);
}

TEST(CountdownTimerTest, ReachesZeroAndFiresOnce)
{
    CountdownTimer countdown;
    int triggered = 0;
    QList<int> ticks;
    QEventLoop loop;
    QObject::connect(&countdown, &CountdownTimer::tick, [&ticks](int s) { ticks << s; });
    QObject::connect(&countdown, &CountdownTimer::triggered, [&] {
        ++triggered;
        loop.quit();
    });

    // Safety net so a broken timer cannot hang the suite.
    QTimer::singleShot(5000, &loop, &QEventLoop::quit);
    countdown.startCountdown(1);
    loop.exec();

    EXPECT_EQ(triggered, 1);
    EXPECT_FALSE(countdown.isRunning());
    ASSERT_FALSE(ticks.isEmpty());
    EXPECT_EQ(ticks.first(), 1);
    EXPECT_EQ(ticks.last(), 0);
}
