#include "Logging.h"

#include <QDateTime>
#include <QFile>
#include <QTemporaryDir>

#include <gtest/gtest.h>

namespace {

QString readAll(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
        return {};
    return QString::fromUtf8(file.readAll());
}

}

TEST(LoggingTest, FormatsTimestampPrefix)
{
    const QDateTime when(QDate(2024, 3, 9), QTime(14, 5, 7));
    EXPECT_EQ(Logging::formatLine(when, "Thesis: running"),
              QString("2024-03-09 14:05:07 - Thesis: running"));
}

TEST(LoggingTest, RoutesInfoAndWarningsToTheirFiles)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString sessionLog = dir.filePath("projects_sessions.log");
    const QString errorLog   = dir.filePath("errors.log");

    Logging::install(sessionLog, errorLog);
    qCInfo(lcSession) << "session line";
    qCWarning(lcStore) << "store warning";
    Logging::uninstall();

    const QString sessions = readAll(sessionLog);
    const QString errors   = readAll(errorLog);
    EXPECT_TRUE(sessions.contains("session line"));
    EXPECT_TRUE(sessions.contains("store warning"));
    EXPECT_FALSE(errors.contains("session line"));
    EXPECT_TRUE(errors.contains("store warning"));
}

TEST(LoggingTest, UnwritableLogPathDoesNotStopLogging)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString errorLog = dir.filePath("errors.log");

    Logging::install(dir.filePath("missing/dir/session.log"), errorLog);
    qCWarning(lcApp) << "still fine";
    Logging::uninstall();

    EXPECT_FALSE(QFile::exists(dir.filePath("missing/dir/session.log")));
    EXPECT_TRUE(readAll(errorLog).contains("still fine"));
}
