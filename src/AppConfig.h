#pragma once

#include <QByteArray>
#include <QString>

class QSettings;

// Settings the application reads at startup. Values come from QSettings;
// missing keys fall back to files beside the executable.
struct AppConfig
{
    QString    dataFilePath;
    QString    sessionLogPath;
    QString    errorLogPath;
    int        tickIntervalMs   = 1000;
    int        countdownSeconds = 3600;
    QString    lastProject;
    QByteArray windowGeometry;

    static constexpr int kMinTickMs = 100;
    static constexpr int kMaxTickMs = 10000;

    static constexpr const char* kDataFileName   = "projects_data.json";
    static constexpr const char* kSessionLogName = "projects_sessions.log";
    static constexpr const char* kErrorLogName   = "errors.log";

    // |baseDir| is where default files live (the executable's directory in
    // production).
    static AppConfig load(QSettings& settings, const QString& baseDir);

    static void saveLastProject(QSettings& settings, const QString& project);
    static void saveWindowGeometry(QSettings& settings, const QByteArray& geometry);
};
