#include "AppConfig.h"

#include <QDir>
#include <QSettings>

namespace {

QString pathSetting(QSettings& settings, const char* key,
                    const QString& baseDir, const char* defaultName)
{
    const QString value = settings.value(key).toString().trimmed();
    if (value.isEmpty())
        return QDir(baseDir).filePath(QString::fromLatin1(defaultName));
    // Relative paths are resolved against the executable directory, not the
    // working directory the app happened to be launched from.
    return QDir(baseDir).absoluteFilePath(value);
}

}

AppConfig AppConfig::load(QSettings& settings, const QString& baseDir)
{
    AppConfig cfg;
    cfg.dataFilePath   = pathSetting(settings, "dataFile",   baseDir, kDataFileName);
    cfg.sessionLogPath = pathSetting(settings, "sessionLog", baseDir, kSessionLogName);
    cfg.errorLogPath   = pathSetting(settings, "errorLog",   baseDir, kErrorLogName);

    bool ok = false;
    int tick = settings.value("tickIntervalMs", 1000).toInt(&ok);
    if (!ok)
        tick = 1000;
    cfg.tickIntervalMs = qBound(kMinTickMs, tick, kMaxTickMs);

    int countdown = settings.value("countdownSeconds", 3600).toInt(&ok);
    if (!ok || countdown <= 0)
        countdown = 3600;
    cfg.countdownSeconds = countdown;

    cfg.lastProject    = settings.value("lastProject").toString().trimmed();
    cfg.windowGeometry = settings.value("windowGeometry").toByteArray();
    return cfg;
}

void AppConfig::saveLastProject(QSettings& settings, const QString& project)
{
    settings.setValue("lastProject", project);
}

void AppConfig::saveWindowGeometry(QSettings& settings, const QByteArray& geometry)
{
    settings.setValue("windowGeometry", geometry);
}
