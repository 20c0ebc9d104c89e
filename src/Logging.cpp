#include "Logging.h"

#include <QDateTime>
#include <QFile>

#include <cstdio>
#include <memory>

Q_LOGGING_CATEGORY(lcSession, "projecttimer.session")
Q_LOGGING_CATEGORY(lcStore,   "projecttimer.store")
Q_LOGGING_CATEGORY(lcApp,     "projecttimer.app")

namespace {

std::unique_ptr<QFile> g_sessionLog;
std::unique_ptr<QFile> g_errorLog;
QtMessageHandler       g_previous  = nullptr;
bool                   g_installed = false;

std::unique_ptr<QFile> openAppend(const QString& path)
{
    if (path.isEmpty())
        return nullptr;
    auto file = std::make_unique<QFile>(path);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        // Logging must never stop the app; fall back to stderr only.
        std::fprintf(stderr, "Cannot open log file %s: %s\n",
                     qPrintable(path), qPrintable(file->errorString()));
        return nullptr;
    }
    return file;
}

void writeTo(const std::unique_ptr<QFile>& file, const QString& line)
{
    if (!file)
        return;
    file->write(line.toUtf8());
    file->write("\n");
    file->flush();
}

void messageHandler(QtMsgType type, const QMessageLogContext& /*context*/,
                    const QString& msg)
{
    const QString line = Logging::formatLine(QDateTime::currentDateTime(), msg);

    std::fprintf(stderr, "%s\n", qPrintable(line));
    std::fflush(stderr);

    if (type == QtDebugMsg)
        return;
    writeTo(g_sessionLog, line);
    if (type == QtWarningMsg || type == QtCriticalMsg || type == QtFatalMsg)
        writeTo(g_errorLog, line);
}

}

namespace Logging {

void install(const QString& sessionLogPath, const QString& errorLogPath)
{
    uninstall();
    g_sessionLog = openAppend(sessionLogPath);
    g_errorLog   = openAppend(errorLogPath);
    g_previous   = qInstallMessageHandler(messageHandler);
    g_installed  = true;
}

void uninstall()
{
    if (g_installed) {
        qInstallMessageHandler(g_previous);
        g_previous  = nullptr;
        g_installed = false;
    }
    g_sessionLog.reset();
    g_errorLog.reset();
}

QString formatLine(const QDateTime& when, const QString& message)
{
    return when.toString(QStringLiteral("yyyy-MM-dd HH:mm:ss"))
         + QStringLiteral(" - ") + message;
}

}
