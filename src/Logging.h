#pragma once

#include <QLoggingCategory>
#include <QString>

class QDateTime;

Q_DECLARE_LOGGING_CATEGORY(lcSession)
Q_DECLARE_LOGGING_CATEGORY(lcStore)
Q_DECLARE_LOGGING_CATEGORY(lcApp)

namespace Logging {

// Route all Qt logging through a handler that writes
//   yyyy-MM-dd HH:mm:ss - message
// to stderr, appends info and above to |sessionLogPath| and warnings and
// above to |errorLogPath|. Either path may be empty to skip that file.
void install(const QString& sessionLogPath, const QString& errorLogPath);

// Restore Qt's default handler and close the log files.
void uninstall();

// One log line, without the trailing newline.
QString formatLine(const QDateTime& when, const QString& message);

}
