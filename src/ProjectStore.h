#pragma once

#include <QObject>
#include <QMap>
#include <QString>
#include <QStringList>

// Durable mapping from project name to accumulated seconds, kept in a
// human-readable JSON object:
//   { "Thesis": 5400, "Website": 812.5 }
//
// Every call re-reads the file; nothing is cached between calls. Saves are a
// whole-mapping read-modify-write committed through QSaveFile, so a failed
// write leaves the previous file untouched.
class ProjectStore : public QObject
{
    Q_OBJECT
public:
    explicit ProjectStore(const QString& filePath, QObject* parent = nullptr);

    // Stored total for |projectId|, or 0 when the file is missing, unreadable,
    // corrupt, or has no such entry. Never fails.
    double load(const QString& projectId) const;

    // Write |accumulatedSeconds| for |projectId|, keeping every other entry.
    // Returns false and sets lastError() on failure.
    bool save(const QString& projectId, double accumulatedSeconds);

    // Create |projectId| with a zero total if it does not exist yet.
    bool addProject(const QString& projectId);

    // All stored project names, sorted.
    QStringList projects() const;

    QString filePath()  const { return m_filePath; }
    QString lastError() const { return m_lastError; }

private:
    enum class ReadStatus {
        Ok,
        Missing,
        Unreadable,
        Corrupt
    };

    ReadStatus readMapping(QMap<QString, double>& out) const;
    bool       writeMapping(const QMap<QString, double>& mapping);
    bool       readForUpdate(QMap<QString, double>& out);

    QString m_filePath;
    QString m_lastError;
};
