#include "ProjectStore.h"
#include "Logging.h"

#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QSaveFile>

#include <cmath>

ProjectStore::ProjectStore(const QString& filePath, QObject* parent)
    : QObject(parent)
    , m_filePath(filePath)
{}

// ── Read ──────────────────────────────────────────────────────────────────────

ProjectStore::ReadStatus ProjectStore::readMapping(QMap<QString, double>& out) const
{
    out.clear();

    QFile file(m_filePath);
    if (!file.exists())
        return ReadStatus::Missing;

    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcStore).noquote()
            << "Cannot read" << m_filePath << ":" << file.errorString();
        return ReadStatus::Unreadable;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qCWarning(lcStore).noquote()
            << "Ignoring corrupt project data in" << m_filePath << ":"
            << (parseError.error != QJsonParseError::NoError
                    ? parseError.errorString()
                    : QStringLiteral("top level is not an object"));
        return ReadStatus::Corrupt;
    }

    const QJsonObject root = doc.object();
    for (auto it = root.constBegin(); it != root.constEnd(); ++it) {
        const QString name = it.key();
        const QJsonValue value = it.value();
        // Entries that are not a finite, non-negative number are dropped.
        // Names are stored trimmed; a padded key is never merged into another.
        if (name.trimmed().isEmpty() || name != name.trimmed() || !value.isDouble()) {
            qCWarning(lcStore).noquote() << "Skipping malformed entry" << it.key();
            continue;
        }
        const double seconds = value.toDouble();
        if (!std::isfinite(seconds) || seconds < 0.0) {
            qCWarning(lcStore).noquote()
                << "Skipping out-of-range total for" << it.key() << ":" << seconds;
            continue;
        }
        out.insert(name, seconds);
    }
    return ReadStatus::Ok;
}

// Like readMapping(), but refuses to continue when the existing file cannot be
// opened: overwriting it would lose entries we were unable to see.
bool ProjectStore::readForUpdate(QMap<QString, double>& out)
{
    if (readMapping(out) == ReadStatus::Unreadable) {
        m_lastError = QString("Cannot read %1 before writing").arg(m_filePath);
        return false;
    }
    return true;
}

double ProjectStore::load(const QString& projectId) const
{
    QMap<QString, double> mapping;
    switch (readMapping(mapping)) {
        case ReadStatus::Missing:
            qCInfo(lcStore).noquote() << "No project data at" << m_filePath << "- starting from zero";
            return 0.0;
        case ReadStatus::Unreadable:
        case ReadStatus::Corrupt:
            return 0.0;
        case ReadStatus::Ok:
            break;
    }
    return mapping.value(projectId.trimmed(), 0.0);
}

QStringList ProjectStore::projects() const
{
    QMap<QString, double> mapping;
    readMapping(mapping);
    return mapping.keys();
}

// ── Write ─────────────────────────────────────────────────────────────────────

bool ProjectStore::writeMapping(const QMap<QString, double>& mapping)
{
    QJsonObject root;
    for (auto it = mapping.constBegin(); it != mapping.constEnd(); ++it)
        root.insert(it.key(), it.value());

    const QFileInfo info(m_filePath);
    if (!QDir().mkpath(info.absolutePath())) {
        m_lastError = QString("Cannot create directory %1").arg(info.absolutePath());
        return false;
    }

    // QSaveFile writes to a temporary file and renames it over the target on
    // commit(), so the old file survives any failure up to that point.
    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        m_lastError = QString("Cannot open %1 for writing: %2")
                      .arg(m_filePath, file.errorString());
        return false;
    }

    const QByteArray bytes = QJsonDocument(root).toJson(QJsonDocument::Indented);
    if (file.write(bytes) != bytes.size()) {
        m_lastError = QString("Write to %1 failed: %2")
                      .arg(m_filePath, file.errorString());
        file.cancelWriting();
        return false;
    }

    if (!file.commit()) {
        m_lastError = QString("Commit of %1 failed: %2")
                      .arg(m_filePath, file.errorString());
        return false;
    }
    return true;
}

bool ProjectStore::save(const QString& projectId, double accumulatedSeconds)
{
    const QString name = projectId.trimmed();
    if (name.isEmpty()) {
        m_lastError = QStringLiteral("Project name must not be empty");
        return false;
    }
    if (!std::isfinite(accumulatedSeconds) || accumulatedSeconds < 0.0) {
        m_lastError = QString("Invalid total for %1: %2").arg(name).arg(accumulatedSeconds);
        return false;
    }

    QMap<QString, double> mapping;
    if (!readForUpdate(mapping))
        return false;

    mapping.insert(name, accumulatedSeconds);
    if (!writeMapping(mapping)) {
        qCWarning(lcStore).noquote() << m_lastError;
        return false;
    }
    return true;
}

bool ProjectStore::addProject(const QString& projectId)
{
    const QString name = projectId.trimmed();
    if (name.isEmpty()) {
        m_lastError = QStringLiteral("Project name must not be empty");
        return false;
    }

    QMap<QString, double> mapping;
    if (!readForUpdate(mapping))
        return false;
    if (mapping.contains(name))
        return true;

    mapping.insert(name, 0.0);
    if (!writeMapping(mapping)) {
        qCWarning(lcStore).noquote() << m_lastError;
        return false;
    }
    qCInfo(lcStore).noquote() << "Added project" << name;
    return true;
}
