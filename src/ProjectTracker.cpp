#include "ProjectTracker.h"
#include "Clock.h"
#include "Logging.h"
#include "ProjectStore.h"
#include "TimeFormat.h"

ProjectTracker::ProjectTracker(ProjectStore& store, const Clock& clock,
                               int tickIntervalMs, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_clock(clock)
{
    // The tick only reads the total for redisplay; it never mutates state.
    m_tick.setInterval(tickIntervalMs);
    connect(&m_tick, &QTimer::timeout, this, &ProjectTracker::onTick);
}

// ── Projects ──────────────────────────────────────────────────────────────────

bool ProjectTracker::switchProject(const QString& name)
{
    const QString project = name.trimmed();
    if (project.isEmpty()) {
        m_lastError = QStringLiteral("Project name must not be empty");
        return false;
    }
    if (project == m_project)
        return true;

    const qint64 now        = m_clock.nowMs();
    const bool   wasRunning = m_state.isRunning();

    if (hasProject()) {
        const double session = m_state.elapsedSinceStart(now);
        m_state.stop(now);
        logStatus("switched away", session);
        persist();
    }

    m_project = project;
    // A total the store refused is still the newest value for that project.
    m_state.restore(m_unsaved.contains(project) ? m_unsaved.value(project)
                                                : m_store.load(project));
    if (wasRunning)
        m_state.start(now);

    logStatus(wasRunning ? "running" : "selected", 0.0);
    emit projectChanged(m_project);
    emit totalChanged(currentTotal());
    return true;
}

bool ProjectTracker::addProject(const QString& name)
{
    const QString project = name.trimmed();
    if (project.isEmpty()) {
        m_lastError = QStringLiteral("Project name must not be empty");
        return false;
    }

    if (!m_store.addProject(project)) {
        // Keep going in memory; the total is kept until a later save succeeds.
        m_lastError = m_store.lastError();
        qCWarning(lcSession).noquote() << "Could not add project:" << m_lastError;
        emit saveFailed(m_lastError);
    }
    emit projectsChanged();
    return switchProject(project);
}

QStringList ProjectTracker::projects() const
{
    QStringList names = m_store.projects();
    QStringList pending = m_unsaved.keys();
    if (hasProject())
        pending.append(m_project);

    bool added = false;
    for (const QString& name : pending) {
        if (!names.contains(name)) {
            names.append(name);
            added = true;
        }
    }
    if (added)
        names.sort();
    return names;
}

// ── Transitions ───────────────────────────────────────────────────────────────

void ProjectTracker::start()
{
    if (!hasProject()) {
        qCWarning(lcSession) << "Start ignored: no project selected";
        return;
    }
    if (m_state.isRunning())
        return;

    m_state.start(m_clock.nowMs());
    setTicking(true);
    logStatus("running", 0.0);
    emit runningChanged(true);
    emit totalChanged(currentTotal());
}

void ProjectTracker::stop()
{
    if (!hasProject() || !m_state.isRunning())
        return;

    const qint64 now     = m_clock.nowMs();
    const double session = m_state.elapsedSinceStart(now);
    m_state.stop(now);
    setTicking(false);
    logStatus("paused", session);
    persist();
    emit runningChanged(false);
    emit totalChanged(currentTotal());
}

void ProjectTracker::toggle()
{
    if (m_state.isRunning())
        stop();
    else
        start();
}

void ProjectTracker::reset()
{
    if (!hasProject())
        return;

    m_state.reset(m_clock.nowMs());
    logStatus("reset", 0.0);
    persist();
    emit totalChanged(currentTotal());
}

void ProjectTracker::shutdown()
{
    if (!hasProject())
        return;

    const qint64 now        = m_clock.nowMs();
    const bool   wasRunning = m_state.isRunning();
    const double session    = m_state.elapsedSinceStart(now);
    m_state.stop(now);
    setTicking(false);
    logStatus("stopped", session);
    persist();
    if (wasRunning)
        emit runningChanged(false);
}

// ── Queries ───────────────────────────────────────────────────────────────────

double ProjectTracker::currentTotal() const
{
    return m_state.currentTotal(m_clock.nowMs());
}

double ProjectTracker::sessionSeconds() const
{
    return m_state.elapsedSinceStart(m_clock.nowMs());
}

void ProjectTracker::onTick()
{
    emit totalChanged(currentTotal());
}

// ── Helpers ───────────────────────────────────────────────────────────────────

bool ProjectTracker::persist()
{
    const double total = m_state.accumulatedSeconds();
    if (!m_store.save(m_project, total)) {
        m_unsaved.insert(m_project, total);
        m_lastError = m_store.lastError();
        qCWarning(lcSession).noquote()
            << "Saving" << m_project << "failed:" << m_lastError;
        emit saveFailed(m_lastError);
        return false;
    }
    m_unsaved.remove(m_project);
    flushUnsaved();
    return true;
}

// Retry totals of other projects whose save failed earlier. Called after a
// successful save, so the store is known to be writable again.
void ProjectTracker::flushUnsaved()
{
    for (auto it = m_unsaved.begin(); it != m_unsaved.end();) {
        if (!m_store.save(it.key(), it.value())) {
            qCWarning(lcSession).noquote()
                << "Retrying" << it.key() << "failed:" << m_store.lastError();
            ++it;
            continue;
        }
        qCInfo(lcSession).noquote() << "Saved pending total for" << it.key();
        it = m_unsaved.erase(it);
    }
}

void ProjectTracker::setTicking(bool on)
{
    if (on)
        m_tick.start();
    else
        m_tick.stop();
}

void ProjectTracker::logStatus(const char* status, double session) const
{
    qCInfo(lcSession).noquote()
        << QString("%1: %2, Session: %3h Total: %4h")
           .arg(m_project, QString::fromLatin1(status),
                TimeFormat::formatHoursTenths(session),
                TimeFormat::formatHoursTenths(currentTotal()));
}
