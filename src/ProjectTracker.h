#pragma once

#include <QMap>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTimer>

#include "TimerState.h"

class Clock;
class ProjectStore;

// Owns the stopwatch for the selected project and turns user intents into
// TimerState transitions plus store writes. The store and clock must outlive
// the tracker.
//
// Saves happen on stop, reset, project switch and shutdown. A running
// interval is never written on its own; only the folded total is.
class ProjectTracker : public QObject
{
    Q_OBJECT
public:
    ProjectTracker(ProjectStore& store, const Clock& clock,
                   int tickIntervalMs = 1000, QObject* parent = nullptr);

    // Fold and save the current project, then load |name| stopped. If the
    // timer was running it continues on |name| from this instant.
    bool switchProject(const QString& name);

    // Register |name| in the store (if new) and switch to it.
    bool addProject(const QString& name);

    void start();
    void stop();
    void toggle();

    // Caller is responsible for asking the user first.
    void reset();

    // Stop and save. Safe to call more than once.
    void shutdown();

    double  currentTotal()   const;
    double  sessionSeconds() const;
    bool    isRunning()      const { return m_state.isRunning(); }
    bool    hasProject()     const { return !m_project.isEmpty(); }
    QString currentProject() const { return m_project; }
    QStringList projects()   const;

    bool isTickActive()   const { return m_tick.isActive(); }
    int  tickIntervalMs() const { return m_tick.interval(); }

    QString lastError() const { return m_lastError; }

signals:
    void runningChanged(bool running);
    void projectChanged(const QString& project);
    void projectsChanged();

    // Emitted on every tick while running and after each transition.
    void totalChanged(double totalSeconds);

    // Persistence failed; the timer itself keeps working.
    void saveFailed(const QString& message);

private slots:
    void onTick();

private:
    bool persist();
    void flushUnsaved();
    void setTicking(bool on);
    void logStatus(const char* status, double session) const;

    ProjectStore& m_store;
    const Clock&  m_clock;
    TimerState    m_state;
    QString       m_project;
    QTimer        m_tick;
    QString       m_lastError;

    // Totals the store rejected, by project. Retried after the next good save.
    QMap<QString, double> m_unsaved;
};
