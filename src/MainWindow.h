#pragma once

#include <QMainWindow>
#include <QSystemTrayIcon>
#include <QMenu>
#include <QMenuBar>
#include <QAction>
#include <QLabel>
#include <QPushButton>
#include <QComboBox>
#include <QTimeEdit>
#include <QGroupBox>
#include <QTimer>

#include "AppConfig.h"
#include "Clock.h"
#include "CountdownTimer.h"
#include "ProjectStore.h"
#include "ProjectTracker.h"

class QVBoxLayout;

class MainWindow : public QMainWindow
{
    Q_OBJECT
public:
    explicit MainWindow(const AppConfig& config, QWidget* parent = nullptr);
    ~MainWindow();
    void showTrayIcon();

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    // Project row
    void onAddProjectClicked();
    void onProjectActivated(int index);

    // Stopwatch
    void onToggleClicked();
    void onResetClicked();
    void onTotalChanged(double totalSeconds);
    void onRunningChanged(bool running);
    void onProjectChanged(const QString& project);
    void onSaveFailed(const QString& message);

    // Countdown
    void onCountdownStartClicked();
    void onCountdownCancelClicked();
    void onCountdownTick(int remainingSeconds);
    void onCountdownTriggered();
    void onPresetClicked(int seconds);
    void onFlashTitle();

    // Menu bar
    void onMenuExit();
    void onMenuAbout();

    // Tray
    void onTrayIconActivated(QSystemTrayIcon::ActivationReason reason);
    void onTrayShowHide();
    void onTrayQuit();

    void onAboutToQuit();

private:
    void buildUI();
    void buildProjectRow(QWidget* page, QVBoxLayout* layout);
    void buildStopwatch(QWidget* page, QVBoxLayout* layout);
    void buildCountdown(QWidget* page, QVBoxLayout* layout);
    void buildMenuBar();
    void buildTray();
    void setupConnections();

    void refreshProjectList();
    void updateTitle();
    void setRunButtonStyle(bool running);
    void setCountdownRunning(bool running);
    void showWarning(const QString& msg);

    // ── Core components ───────────────────────────────────────────────────────
    AppConfig        m_config;
    SteadyClock      m_clock;
    ProjectStore*    m_store     = nullptr;
    ProjectTracker*  m_tracker   = nullptr;
    CountdownTimer*  m_countdown = nullptr;

    // ── Menu bar ──────────────────────────────────────────────────────────────
    QMenu*   m_fileMenu    = nullptr;
    QAction* m_exitAction  = nullptr;
    QMenu*   m_helpMenu    = nullptr;
    QAction* m_aboutAction = nullptr;

    // ── Tray ──────────────────────────────────────────────────────────────────
    QSystemTrayIcon* m_trayIcon           = nullptr;
    QMenu*           m_trayMenu           = nullptr;
    QAction*         m_trayShowHideAction = nullptr;
    QAction*         m_trayToggleAction   = nullptr;
    QAction*         m_trayQuitAction     = nullptr;

    // ── Project row ───────────────────────────────────────────────────────────
    QComboBox*   m_projectCombo = nullptr;
    QPushButton* m_addBtn       = nullptr;

    // ── Stopwatch ─────────────────────────────────────────────────────────────
    QPushButton* m_runBtn          = nullptr;
    QPushButton* m_resetBtn        = nullptr;
    QLabel*      m_totalHoursLabel = nullptr;
    QLabel*      m_totalHmsLabel   = nullptr;

    // ── Countdown ─────────────────────────────────────────────────────────────
    QGroupBox*   m_countdownGroup     = nullptr;
    QTimeEdit*   m_countdownEdit      = nullptr;
    QPushButton* m_preset15m          = nullptr;
    QPushButton* m_preset30m          = nullptr;
    QPushButton* m_preset1h           = nullptr;
    QPushButton* m_preset2h           = nullptr;
    QPushButton* m_countdownStartBtn  = nullptr;
    QPushButton* m_countdownCancelBtn = nullptr;
    QLabel*      m_countdownLabel     = nullptr;

    QTimer m_flashTimer;
    int    m_flashCount = 0;

    // ── Status ────────────────────────────────────────────────────────────────
    QLabel* m_statusLabel = nullptr;
};
