#include "MainWindow.h"
#include "Logging.h"
#include "TimeFormat.h"

#include <QApplication>
#include <QCoreApplication>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QLineEdit>
#include <QGridLayout>
#include <QMessageBox>
#include <QCloseEvent>
#include <QIcon>
#include <QFont>
#include <QSettings>
#include <QStyle>
#include <QTime>

namespace {

constexpr int  kFlashToggles = 6;
const QString  kTimesUpTitle = QStringLiteral("⚠ TIME'S UP! ⚠");

}

// ── Constructor ───────────────────────────────────────────────────────────────

MainWindow::MainWindow(const AppConfig& config, QWidget* parent)
    : QMainWindow(parent)
    , m_config(config)
{
    m_store     = new ProjectStore(m_config.dataFilePath, this);
    m_tracker   = new ProjectTracker(*m_store, m_clock, m_config.tickIntervalMs, this);
    m_countdown = new CountdownTimer(this);

    buildMenuBar();
    buildUI();
    buildTray();
    setupConnections();

    setWindowIcon(style()->standardIcon(QStyle::SP_BrowserReload));

    // Reopen the project that was selected when the app last closed; fall back
    // to the first stored project.
    refreshProjectList();
    QString initial = m_config.lastProject;
    if (initial.isEmpty() || m_projectCombo->findText(initial) < 0)
        initial = m_projectCombo->count() > 0 ? m_projectCombo->itemText(0) : QString();
    if (!initial.isEmpty())
        m_tracker->switchProject(initial);

    onRunningChanged(false);
    onTotalChanged(m_tracker->currentTotal());
    updateTitle();

    setMinimumSize(420, 300);
    resize(540, 340);

    if (!m_config.windowGeometry.isEmpty())
        restoreGeometry(m_config.windowGeometry);
}

MainWindow::~MainWindow()
{
    // The tracker holds references to m_clock and m_store; drop it first.
    delete m_tracker;
    m_tracker = nullptr;
}

// ── Build menu bar ────────────────────────────────────────────────────────────

void MainWindow::buildMenuBar()
{
    QMenuBar* bar = menuBar();

    m_fileMenu   = bar->addMenu(tr("File"));
    m_exitAction = m_fileMenu->addAction(tr("Exit"));

    m_helpMenu    = bar->addMenu(tr("Help"));
    m_aboutAction = m_helpMenu->addAction(tr("About"));
}

// ── Build UI ──────────────────────────────────────────────────────────────────

void MainWindow::buildUI()
{
    QWidget* central = new QWidget(this);
    setCentralWidget(central);

    QVBoxLayout* mainLayout = new QVBoxLayout(central);
    mainLayout->setContentsMargins(12, 12, 12, 8);
    mainLayout->setSpacing(8);

    buildProjectRow(central, mainLayout);
    buildStopwatch(central, mainLayout);
    buildCountdown(central, mainLayout);

    m_statusLabel = new QLabel("", central);
    m_statusLabel->setAlignment(Qt::AlignCenter);
    m_statusLabel->setWordWrap(true);
    mainLayout->addWidget(m_statusLabel);

    mainLayout->addStretch();
}

void MainWindow::buildProjectRow(QWidget* page, QVBoxLayout* layout)
{
    QHBoxLayout* row = new QHBoxLayout();
    row->addWidget(new QLabel(tr("Project:"), page));

    m_projectCombo = new QComboBox(page);
    m_projectCombo->setEditable(true);
    m_projectCombo->setInsertPolicy(QComboBox::NoInsert);
    m_projectCombo->setMinimumWidth(200);
    row->addWidget(m_projectCombo, 1);

    m_addBtn = new QPushButton("+", page);
    m_addBtn->setFixedWidth(32);
    m_addBtn->setToolTip(tr("Add the typed name as a new project"));
    row->addWidget(m_addBtn);

    layout->addLayout(row);
}

void MainWindow::buildStopwatch(QWidget* page, QVBoxLayout* layout)
{
    QGridLayout* grid = new QGridLayout();

    grid->addWidget(new QLabel(tr("Session:"), page), 0, 0);

    m_runBtn = new QPushButton("00:00:00", page);
    m_runBtn->setFixedHeight(44);
    m_runBtn->setMinimumWidth(170);
    QFont runFont = m_runBtn->font();
    runFont.setPointSize(16);
    runFont.setBold(true);
    m_runBtn->setFont(runFont);
    m_runBtn->setToolTip(tr("Start / stop the timer"));
    grid->addWidget(m_runBtn, 0, 1);

    m_resetBtn = new QPushButton(tr("Reset"), page);
    m_resetBtn->setFixedHeight(28);
    grid->addWidget(m_resetBtn, 1, 1);

    grid->addWidget(new QLabel(tr("Total (h):"), page), 0, 2, Qt::AlignRight);
    m_totalHoursLabel = new QLabel("0.0", page);
    QFont totalFont = m_totalHoursLabel->font();
    totalFont.setPointSize(18);
    totalFont.setBold(true);
    m_totalHoursLabel->setFont(totalFont);
    m_totalHoursLabel->setStyleSheet("color: darkblue;");
    grid->addWidget(m_totalHoursLabel, 0, 3);

    m_totalHmsLabel = new QLabel("00:00:00", page);
    m_totalHmsLabel->setAlignment(Qt::AlignCenter);
    grid->addWidget(m_totalHmsLabel, 1, 3);

    grid->setColumnStretch(4, 1);
    layout->addLayout(grid);
}

void MainWindow::buildCountdown(QWidget* page, QVBoxLayout* layout)
{
    m_countdownGroup = new QGroupBox(tr("Countdown"), page);
    QVBoxLayout* cdLayout = new QVBoxLayout(m_countdownGroup);
    cdLayout->setSpacing(6);

    const int preset = m_config.countdownSeconds;
    m_countdownEdit = new QTimeEdit(
        QTime(0, 0).addSecs(qMin(preset, 24 * 3600 - 1)), m_countdownGroup);
    m_countdownEdit->setDisplayFormat("HH : mm : ss");
    m_countdownEdit->setAlignment(Qt::AlignCenter);

    m_countdownLabel = new QLabel("--:--:--", m_countdownGroup);
    QFont f = m_countdownLabel->font();
    f.setPointSize(14);
    f.setBold(true);
    m_countdownLabel->setFont(f);

    m_countdownStartBtn  = new QPushButton(tr("Start"), m_countdownGroup);
    m_countdownCancelBtn = new QPushButton(tr("Cancel"), m_countdownGroup);
    m_countdownCancelBtn->setEnabled(false);

    QHBoxLayout* timeRow = new QHBoxLayout();
    timeRow->addWidget(m_countdownEdit);
    timeRow->addWidget(m_countdownLabel, 1, Qt::AlignCenter);
    timeRow->addWidget(m_countdownStartBtn);
    timeRow->addWidget(m_countdownCancelBtn);
    cdLayout->addLayout(timeRow);

    m_preset15m = new QPushButton(tr("15 min"), m_countdownGroup);
    m_preset30m = new QPushButton(tr("30 min"), m_countdownGroup);
    m_preset1h  = new QPushButton(tr("1 hour"), m_countdownGroup);
    m_preset2h  = new QPushButton(tr("2 hours"), m_countdownGroup);

    QHBoxLayout* presetRow = new QHBoxLayout();
    presetRow->addStretch();
    for (QPushButton* btn : {m_preset15m, m_preset30m, m_preset1h, m_preset2h}) {
        btn->setFlat(true);
        btn->setCursor(Qt::PointingHandCursor);
        presetRow->addWidget(btn);
    }
    presetRow->addStretch();
    cdLayout->addLayout(presetRow);

    layout->addWidget(m_countdownGroup);
}

void MainWindow::buildTray()
{
    m_trayIcon = new QSystemTrayIcon(style()->standardIcon(QStyle::SP_BrowserReload), this);
    m_trayIcon->setToolTip(tr("Project Timer"));

    m_trayMenu = new QMenu(this);
    m_trayShowHideAction = m_trayMenu->addAction(tr("Show / Hide"));
    m_trayToggleAction   = m_trayMenu->addAction(tr("Start"));
    m_trayMenu->addSeparator();
    m_trayQuitAction = m_trayMenu->addAction(tr("Quit"));

    m_trayIcon->setContextMenu(m_trayMenu);
    // show() is deferred until the event loop runs (see main.cpp).
}

void MainWindow::showTrayIcon()
{
    if (m_trayIcon && QSystemTrayIcon::isSystemTrayAvailable())
        m_trayIcon->show();
}

// ── Connections ───────────────────────────────────────────────────────────────

void MainWindow::setupConnections()
{
    // Project row
    connect(m_addBtn, &QPushButton::clicked, this, &MainWindow::onAddProjectClicked);
    connect(m_projectCombo->lineEdit(), &QLineEdit::returnPressed,
            this, &MainWindow::onAddProjectClicked);
    connect(m_projectCombo, QOverload<int>::of(&QComboBox::activated),
            this, &MainWindow::onProjectActivated);

    // Stopwatch
    connect(m_runBtn,   &QPushButton::clicked, this, &MainWindow::onToggleClicked);
    connect(m_resetBtn, &QPushButton::clicked, this, &MainWindow::onResetClicked);

    connect(m_tracker, &ProjectTracker::totalChanged,   this, &MainWindow::onTotalChanged);
    connect(m_tracker, &ProjectTracker::runningChanged, this, &MainWindow::onRunningChanged);
    connect(m_tracker, &ProjectTracker::projectChanged, this, &MainWindow::onProjectChanged);
    connect(m_tracker, &ProjectTracker::saveFailed,     this, &MainWindow::onSaveFailed);
    connect(m_tracker, &ProjectTracker::projectsChanged,
            this, &MainWindow::refreshProjectList);

    // Countdown
    connect(m_countdownStartBtn,  &QPushButton::clicked, this, &MainWindow::onCountdownStartClicked);
    connect(m_countdownCancelBtn, &QPushButton::clicked, this, &MainWindow::onCountdownCancelClicked);
    connect(m_countdown, &CountdownTimer::tick,      this, &MainWindow::onCountdownTick);
    connect(m_countdown, &CountdownTimer::triggered, this, &MainWindow::onCountdownTriggered);

    connect(m_preset15m, &QPushButton::clicked, this, [this]{ onPresetClicked(15 * 60); });
    connect(m_preset30m, &QPushButton::clicked, this, [this]{ onPresetClicked(30 * 60); });
    connect(m_preset1h,  &QPushButton::clicked, this, [this]{ onPresetClicked(60 * 60); });
    connect(m_preset2h,  &QPushButton::clicked, this, [this]{ onPresetClicked(120 * 60); });

    m_flashTimer.setInterval(500);
    connect(&m_flashTimer, &QTimer::timeout, this, &MainWindow::onFlashTitle);

    // Menu bar
    connect(m_exitAction,  &QAction::triggered, this, &MainWindow::onMenuExit);
    connect(m_aboutAction, &QAction::triggered, this, &MainWindow::onMenuAbout);

    // Tray
    connect(m_trayIcon,           &QSystemTrayIcon::activated,
            this, &MainWindow::onTrayIconActivated);
    connect(m_trayShowHideAction, &QAction::triggered, this, &MainWindow::onTrayShowHide);
    connect(m_trayToggleAction,   &QAction::triggered, this, &MainWindow::onToggleClicked);
    connect(m_trayQuitAction,     &QAction::triggered, this, &MainWindow::onTrayQuit);

    connect(qApp, &QCoreApplication::aboutToQuit, this, &MainWindow::onAboutToQuit);
}

// ── Project row slots ─────────────────────────────────────────────────────────

void MainWindow::onAddProjectClicked()
{
    const QString name = m_projectCombo->currentText().trimmed();
    if (name.isEmpty())
        return;
    m_tracker->addProject(name);
}

void MainWindow::onProjectActivated(int index)
{
    if (index < 0)
        return;
    m_tracker->switchProject(m_projectCombo->itemText(index));
}

// ── Stopwatch slots ───────────────────────────────────────────────────────────

void MainWindow::onToggleClicked()
{
    if (!m_tracker->hasProject()) {
        showWarning(tr("Type a project name and press Enter to create it."));
        return;
    }
    m_tracker->toggle();
}

void MainWindow::onResetClicked()
{
    if (!m_tracker->hasProject())
        return;

    auto reply = QMessageBox::question(
        this, tr("Reset Project"),
        tr("Reset the total for '%1' to zero?").arg(m_tracker->currentProject()),
        QMessageBox::Yes | QMessageBox::No);
    if (reply != QMessageBox::Yes) return;

    m_tracker->reset();
}

void MainWindow::onTotalChanged(double totalSeconds)
{
    m_runBtn->setText(TimeFormat::formatHms(m_tracker->sessionSeconds()));
    m_totalHoursLabel->setText(TimeFormat::formatHoursTenths(totalSeconds));
    m_totalHmsLabel->setText(TimeFormat::formatHms(totalSeconds));

    if (m_trayIcon && m_tracker->hasProject()) {
        m_trayIcon->setToolTip(tr("Project Timer - %1: %2 h")
                               .arg(m_tracker->currentProject(),
                                    TimeFormat::formatHoursMinutes(totalSeconds)));
    }
}

void MainWindow::onRunningChanged(bool running)
{
    setRunButtonStyle(running);
    m_trayToggleAction->setText(running ? tr("Stop") : tr("Start"));
    updateTitle();
}

void MainWindow::onProjectChanged(const QString& project)
{
    const int index = m_projectCombo->findText(project);
    if (index < 0)
        refreshProjectList();
    else
        m_projectCombo->setCurrentIndex(index);

    m_statusLabel->clear();
    updateTitle();

    QSettings settings("ProjectTimer", "ProjectTimer");
    AppConfig::saveLastProject(settings, project);
}

void MainWindow::onSaveFailed(const QString& message)
{
    showWarning(tr("Could not save project data: %1").arg(message));
}

// ── Countdown slots ───────────────────────────────────────────────────────────

void MainWindow::onPresetClicked(int seconds)
{
    m_countdownEdit->setTime(QTime(seconds / 3600, (seconds % 3600) / 60, seconds % 60));
}

void MainWindow::onCountdownStartClicked()
{
    const QTime t = m_countdownEdit->time();
    const int totalSeconds = t.hour() * 3600 + t.minute() * 60 + t.second();
    if (totalSeconds <= 0) {
        showWarning(tr("Please set a countdown greater than zero."));
        return;
    }
    setCountdownRunning(true);
    m_countdown->startCountdown(totalSeconds);
}

void MainWindow::onCountdownCancelClicked()
{
    m_countdown->stop();
    setCountdownRunning(false);
    m_countdownLabel->setText("--:--:--");
}

void MainWindow::onCountdownTick(int remainingSeconds)
{
    m_countdownLabel->setText(TimeFormat::formatHms(remainingSeconds));
}

void MainWindow::onCountdownTriggered()
{
    setCountdownRunning(false);
    m_countdownLabel->setText(TimeFormat::formatHms(0));
    qCInfo(lcApp) << "Countdown reached zero";

    QApplication::beep();
    m_flashCount = 0;
    m_flashTimer.start();

    QMessageBox::information(this, tr("Time's up!"), tr("Countdown has reached zero."));
}

void MainWindow::onFlashTitle()
{
    if (++m_flashCount > kFlashToggles) {
        m_flashTimer.stop();
        updateTitle();
        return;
    }
    if (m_flashCount % 2 == 1)
        setWindowTitle(kTimesUpTitle);
    else
        updateTitle();
}

// ── Menu bar slots ────────────────────────────────────────────────────────────

void MainWindow::onMenuExit()
{
    close();
}

void MainWindow::onMenuAbout()
{
    QMessageBox::about(
        this, tr("About Project Timer"),
        tr("Project Timer version %1\n\n"
           "Tracks the time spent on each project and keeps the totals in\n%2")
        .arg(QCoreApplication::applicationVersion(), m_store->filePath()));
}

// ── Tray slots ────────────────────────────────────────────────────────────────

void MainWindow::onTrayIconActivated(QSystemTrayIcon::ActivationReason reason)
{
    if (reason == QSystemTrayIcon::Trigger ||
        reason == QSystemTrayIcon::DoubleClick)
        onTrayShowHide();
}

void MainWindow::onTrayShowHide()
{
    if (isVisible()) {
        hide();
    } else {
        show();
        raise();
        activateWindow();
    }
}

void MainWindow::onTrayQuit()
{
    if (m_trayIcon)
        m_trayIcon->hide();
    qApp->quit();
}

// ── Close / quit ──────────────────────────────────────────────────────────────

void MainWindow::onAboutToQuit()
{
    // Runs for every exit path; shutdown() is idempotent.
    if (m_tracker)
        m_tracker->shutdown();

    QSettings settings("ProjectTimer", "ProjectTimer");
    AppConfig::saveWindowGeometry(settings, saveGeometry());
    if (m_tracker && m_tracker->hasProject())
        AppConfig::saveLastProject(settings, m_tracker->currentProject());
    qCInfo(lcApp) << "------------------------- Closed ------------------------";
}

void MainWindow::closeEvent(QCloseEvent* event)
{
    // Save now rather than waiting for aboutToQuit, in case the tray keeps
    // the process alive.
    m_tracker->shutdown();

    if (m_trayIcon)
        m_trayIcon->hide();
    event->accept();
}

// ── Helpers ───────────────────────────────────────────────────────────────────

void MainWindow::refreshProjectList()
{
    const QString current = m_tracker->currentProject();

    m_projectCombo->blockSignals(true);
    m_projectCombo->clear();
    m_projectCombo->addItems(m_tracker->projects());
    const int index = m_projectCombo->findText(current);
    if (index >= 0)
        m_projectCombo->setCurrentIndex(index);
    else
        m_projectCombo->setEditText(current);
    m_projectCombo->blockSignals(false);
}

void MainWindow::updateTitle()
{
    if (!m_tracker->hasProject()) {
        setWindowTitle(tr("No project selected"));
        return;
    }
    const QString project = m_tracker->currentProject();
    if (m_tracker->isRunning())
        setWindowTitle(tr("Working on '%1' - Session").arg(project));
    else
        setWindowTitle(tr("Working on '%1' (stopped)").arg(project));
}

void MainWindow::setRunButtonStyle(bool running)
{
    m_runBtn->setStyleSheet(running ? "color: darkgreen;" : "color: darkred;");
}

void MainWindow::setCountdownRunning(bool running)
{
    m_countdownStartBtn->setEnabled(!running);
    m_countdownCancelBtn->setEnabled(running);
    m_countdownEdit->setEnabled(!running);
    m_preset15m->setEnabled(!running);
    m_preset30m->setEnabled(!running);
    m_preset1h->setEnabled(!running);
    m_preset2h->setEnabled(!running);
}

void MainWindow::showWarning(const QString& msg)
{
    // Non-blocking: the timer keeps running while the warning is visible.
    qCWarning(lcApp).noquote() << msg;
    m_statusLabel->setStyleSheet("color: darkred;");
    m_statusLabel->setText(msg);
}
