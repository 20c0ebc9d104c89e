#include <QApplication>
#include <QCoreApplication>
#include <QSettings>
#include <QTimer>

#include "AppConfig.h"
#include "Logging.h"
#include "MainWindow.h"

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    app.setApplicationName("ProjectTimer");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("ProjectTimer");

    // Data and log files live beside the executable unless QSettings says
    // otherwise.
    QSettings settings("ProjectTimer", "ProjectTimer");
    const AppConfig config =
        AppConfig::load(settings, QCoreApplication::applicationDirPath());

    Logging::install(config.sessionLogPath, config.errorLogPath);
    qCInfo(lcApp) << "----------------- Project Timer Launched ----------------";
    qCInfo(lcApp).noquote() << "Project data:" << config.dataFilePath;

    int rc = 0;
    {
        MainWindow window(config);
        window.show();

        // The tray icon only registers reliably once the event loop runs.
        QTimer::singleShot(0, &window, &MainWindow::showTrayIcon);

        rc = app.exec();
    }

    Logging::uninstall();
    return rc;
}
