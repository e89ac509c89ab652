#include "mainwindow.h"
#include "app/AppBootstrapper.h"
#include "app/AppConfig.h"
#include "app/CommandRegistry.h"
#include "app/Logging.h"
#include "app/SidecarLauncher.h"
#include "app/UiNotifier.h"

#include <QApplication>
#include <QProcessEnvironment>

int main(int argc, char *argv[])
{
    qSetMessagePattern("%{time yyyy-MM-dd hh:mm:ss.zzz} [%{type}] %{category}: %{message}");

    QApplication a(argc, argv);
    AppConfig::applyApplicationIdentity();

    AppConfig config;
    config.load();

    QString error;
    if (!config.resolve(QProcessEnvironment::systemEnvironment(), &error)) {
        qFatal("failed to resolve data directory: %s", qPrintable(error));
    }

    QString sidecarPath;
    if (!SidecarLauncher::resolveExecutable(SidecarLauncher::defaultSearchDirs(),
                                            &sidecarPath, &error)) {
        qFatal("failed to setup sidecar: %s", qPrintable(error));
    }

    CommandRegistry commands;
    registerBuiltinCommands(commands);

    MainWindow w(&commands, config.dataDir());
    w.show();

    UiNotifier notifier;
    AppBootstrapper bootstrapper(config, &notifier);
    QObject::connect(&a, &QCoreApplication::aboutToQuit,
                     &bootstrapper, &AppBootstrapper::shutdown);
    bootstrapper.start(sidecarPath);

    return a.exec();
}
