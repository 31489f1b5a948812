#include "mainwindow.h"
#include "app/AppConfig.h"
#include "app/CommandRegistry.h"
#include "app/ProcessSupervisor.h"

#include <QApplication>

int main(int argc, char *argv[])
{
    qSetMessagePattern("[Lazy Learn] %{if-warning}WARNING: %{endif}%{message}");

    QApplication a(argc, argv);
    a.setApplicationName("Lazy Learn");

    AppConfig::instance().load();

    // Start backend before the window exists so the close event can
    // never run ahead of the launch
    ProcessSupervisor supervisor(AppConfig::instance().backendCommand());
    if (AppConfig::instance().autostartBackend()) {
        supervisor.storeHandle(supervisor.launchBackend());
    } else {
        qInfo().noquote() << "Backend autostart disabled. Start it manually.";
    }

    CommandRegistry commands = CommandRegistry::withDefaultCommands();

    MainWindow w(supervisor, commands);
    w.show();
    return a.exec();
}
