#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QLabel>

QT_BEGIN_NAMESPACE
namespace Ui { class MainWindow; }
QT_END_NAMESPACE

class BackendClient;
class CommandRegistry;
class ProcessSupervisor;

struct HealthCheckResult;

/**
 * @brief Main application window for Lazy Learn.
 *
 * Calls frontend commands through the registry and shows whether the
 * backend is up. Closing the window kills the backend process.
 */
class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    MainWindow(ProcessSupervisor &supervisor,
               const CommandRegistry &commands,
               QWidget *parent = nullptr);
    ~MainWindow();

private slots:
    void greet();
    void checkBackend();
    void onHealthCheckCompleted(const HealthCheckResult &result);
    void showAbout();

private:
    void setupConnections();
    void showError(const QString &title, const QString &message);
    void closeEvent(QCloseEvent *event) override;

private:
    Ui::MainWindow *ui;

    ProcessSupervisor &m_supervisor;
    const CommandRegistry &m_commands;

    BackendClient *m_backendClient;

    // Status bar labels
    QLabel *m_backendStatusLabel;
    QLabel *m_backendPidLabel;
};

#endif // MAINWINDOW_H
