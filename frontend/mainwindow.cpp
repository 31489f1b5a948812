#include "mainwindow.h"
#include "ui_mainwindow.h"
#include "app/AppConfig.h"
#include "app/BackendClient.h"
#include "app/CommandRegistry.h"
#include "app/ProcessSupervisor.h"

#include <QMessageBox>
#include <QCloseEvent>
#include <QStatusBar>
#include <QJsonObject>

MainWindow::MainWindow(ProcessSupervisor &supervisor,
                       const CommandRegistry &commands,
                       QWidget *parent)
    : QMainWindow(parent)
    , ui(new Ui::MainWindow)
    , m_supervisor(supervisor)
    , m_commands(commands)
    , m_backendClient(new BackendClient(AppConfig::instance().backendBaseUrl(), this))
{
    ui->setupUi(this);

    setupConnections();

    // Setup status bar labels
    m_backendStatusLabel = new QLabel(tr("Backend: Checking..."));
    m_backendPidLabel = new QLabel;
    statusBar()->addWidget(m_backendStatusLabel);
    statusBar()->addPermanentWidget(m_backendPidLabel);

    qint64 pid = m_supervisor.backendProcessId();
    if (pid > 0) {
        m_backendPidLabel->setText(tr("PID: %1").arg(pid));
    } else {
        m_backendPidLabel->setText(tr("Not launched"));
    }

    // Check backend health
    m_backendClient->healthCheck();
}

MainWindow::~MainWindow()
{
    delete ui;
}

void MainWindow::setupConnections()
{
    connect(ui->actionCheckBackend, &QAction::triggered, this, &MainWindow::checkBackend);
    connect(ui->actionAbout, &QAction::triggered, this, &MainWindow::showAbout);

    connect(ui->btnGreet, &QPushButton::clicked, this, &MainWindow::greet);
    connect(ui->nameEdit, &QLineEdit::returnPressed, this, &MainWindow::greet);

    connect(m_backendClient, &BackendClient::healthCheckCompleted, this, &MainWindow::onHealthCheckCompleted);
}

// ============================================================================
// Commands
// ============================================================================

void MainWindow::greet()
{
    QJsonObject args;
    args["name"] = ui->nameEdit->text();

    CommandResult result = m_commands.invoke("greet", args);
    if (!result.success) {
        showError(tr("Command Error"), result.errorMessage);
        return;
    }
    ui->lblGreeting->setText(result.value.toString());
}

// ============================================================================
// Backend Status
// ============================================================================

void MainWindow::checkBackend()
{
    m_backendStatusLabel->setText(tr("Backend: Checking..."));
    m_backendStatusLabel->setStyleSheet(QString());
    m_backendClient->healthCheck();
}

void MainWindow::onHealthCheckCompleted(const HealthCheckResult &result)
{
    if (result.success) {
        m_backendStatusLabel->setText(tr("Backend: Online"));
        m_backendStatusLabel->setStyleSheet("color: green;");
    } else {
        m_backendStatusLabel->setText(tr("Backend: Offline"));
        m_backendStatusLabel->setStyleSheet("color: red;");
        m_backendStatusLabel->setToolTip(result.errorMessage);
    }
}

// ============================================================================
// About Dialog
// ============================================================================

void MainWindow::showAbout()
{
    QMessageBox::about(this, tr("About Lazy Learn"),
        tr("<h2>Lazy Learn</h2>"
           "<p>Desktop shell for the Lazy Learn backend.</p>"
           "<p>Backend: %1</p>"
           "<p>Command: <code>%2</code></p>")
            .arg(AppConfig::instance().backendBaseUrl().toHtmlEscaped(),
                 m_supervisor.command().toString().toHtmlEscaped()));
}

void MainWindow::showError(const QString &title, const QString &message)
{
    QMessageBox::critical(this, title, message);
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    // Kill backend when window closes
    m_supervisor.terminateOnClose();
    m_backendPidLabel->setText(tr("Not running"));
    event->accept();
}
