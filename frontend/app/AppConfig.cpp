#include "AppConfig.h"
#include <QFile>
#include <QDir>
#include <QCoreApplication>
#include <QDebug>

// Simple YAML parsing for our limited use case: flat sections of key: value

AppConfig& AppConfig::instance()
{
    static AppConfig instance;
    return instance;
}

AppConfig::AppConfig()
{
    reset();
}

void AppConfig::reset()
{
    m_backendProgram = "python";
    m_backendModule = "uvicorn";
    m_backendApp = "app.main:app";
    m_backendHost = "127.0.0.1";
    m_backendPort = 8000;
    m_backendWorkingDir = "../backend";
    m_autostartBackend = true;
    m_backendBaseUrl.clear();
}

bool AppConfig::load(const QString &configPath)
{
    QString path = configPath;
    if (path.isEmpty()) {
        // Default config location: ../config/app.yaml relative to executable
        QDir appDir(QCoreApplication::applicationDirPath());
        appDir.cdUp();
        path = appDir.filePath("config/app.yaml");
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "Could not open config file:" << path;
        qWarning() << "Using default configuration.";
        return false;
    }

    // Simple line-by-line YAML parsing
    QString currentSection;
    while (!file.atEnd()) {
        QString rawLine = QString::fromUtf8(file.readLine());
        QString line = rawLine.trimmed();

        // Skip comments and empty lines
        if (line.isEmpty() || line.startsWith('#'))
            continue;

        // Check for section (no leading spaces, ends with :)
        if (!rawLine.startsWith(' ') && line.endsWith(':') && !line.contains('"')) {
            currentSection = line.left(line.length() - 1);
            continue;
        }

        // Parse key: value
        int colonPos = line.indexOf(':');
        if (colonPos <= 0)
            continue;

        QString key = line.left(colonPos).trimmed();
        QString value = line.mid(colonPos + 1).trimmed();

        // Remove quotes if present
        if (value.length() >= 2 && value.startsWith('"') && value.endsWith('"')) {
            value = value.mid(1, value.length() - 2);
        }

        // Apply to configuration
        if (currentSection == "backend") {
            if (key == "program") m_backendProgram = value;
            else if (key == "module") m_backendModule = value;
            else if (key == "app") m_backendApp = value;
            else if (key == "host") m_backendHost = value;
            else if (key == "working_dir") m_backendWorkingDir = value;
            else if (key == "base_url") m_backendBaseUrl = value;
            else if (key == "autostart") m_autostartBackend = (value == "true");
            else if (key == "port") {
                bool ok = false;
                int port = value.toInt(&ok);
                if (ok && port > 0 && port <= 65535) {
                    m_backendPort = port;
                } else {
                    qWarning() << "Ignoring invalid backend port:" << value;
                }
            }
        }
    }

    file.close();
    qDebug() << "Configuration loaded from:" << path;
    return true;
}

BackendCommand AppConfig::backendCommand() const
{
    BackendCommand command;
    command.program = m_backendProgram;
    command.arguments << "-m" << m_backendModule << m_backendApp
                      << "--port" << QString::number(m_backendPort)
                      << "--host" << m_backendHost;
    command.workingDirectory = m_backendWorkingDir;
    return command;
}

QString AppConfig::backendBaseUrl() const
{
    if (!m_backendBaseUrl.isEmpty()) {
        return m_backendBaseUrl;
    }
    return QString("http://%1:%2").arg(m_backendHost).arg(m_backendPort);
}
