#ifndef APPCONFIG_H
#define APPCONFIG_H

#include "ProcessHandle.h"

#include <QString>

/**
 * @brief Application configuration manager.
 *
 * Reads configuration from app.yaml and provides access to settings.
 * Anything missing from the file keeps its built-in default.
 */
class AppConfig
{
public:
    static AppConfig& instance();

    // Load configuration from file
    bool load(const QString &configPath = QString());

    // Restore built-in defaults
    void reset();

    // Backend process settings
    QString backendProgram() const { return m_backendProgram; }
    QString backendModule() const { return m_backendModule; }
    QString backendApp() const { return m_backendApp; }
    QString backendHost() const { return m_backendHost; }
    int backendPort() const { return m_backendPort; }
    QString backendWorkingDir() const { return m_backendWorkingDir; }
    bool autostartBackend() const { return m_autostartBackend; }

    // Command line built from the settings above
    BackendCommand backendCommand() const;

    // Backend HTTP settings. Derived from host and port unless set explicitly.
    QString backendBaseUrl() const;

private:
    AppConfig();
    ~AppConfig() = default;
    AppConfig(const AppConfig&) = delete;
    AppConfig& operator=(const AppConfig&) = delete;

    // Backend process
    QString m_backendProgram;
    QString m_backendModule;
    QString m_backendApp;
    QString m_backendHost;
    int m_backendPort;
    QString m_backendWorkingDir;
    bool m_autostartBackend;

    // Backend HTTP
    QString m_backendBaseUrl;
};

#endif // APPCONFIG_H
