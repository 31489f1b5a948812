#ifndef BACKENDCLIENT_H
#define BACKENDCLIENT_H

#include <QObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QJsonObject>

/**
 * @brief Health check result.
 */
struct HealthCheckResult {
    bool success = false;
    QString errorMessage;
    QString status;
};

/**
 * @brief Client for the backend server's HTTP API.
 *
 * Only used to tell the user whether the backend is reachable. It never
 * starts, stops or restarts the backend process.
 */
class BackendClient : public QObject
{
    Q_OBJECT

public:
    explicit BackendClient(QObject *parent = nullptr);
    explicit BackendClient(const QString &baseUrl, QObject *parent = nullptr);

    void setBaseUrl(const QString &url);
    QString baseUrl() const { return m_baseUrl; }

    void setTimeout(int msecs) { m_timeoutMs = msecs; }
    int timeout() const { return m_timeoutMs; }

    // API methods
    void healthCheck();

signals:
    void healthCheckCompleted(const HealthCheckResult &result);

private slots:
    void handleHealthReply();

private:
    QNetworkRequest createRequest(const QString &endpoint) const;
    QJsonObject parseResponse(QNetworkReply *reply, bool &ok, QString &errorMsg);

    QNetworkAccessManager *m_networkManager;
    QString m_baseUrl;
    int m_timeoutMs;
};

#endif // BACKENDCLIENT_H
