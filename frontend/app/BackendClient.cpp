#include "BackendClient.h"
#include <QJsonDocument>
#include <QTimer>
#include <QDebug>

BackendClient::BackendClient(QObject *parent)
    : QObject(parent)
    , m_networkManager(new QNetworkAccessManager(this))
    , m_baseUrl("http://127.0.0.1:8000")
    , m_timeoutMs(2000)
{
}

BackendClient::BackendClient(const QString &baseUrl, QObject *parent)
    : QObject(parent)
    , m_networkManager(new QNetworkAccessManager(this))
    , m_baseUrl(baseUrl)
    , m_timeoutMs(2000)
{
}

void BackendClient::setBaseUrl(const QString &url)
{
    m_baseUrl = url;
}

QNetworkRequest BackendClient::createRequest(const QString &endpoint) const
{
    QUrl url(m_baseUrl + endpoint);
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    request.setRawHeader("Accept", "application/json");
    return request;
}

QJsonObject BackendClient::parseResponse(QNetworkReply *reply, bool &ok, QString &errorMsg)
{
    ok = false;

    if (reply->error() != QNetworkReply::NoError) {
        errorMsg = reply->errorString();
        return QJsonObject();
    }

    QByteArray data = reply->readAll();
    QJsonDocument doc = QJsonDocument::fromJson(data);

    if (!doc.isObject()) {
        errorMsg = "Invalid JSON response";
        return QJsonObject();
    }

    ok = true;
    return doc.object();
}

// ============================================================================
// Health Check
// ============================================================================

void BackendClient::healthCheck()
{
    QNetworkRequest request = createRequest("/health");
    QNetworkReply *reply = m_networkManager->get(request);
    connect(reply, &QNetworkReply::finished, this, &BackendClient::handleHealthReply);

    // Abort if the backend does not answer in time; finished() still fires
    QTimer::singleShot(m_timeoutMs, reply, [reply]() {
        if (reply->isRunning()) {
            reply->abort();
        }
    });
}

void BackendClient::handleHealthReply()
{
    QNetworkReply *reply = qobject_cast<QNetworkReply*>(sender());
    if (!reply) return;
    reply->deleteLater();

    HealthCheckResult result;
    bool ok;
    QString errorMsg;

    QJsonObject json = parseResponse(reply, ok, errorMsg);

    if (!ok) {
        qDebug() << "Backend health check failed:" << errorMsg;
        result.errorMessage = errorMsg;
        emit healthCheckCompleted(result);
        return;
    }

    result.status = json["status"].toString();
    if (result.status != "ok") {
        result.errorMessage = QString("Unexpected backend status: %1").arg(result.status);
        emit healthCheckCompleted(result);
        return;
    }

    result.success = true;
    emit healthCheckCompleted(result);
}
