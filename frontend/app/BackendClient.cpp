#include "BackendClient.h"
#include "Logging.h"

#include <QNetworkProxy>
#include <QUrl>

BackendClient::BackendClient(const QString &baseUrl, QObject *parent)
    : QObject(parent)
    , m_networkManager(new QNetworkAccessManager(this))
    , m_baseUrl(baseUrl)
    , m_healthPath("/")
    , m_retryTimer(new QTimer(this))
    , m_attemptTimer(new QTimer(this))
{
    // The sidecar listens on loopback; never route through a system proxy
    m_networkManager->setProxy(QNetworkProxy::NoProxy);

    m_retryTimer->setSingleShot(true);
    m_attemptTimer->setSingleShot(true);
    connect(m_retryTimer, &QTimer::timeout, this, &BackendClient::probeOnce);
    connect(m_attemptTimer, &QTimer::timeout, this, [this]() {
        if (m_probeReply)
            m_probeReply->abort();
    });
}

BackendClient::~BackendClient()
{
    cancel();
}

QNetworkRequest BackendClient::createRequest(const QString &endpoint) const
{
    QUrl url(m_baseUrl + endpoint);
    QNetworkRequest request(url);
    request.setRawHeader("Accept", "application/json");
    return request;
}

HealthCheckResult BackendClient::parseHealthReply(QNetworkReply *reply) const
{
    HealthCheckResult result;

    // Any HTTP status means the server is accepting connections
    const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (status.isValid()) {
        result.success = true;
        result.httpStatus = status.toInt();
        return result;
    }

    result.errorMessage = reply->errorString();
    return result;
}

// ============================================================================
// Readiness Probe
// ============================================================================

void BackendClient::waitUntilReady(int timeoutMs, int intervalMs)
{
    cancel();

    m_probing = true;
    m_timeoutMs = qMax(0, timeoutMs);
    m_intervalMs = qMax(1, intervalMs);
    m_attempts = 0;
    m_elapsed.start();

    qCInfo(lcaBackend) << "Waiting for backend at" << m_baseUrl + m_healthPath
                       << "timeout" << m_timeoutMs << "ms";
    probeOnce();
}

void BackendClient::cancel()
{
    m_probing = false;
    m_retryTimer->stop();
    m_attemptTimer->stop();

    if (m_probeReply) {
        QNetworkReply *reply = m_probeReply;
        m_probeReply.clear();
        reply->disconnect(this);
        reply->abort();
        reply->deleteLater();
    }
}

void BackendClient::probeOnce()
{
    if (!m_probing)
        return;

    ++m_attempts;
    QNetworkReply *reply = m_networkManager->get(createRequest(m_healthPath));
    m_probeReply = reply;

    const int remaining = m_timeoutMs - static_cast<int>(m_elapsed.elapsed());
    m_attemptTimer->start(qBound(1, remaining, kMaxAttemptTimeoutMs));

    connect(reply, &QNetworkReply::finished, this, [this, reply]() {
        reply->deleteLater();
        if (reply != m_probeReply)
            return;
        m_probeReply.clear();
        m_attemptTimer->stop();
        finishProbe(parseHealthReply(reply));
    });
}

void BackendClient::finishProbe(const HealthCheckResult &result)
{
    if (!m_probing)
        return;

    if (result.success) {
        m_probing = false;
        qCInfo(lcaBackend) << "Backend answered with HTTP" << result.httpStatus
                           << "after" << m_attempts << "attempt(s)";
        emit ready();
        return;
    }

    if (m_elapsed.elapsed() + m_intervalMs > m_timeoutMs) {
        m_probing = false;
        qCWarning(lcaBackend) << "Backend not reachable after" << m_elapsed.elapsed()
                              << "ms:" << result.errorMessage;
        emit readyTimedOut(result.errorMessage);
        return;
    }

    qCDebug(lcaBackend) << "Probe attempt" << m_attempts << "failed:" << result.errorMessage;
    m_retryTimer->start(m_intervalMs);
}
