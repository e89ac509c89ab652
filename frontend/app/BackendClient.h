#ifndef BACKENDCLIENT_H
#define BACKENDCLIENT_H

#include <QObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QElapsedTimer>
#include <QPointer>
#include <QTimer>

/**
 * @brief Health check result.
 *
 * success means the backend answered with any HTTP status; httpStatus is 0
 * when no HTTP response was received.
 */
struct HealthCheckResult {
    bool success = false;
    QString errorMessage;
    int httpStatus = 0;
};

/**
 * @brief Client for probing the backend sidecar over HTTP.
 *
 * waitUntilReady() repeats a GET on the health path every intervalMs until
 * the backend answers or timeoutMs elapses.
 */
class BackendClient : public QObject
{
    Q_OBJECT

public:
    explicit BackendClient(const QString &baseUrl, QObject *parent = nullptr);
    ~BackendClient() override;

    QString baseUrl() const { return m_baseUrl; }

    void setHealthPath(const QString &path) { m_healthPath = path; }
    QString healthPath() const { return m_healthPath; }

    void waitUntilReady(int timeoutMs, int intervalMs);
    void cancel();
    bool isProbing() const { return m_probing; }
    int attempts() const { return m_attempts; }

signals:
    void ready();
    void readyTimedOut(const QString &lastError);

private slots:
    void probeOnce();

private:
    static constexpr int kMaxAttemptTimeoutMs = 2000;

    QNetworkRequest createRequest(const QString &endpoint) const;
    HealthCheckResult parseHealthReply(QNetworkReply *reply) const;
    void finishProbe(const HealthCheckResult &result);

    QNetworkAccessManager *m_networkManager;
    QString m_baseUrl;
    QString m_healthPath;

    // Readiness probe state
    QTimer *m_retryTimer;
    QTimer *m_attemptTimer;
    QPointer<QNetworkReply> m_probeReply;
    QElapsedTimer m_elapsed;
    bool m_probing = false;
    int m_timeoutMs = 0;
    int m_intervalMs = 0;
    int m_attempts = 0;
};

#endif // BACKENDCLIENT_H
