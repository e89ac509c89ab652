#ifndef APPBOOTSTRAPPER_H
#define APPBOOTSTRAPPER_H

#include "AppConfig.h"

#include <QObject>

class BackendClient;
class SidecarLauncher;
class UiNotifier;

/**
 * @brief Startup wiring between the sidecar, its readiness probe and the UI.
 *
 * Each time the sidecar process starts, the backend is probed; once it
 * answers, "backend-ready" with the port is sent to the main window.
 * Probe timeouts, spawn failures and supervision giving up are sent as
 * "backend-unavailable" with a reason.
 */
class AppBootstrapper : public QObject
{
    Q_OBJECT

public:
    // notifier must outlive the bootstrapper
    AppBootstrapper(const AppConfig &config, UiNotifier *notifier,
                    QObject *parent = nullptr);
    ~AppBootstrapper() override;

    void start(const QString &executablePath);
    void shutdown();

    const AppConfig &config() const { return m_config; }
    SidecarLauncher *launcher() const { return m_launcher; }
    BackendClient *backendClient() const { return m_backendClient; }
    bool isBackendReady() const { return m_backendReady; }

signals:
    void backendReady(const QString &port);
    void backendUnavailable(const QString &reason);

private slots:
    void onSidecarStarted();
    void onBackendReady();
    void onBackendUnavailable(const QString &reason);

private:
    AppConfig m_config;
    UiNotifier *m_notifier;
    SidecarLauncher *m_launcher;
    BackendClient *m_backendClient;
    bool m_backendReady = false;
};

#endif // APPBOOTSTRAPPER_H
