#include "AppBootstrapper.h"
#include "BackendClient.h"
#include "Logging.h"
#include "SidecarLauncher.h"
#include "UiNotifier.h"

AppBootstrapper::AppBootstrapper(const AppConfig &config, UiNotifier *notifier,
                                 QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_notifier(notifier)
    , m_launcher(new SidecarLauncher(config, this))
    , m_backendClient(new BackendClient(config.backendBaseUrl(), this))
{
    m_backendClient->setHealthPath(config.healthPath());

    connect(m_launcher, &SidecarLauncher::started, this, &AppBootstrapper::onSidecarStarted);
    connect(m_launcher, &SidecarLauncher::startFailed, this, &AppBootstrapper::onBackendUnavailable);
    connect(m_launcher, &SidecarLauncher::gaveUp, this, &AppBootstrapper::onBackendUnavailable);
    connect(m_launcher, &SidecarLauncher::exited, this, [this](int exitCode) {
        m_backendClient->cancel();
        onBackendUnavailable(QString("Backend exited with code %1").arg(exitCode));
    });
    connect(m_launcher, &SidecarLauncher::crashed, this,
            [this](int exitCode, int, bool willRestart) {
        m_backendClient->cancel();
        // Without a restart, gaveUp() reports the failure
        if (m_backendReady && willRestart) {
            onBackendUnavailable(QString("Backend crashed with code %1, restarting")
                                     .arg(exitCode));
        }
    });

    connect(m_backendClient, &BackendClient::ready, this, &AppBootstrapper::onBackendReady);
    connect(m_backendClient, &BackendClient::readyTimedOut, this, [this](const QString &error) {
        onBackendUnavailable(QString("Backend did not respond on port %1: %2")
                                 .arg(m_config.port(), error));
    });
}

AppBootstrapper::~AppBootstrapper()
{
    shutdown();
}

void AppBootstrapper::start(const QString &executablePath)
{
    m_backendReady = false;
    m_launcher->start(executablePath);
}

void AppBootstrapper::shutdown()
{
    m_backendClient->cancel();
    m_launcher->stop();
    m_backendReady = false;
}

void AppBootstrapper::onSidecarStarted()
{
    m_backendClient->waitUntilReady(m_config.readyTimeoutMs(), m_config.probeIntervalMs());
}

void AppBootstrapper::onBackendReady()
{
    m_backendReady = true;
    qCInfo(lcaApp) << "Backend ready on port" << m_config.port();
    emit backendReady(m_config.port());

    if (m_notifier) {
        m_notifier->emitTo(UiNotifier::kMainWindowId, UiEvents::BackendReady,
                           m_config.port());
    }
}

void AppBootstrapper::onBackendUnavailable(const QString &reason)
{
    m_backendReady = false;
    qCWarning(lcaApp) << "Backend unavailable:" << reason;
    emit backendUnavailable(reason);

    if (m_notifier) {
        m_notifier->emitTo(UiNotifier::kMainWindowId, UiEvents::BackendUnavailable,
                           reason);
    }
}
