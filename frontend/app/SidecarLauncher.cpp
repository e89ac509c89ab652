#include "SidecarLauncher.h"
#include "Logging.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QProcessEnvironment>

SidecarLauncher::SidecarLauncher(const AppConfig &config, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_restartTimer(new QTimer(this))
{
    m_restartTimer->setSingleShot(true);
    connect(m_restartTimer, &QTimer::timeout, this, [this]() {
        if (!m_stopping)
            launch();
    });
}

SidecarLauncher::~SidecarLauncher()
{
    stop();
}

QString SidecarLauncher::executableName()
{
#ifdef Q_OS_WIN
    return QStringLiteral("lca-backend.exe");
#else
    return QStringLiteral("lca-backend");
#endif
}

QMap<QString, QString> SidecarLauncher::buildEnvironment(const AppConfig &config)
{
    QMap<QString, QString> envs;
    envs.insert("PORT", config.port());
    envs.insert("DATA_DIR", config.dataDir());
    if (config.hasStockfishPath())
        envs.insert("STOCKFISH_PATH", config.stockfishPath());
    return envs;
}

QStringList SidecarLauncher::defaultSearchDirs()
{
    const QString appDir = QCoreApplication::applicationDirPath();
    return { appDir, appDir + "/backend" };
}

bool SidecarLauncher::resolveExecutable(const QStringList &searchDirs,
                                        QString *executablePath,
                                        QString *error)
{
    const QString name = executableName();
    for (const QString &dir : searchDirs) {
        QFileInfo candidate(QDir(dir).filePath(name));
        if (candidate.isFile() && candidate.isExecutable()) {
            if (executablePath)
                *executablePath = candidate.absoluteFilePath();
            return true;
        }
    }

    if (error) {
        *error = QString("Sidecar %1 not found in: %2")
                     .arg(name, searchDirs.join(", "));
    }
    return false;
}

QString SidecarLauncher::stateToString(State state)
{
    switch (state) {
    case State::NotStarted:
        return QStringLiteral("not_started");
    case State::Starting:
        return QStringLiteral("starting");
    case State::Running:
        return QStringLiteral("running");
    case State::Backoff:
        return QStringLiteral("backoff");
    case State::Stopped:
        return QStringLiteral("stopped");
    case State::GivingUp:
        return QStringLiteral("giving_up");
    }
    return QStringLiteral("unknown");
}

void SidecarLauncher::transitionState(State nextState)
{
    if (m_state == nextState)
        return;
    m_state = nextState;
    emit stateChanged(stateToString(nextState));
}

qint64 SidecarLauncher::processId() const
{
    if (!m_process || m_process->state() == QProcess::NotRunning)
        return 0;
    return m_process->processId();
}

int SidecarLauncher::restartDelayMs(int crashCount) const
{
    int delay = kInitialRestartDelayMs;
    for (int i = 1; i < crashCount && delay < kMaxRestartDelayMs; ++i)
        delay *= 2;
    return qMin(delay, kMaxRestartDelayMs);
}

// ============================================================================
// Start / Stop
// ============================================================================

void SidecarLauncher::start(const QString &executablePath)
{
    if (m_process && m_process->state() != QProcess::NotRunning) {
        qCWarning(lcaSidecar) << "Sidecar already running, ignoring start request";
        return;
    }

    // A pending restart would replace the process started here
    m_restartTimer->stop();

    m_executablePath = executablePath;
    m_stopping = false;
    m_crashCount = 0;
    m_firstCrashTime = 0;
    launch();
}

void SidecarLauncher::launch()
{
    transitionState(State::Starting);

    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    const QMap<QString, QString> overlay = buildEnvironment(m_config);
    for (auto it = overlay.constBegin(); it != overlay.constEnd(); ++it)
        env.insert(it.key(), it.value());

    if (m_process)
        m_process->disconnect(this);
    m_process = std::make_unique<QProcess>();
    m_process->setProgram(m_executablePath);
    m_process->setProcessEnvironment(env);
    m_process->setWorkingDirectory(QFileInfo(m_executablePath).absolutePath());
    m_process->setProcessChannelMode(QProcess::ForwardedChannels);

    connect(m_process.get(), &QProcess::started, this, &SidecarLauncher::onStarted);
    connect(m_process.get(), &QProcess::errorOccurred, this, &SidecarLauncher::onErrorOccurred);
    connect(m_process.get(),
            qOverload<int, QProcess::ExitStatus>(&QProcess::finished),
            this, &SidecarLauncher::onFinished);

    qCInfo(lcaSidecar) << "Starting sidecar" << m_executablePath
                       << "PORT=" << m_config.port() << "DATA_DIR=" << m_config.dataDir();
    m_process->start();
}

void SidecarLauncher::stop()
{
    m_restartTimer->stop();
    if (!m_process) {
        if (m_state != State::NotStarted)
            transitionState(State::Stopped);
        return;
    }

    m_stopping = true;
    if (m_process->state() != QProcess::NotRunning) {
        qCInfo(lcaSidecar) << "Stopping sidecar (pid" << m_process->processId() << ")";
        m_process->terminate();
        if (!m_process->waitForFinished(m_config.shutdownTimeoutMs())) {
            qCWarning(lcaSidecar) << "Sidecar did not exit gracefully, killing";
            m_process->kill();
            m_process->waitForFinished(1000);
        }
    }

    // Drop late signals from the old process
    m_process->disconnect(this);
    m_process.reset();
    m_stopping = false;
    transitionState(State::Stopped);
}

// ============================================================================
// Process Signals
// ============================================================================

void SidecarLauncher::onStarted()
{
    const qint64 pid = m_process ? m_process->processId() : 0;
    qCInfo(lcaSidecar) << "Sidecar started (pid" << pid << ")";
    transitionState(State::Running);
    emit started(pid);
}

void SidecarLauncher::onErrorOccurred(QProcess::ProcessError error)
{
    if (!m_process)
        return;

    if (error != QProcess::FailedToStart) {
        // Crashes are handled by onFinished()
        qCDebug(lcaSidecar) << "Sidecar process error" << error << m_process->errorString();
        return;
    }

    const QString reason = QString("Failed to start %1: %2")
                               .arg(m_executablePath, m_process->errorString());
    qCCritical(lcaSidecar) << reason;
    transitionState(State::Stopped);
    emit startFailed(reason);
}

void SidecarLauncher::onFinished(int exitCode, QProcess::ExitStatus status)
{
    if (m_stopping) {
        transitionState(State::Stopped);
        return;
    }

    if (status == QProcess::NormalExit && exitCode == 0) {
        qCInfo(lcaSidecar) << "Sidecar exited normally";
        transitionState(State::Stopped);
        emit exited(exitCode);
        return;
    }

    const qint64 now = QDateTime::currentSecsSinceEpoch();
    if (m_crashCount == 0 || now - m_firstCrashTime > m_config.restartWindowSeconds()) {
        m_crashCount = 0;
        m_firstCrashTime = now;
    }
    ++m_crashCount;

    qCWarning(lcaSidecar) << "Sidecar crashed (exit" << exitCode << ", crashes"
                          << m_crashCount << "/" << m_config.maxRestarts() << "in window)";

    const bool willRestart = m_crashCount <= m_config.maxRestarts();
    emit crashed(exitCode, m_crashCount, willRestart);

    if (!willRestart) {
        const QString reason = QString("Backend crashed %1 times in %2s")
                                   .arg(m_crashCount)
                                   .arg(m_config.restartWindowSeconds());
        qCCritical(lcaSidecar) << reason << "- giving up";
        transitionState(State::GivingUp);
        emit gaveUp(reason);
        return;
    }

    const int delay = restartDelayMs(m_crashCount);
    qCInfo(lcaSidecar) << "Restarting sidecar in" << delay << "ms";
    transitionState(State::Backoff);
    m_restartTimer->start(delay);
}
