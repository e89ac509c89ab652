#ifndef SIDECARLAUNCHER_H
#define SIDECARLAUNCHER_H

#include "AppConfig.h"

#include <QObject>
#include <QMap>
#include <QProcess>
#include <QStringList>
#include <QTimer>
#include <memory>

/**
 * @brief Starts and supervises the bundled backend executable.
 *
 * The process is started asynchronously on the event loop. Abnormal exits
 * are restarted with exponential backoff until maxRestarts crashes happen
 * inside restartWindowSeconds, after which the launcher gives up. stop()
 * terminates the child and is called on destruction.
 */
class SidecarLauncher : public QObject
{
    Q_OBJECT

public:
    enum class State {
        NotStarted,
        Starting,
        Running,
        Backoff,
        Stopped,
        GivingUp,
    };

    explicit SidecarLauncher(const AppConfig &config, QObject *parent = nullptr);
    ~SidecarLauncher() override;

    // "lca-backend.exe" on Windows, "lca-backend" elsewhere
    static QString executableName();

    // PORT, DATA_DIR and STOCKFISH_PATH (only when set)
    static QMap<QString, QString> buildEnvironment(const AppConfig &config);

    // Application directory, then its backend/ subdirectory
    static QStringList defaultSearchDirs();

    static bool resolveExecutable(const QStringList &searchDirs,
                                  QString *executablePath,
                                  QString *error = nullptr);

    void start(const QString &executablePath);
    void stop();

    State state() const { return m_state; }
    static QString stateToString(State state);

    QString executablePath() const { return m_executablePath; }
    qint64 processId() const;
    int crashCount() const { return m_crashCount; }

signals:
    void started(qint64 pid);
    void startFailed(const QString &reason);
    void crashed(int exitCode, int crashCount, bool willRestart);
    void exited(int exitCode);
    void gaveUp(const QString &reason);
    void stateChanged(const QString &state);

private slots:
    void onStarted();
    void onErrorOccurred(QProcess::ProcessError error);
    void onFinished(int exitCode, QProcess::ExitStatus status);

private:
    static constexpr int kInitialRestartDelayMs = 500;
    static constexpr int kMaxRestartDelayMs = 30000;

    void launch();
    int restartDelayMs(int crashCount) const;
    void transitionState(State nextState);

    AppConfig m_config;
    QString m_executablePath;
    std::unique_ptr<QProcess> m_process;
    QTimer *m_restartTimer;
    State m_state = State::NotStarted;
    bool m_stopping = false;

    int m_crashCount = 0;
    qint64 m_firstCrashTime = 0;
};

#endif // SIDECARLAUNCHER_H
