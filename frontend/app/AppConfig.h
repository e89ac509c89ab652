#ifndef APPCONFIG_H
#define APPCONFIG_H

#include <QString>
#include <QProcessEnvironment>

/**
 * @brief Runtime configuration of the desktop shell.
 *
 * Port and data directory come from the process environment; supervision
 * tuning comes from app.yaml. Built once at startup and passed by value to
 * the components that need it.
 */
class AppConfig
{
public:
    static constexpr const char *kDefaultPort = "42069";
    static constexpr const char *kAppFolder = "LocalChessAnalyzer";

    AppConfig();

    // Resolve port, data dir and STOCKFISH_PATH from the given environment.
    // Returns false if no data directory could be derived.
    bool resolve(const QProcessEnvironment &env, QString *error = nullptr);

    // Same, with explicit app-data and home roots (empty = lookup failed).
    bool resolve(const QProcessEnvironment &env,
                 const QString &appDataRoot,
                 const QString &homeRoot,
                 QString *error = nullptr);

    // Load supervision settings from app.yaml
    bool load(const QString &configPath = QString());

    // Sidecar contract
    QString port() const { return m_port; }
    QString dataDir() const { return m_dataDir; }
    bool hasStockfishPath() const { return m_hasStockfishPath; }
    QString stockfishPath() const { return m_stockfishPath; }

    // Backend probe settings
    QString backendHost() const { return m_backendHost; }
    QString healthPath() const { return m_healthPath; }
    QString backendBaseUrl() const;
    int probeIntervalMs() const { return m_probeIntervalMs; }
    int readyTimeoutMs() const { return m_readyTimeoutMs; }

    // Supervision settings
    int maxRestarts() const { return m_maxRestarts; }
    int restartWindowSeconds() const { return m_restartWindowSeconds; }
    int shutdownTimeoutMs() const { return m_shutdownTimeoutMs; }

    // Application name only, so AppDataLocation is <data home>/LocalChessAnalyzer
    static void applyApplicationIdentity();

    static QString defaultConfigPath();
    static QString defaultAppDataRoot();
    static QString defaultHomeRoot();

private:
    // Sidecar contract
    QString m_port;
    QString m_dataDir;
    bool m_hasStockfishPath;
    QString m_stockfishPath;

    // Probe
    QString m_backendHost;
    QString m_healthPath;
    int m_probeIntervalMs;
    int m_readyTimeoutMs;

    // Supervision
    int m_maxRestarts;
    int m_restartWindowSeconds;
    int m_shutdownTimeoutMs;
};

#endif // APPCONFIG_H
