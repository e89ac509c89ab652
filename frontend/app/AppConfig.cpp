#include "AppConfig.h"
#include "Logging.h"

#include <QFile>
#include <QDir>
#include <QCoreApplication>
#include <QStandardPaths>

AppConfig::AppConfig()
    : m_port(kDefaultPort)
    , m_hasStockfishPath(false)
    , m_backendHost("127.0.0.1")
    , m_healthPath("/")
    , m_probeIntervalMs(250)
    , m_readyTimeoutMs(30000)
    , m_maxRestarts(3)
    , m_restartWindowSeconds(60)
    , m_shutdownTimeoutMs(3000)
{
}

void AppConfig::applyApplicationIdentity()
{
    // An organization name would add a second directory level
    QCoreApplication::setOrganizationName(QString());
    QCoreApplication::setApplicationName(kAppFolder);
}

QString AppConfig::defaultAppDataRoot()
{
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

QString AppConfig::defaultHomeRoot()
{
    return QStandardPaths::writableLocation(QStandardPaths::HomeLocation);
}

QString AppConfig::defaultConfigPath()
{
    // ../config/app.yaml relative to executable
    QDir appDir(QCoreApplication::applicationDirPath());
    appDir.cdUp();
    return appDir.filePath("config/app.yaml");
}

QString AppConfig::backendBaseUrl() const
{
    return QString("http://%1:%2").arg(m_backendHost, m_port);
}

bool AppConfig::resolve(const QProcessEnvironment &env, QString *error)
{
    return resolve(env, defaultAppDataRoot(), defaultHomeRoot(), error);
}

bool AppConfig::resolve(const QProcessEnvironment &env,
                        const QString &appDataRoot,
                        const QString &homeRoot,
                        QString *error)
{
    const QString port = env.value("PORT");
    m_port = port.isEmpty() ? QString(kDefaultPort) : port;

    // DATA_DIR is taken verbatim whenever it is set, even if empty
    if (env.contains("DATA_DIR")) {
        m_dataDir = env.value("DATA_DIR");
    } else {
        const QString root = appDataRoot.isEmpty() ? homeRoot : appDataRoot;
        if (root.isEmpty()) {
            if (error)
                *error = "Could not determine app data or home directory";
            return false;
        }
        m_dataDir = QDir::toNativeSeparators(
            QDir(root).filePath(QString(kAppFolder) + "/data"));
    }

    // Passed through only when present in the parent environment
    m_hasStockfishPath = env.contains("STOCKFISH_PATH");
    m_stockfishPath = m_hasStockfishPath ? env.value("STOCKFISH_PATH") : QString();

    qCDebug(lcaApp) << "Resolved port" << m_port << "data dir" << m_dataDir;
    return true;
}

bool AppConfig::load(const QString &configPath)
{
    QString path = configPath.isEmpty() ? defaultConfigPath() : configPath;

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(lcaApp) << "Could not open config file:" << path;
        qCWarning(lcaApp) << "Using default configuration.";
        return false;
    }

    // Line-by-line parsing of "section:" headers and "key: value" pairs
    QString currentSection;
    while (!file.atEnd()) {
        const QString raw = QString::fromUtf8(file.readLine());
        QString line = raw.trimmed();

        if (line.isEmpty() || line.startsWith('#'))
            continue;

        if (!raw.startsWith(' ') && !raw.startsWith('\t') && line.endsWith(':')) {
            currentSection = line.left(line.length() - 1);
            continue;
        }

        int colonPos = line.indexOf(':');
        if (colonPos <= 0)
            continue;

        QString key = line.left(colonPos).trimmed();
        QString value = line.mid(colonPos + 1).trimmed();

        if (value.startsWith('"') && value.endsWith('"') && value.length() >= 2) {
            value = value.mid(1, value.length() - 2);
        }

        if (currentSection != "backend")
            continue;

        bool ok = true;
        auto readInt = [&value, &ok](int &target) {
            const int parsed = value.toInt(&ok);
            if (ok && parsed >= 0)
                target = parsed;
            else
                ok = false;
        };

        if (key == "host") {
            m_backendHost = value;
        } else if (key == "health_path") {
            m_healthPath = value.startsWith('/') ? value : "/" + value;
        } else if (key == "probe_interval_ms") {
            readInt(m_probeIntervalMs);
        } else if (key == "ready_timeout_ms") {
            readInt(m_readyTimeoutMs);
        } else if (key == "max_restarts") {
            readInt(m_maxRestarts);
        } else if (key == "restart_window_seconds") {
            readInt(m_restartWindowSeconds);
        } else if (key == "shutdown_timeout_ms") {
            readInt(m_shutdownTimeoutMs);
        } else {
            qCDebug(lcaApp) << "Ignoring unknown backend key:" << key;
        }

        if (!ok) {
            qCWarning(lcaApp) << "Invalid value for" << key << ":" << value;
        }
    }

    file.close();
    qCDebug(lcaApp) << "Configuration loaded from:" << path;
    return true;
}
