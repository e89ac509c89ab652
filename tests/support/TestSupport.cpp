#include "TestSupport.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QHostAddress>
#include <QTcpServer>
#include <QTcpSocket>

namespace lcatest {

FakeBackendServer::FakeBackendServer(QObject *parent)
    : QObject(parent)
    , m_server(new QTcpServer(this))
    , m_statusLine("HTTP/1.1 200 OK")
{
    connect(m_server, &QTcpServer::newConnection, this, &FakeBackendServer::onNewConnection);
}

bool FakeBackendServer::listen(quint16 port)
{
    return m_server->listen(QHostAddress::LocalHost, port);
}

void FakeBackendServer::close()
{
    m_server->close();
}

quint16 FakeBackendServer::port() const
{
    return m_server->serverPort();
}

void FakeBackendServer::onNewConnection()
{
    while (QTcpSocket *socket = m_server->nextPendingConnection()) {
        connect(socket, &QTcpSocket::readyRead, this, [this, socket]() {
            onReadyRead(socket);
        });
        connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
    }
}

void FakeBackendServer::onReadyRead(QTcpSocket *socket)
{
    QByteArray buffer = socket->property("buffer").toByteArray();
    buffer += socket->readAll();
    socket->setProperty("buffer", buffer);
    if (!buffer.contains("\r\n\r\n"))
        return;

    ++m_requestCount;
    m_lastRequestLine = buffer.left(buffer.indexOf("\r\n"));
    socket->setProperty("buffer", QByteArray());

    const QByteArray body = "null";
    QByteArray response = m_statusLine + "\r\n";
    response += "Content-Type: application/json\r\n";
    response += "Content-Length: " + QByteArray::number(body.size()) + "\r\n";
    response += "Connection: close\r\n\r\n";
    response += body;
    socket->write(response);
    socket->disconnectFromHost();
}

quint16 unusedLocalPort()
{
    QTcpServer probe;
    if (!probe.listen(QHostAddress::LocalHost, 0))
        return 0;
    const quint16 port = probe.serverPort();
    probe.close();
    return port;
}

bool writeExecutableScript(const QString &path, const QByteArray &contents)
{
    QFile script(path);
    if (!script.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return false;
    if (script.write(contents) != contents.size())
        return false;
    script.close();
    return QFile::setPermissions(
        path,
        QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner
            | QFileDevice::ReadGroup | QFileDevice::ExeGroup
            | QFileDevice::ReadOther | QFileDevice::ExeOther);
}

QByteArray envDumpScript(const QString &envFile, const QByteArray &tail)
{
    return "#!/bin/sh\n"
           "env > \"" + envFile.toUtf8() + ".tmp\"\n"
           "mv \"" + envFile.toUtf8() + ".tmp\" \"" + envFile.toUtf8() + "\"\n"
           + tail + "\n";
}

AppConfig makeConfig(const QString &dir,
                     const QByteArray &yaml,
                     const QProcessEnvironment &env)
{
    AppConfig config;
    const QString yamlPath = QDir(dir).filePath("app.yaml");
    QFile file(yamlPath);
    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        file.write(yaml);
        file.close();
        if (!config.load(yamlPath))
            qWarning() << "Could not load test config" << yamlPath;
    }
    QString error;
    if (!config.resolve(env, dir, dir, &error))
        qWarning() << "Could not resolve test config:" << error;
    return config;
}

QString readFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
        return QString();
    return QString::fromUtf8(file.readAll());
}

} // namespace lcatest
