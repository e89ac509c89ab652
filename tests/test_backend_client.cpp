#include <QtTest/QtTest>

#include <QSignalSpy>
#include <QTimer>

#include "app/BackendClient.h"
#include "support/TestSupport.h"

namespace {

QString baseUrlFor(quint16 port)
{
    return QStringLiteral("http://127.0.0.1:%1").arg(port);
}

} // namespace

class TestBackendClient : public QObject {
    Q_OBJECT

private slots:
    void testReadyWhenBackendAnswers();
    void testWaitUsesConfiguredHealthPath();
    void testAnyHttpStatusCountsAsReady();
    void testReadyAfterBackendComesUpLate();
    void testTimesOutWhenNothingListens();
    void testCancelStopsProbing();
};

void TestBackendClient::testWaitUsesConfiguredHealthPath()
{
    lcatest::FakeBackendServer server;
    QVERIFY(server.listen());

    BackendClient client(baseUrlFor(server.port()));
    client.setHealthPath("/docs");
    QSignalSpy readySpy(&client, &BackendClient::ready);
    client.waitUntilReady(5000, 50);

    QTRY_COMPARE_WITH_TIMEOUT(readySpy.count(), 1, 5000);
    QVERIFY(server.lastRequestLine().startsWith("GET /docs "));
}

void TestBackendClient::testReadyWhenBackendAnswers()
{
    lcatest::FakeBackendServer server;
    QVERIFY(server.listen());

    BackendClient client(baseUrlFor(server.port()));
    QSignalSpy readySpy(&client, &BackendClient::ready);
    QSignalSpy timeoutSpy(&client, &BackendClient::readyTimedOut);

    client.waitUntilReady(5000, 50);
    QVERIFY(client.isProbing());

    QTRY_COMPARE_WITH_TIMEOUT(readySpy.count(), 1, 5000);
    QCOMPARE(timeoutSpy.count(), 0);
    QVERIFY(!client.isProbing());
    QCOMPARE(client.attempts(), 1);
    QVERIFY(server.lastRequestLine().startsWith("GET / "));
}

void TestBackendClient::testAnyHttpStatusCountsAsReady()
{
    lcatest::FakeBackendServer server;
    server.setStatusLine("HTTP/1.1 404 Not Found");
    QVERIFY(server.listen());

    BackendClient client(baseUrlFor(server.port()));
    QSignalSpy readySpy(&client, &BackendClient::ready);
    client.waitUntilReady(5000, 50);

    QTRY_COMPARE_WITH_TIMEOUT(readySpy.count(), 1, 5000);
}

void TestBackendClient::testReadyAfterBackendComesUpLate()
{
    const quint16 port = lcatest::unusedLocalPort();
    QVERIFY(port != 0);

    lcatest::FakeBackendServer server;
    BackendClient client(baseUrlFor(port));
    QSignalSpy readySpy(&client, &BackendClient::ready);
    QSignalSpy timeoutSpy(&client, &BackendClient::readyTimedOut);

    client.waitUntilReady(10000, 50);
    bool listening = false;
    QTimer::singleShot(400, &server, [&server, &listening, port]() {
        listening = server.listen(port);
    });

    QTRY_COMPARE_WITH_TIMEOUT(readySpy.count(), 1, 10000);
    QVERIFY(listening);
    QCOMPARE(timeoutSpy.count(), 0);
    QVERIFY(client.attempts() > 1);
}

void TestBackendClient::testTimesOutWhenNothingListens()
{
    const quint16 port = lcatest::unusedLocalPort();
    QVERIFY(port != 0);

    BackendClient client(baseUrlFor(port));
    QSignalSpy readySpy(&client, &BackendClient::ready);
    QSignalSpy timeoutSpy(&client, &BackendClient::readyTimedOut);

    client.waitUntilReady(400, 50);

    QTRY_COMPARE_WITH_TIMEOUT(timeoutSpy.count(), 1, 5000);
    QCOMPARE(readySpy.count(), 0);
    QVERIFY(!client.isProbing());
    QVERIFY(client.attempts() >= 2);
}

void TestBackendClient::testCancelStopsProbing()
{
    const quint16 port = lcatest::unusedLocalPort();
    QVERIFY(port != 0);

    BackendClient client(baseUrlFor(port));
    QSignalSpy readySpy(&client, &BackendClient::ready);
    QSignalSpy timeoutSpy(&client, &BackendClient::readyTimedOut);

    client.waitUntilReady(300, 50);
    client.cancel();
    QVERIFY(!client.isProbing());

    QTest::qWait(600);
    QCOMPARE(readySpy.count(), 0);
    QCOMPARE(timeoutSpy.count(), 0);
}

QTEST_MAIN(TestBackendClient)
#include "test_backend_client.moc"
