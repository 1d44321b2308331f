/**
 * @file test_httptransport.cpp
 * @brief Unit tests for HttpTransport
 *
 * URL building is tested directly. Requests are exercised against a
 * minimal HTTP responder on a local QTcpServer.
 */

#include <QtTest/QtTest>
#include <QTcpServer>
#include <QTcpSocket>
#include <QUrlQuery>
#include "net/httptransport.h"

using namespace FieldSync;

/**
 * @brief One-shot HTTP responder for tests
 *
 * Answers every request with the configured status and body, and records
 * the request line, headers and body of the last request.
 */
class LocalHttpServer
{
public:
    LocalHttpServer()
    {
        QObject::connect(&m_server, &QTcpServer::newConnection, [this]() {
            while (QTcpSocket *socket = m_server.nextPendingConnection()) {
                QObject::connect(socket, &QTcpSocket::readyRead, socket, [this, socket]() {
                    onReadyRead(socket);
                });
            }
        });
    }

    bool listen() { return m_server.listen(QHostAddress::LocalHost); }

    QUrl url() const
    {
        return QUrl(QString("http://127.0.0.1:%1").arg(m_server.serverPort()));
    }

    int status = 200;
    QByteArray responseBody = "{}";
    bool respond = true;

    QByteArray lastRequestLine;
    QByteArray lastHeaders;
    QByteArray lastBody;
    int requestCount = 0;

private:
    void onReadyRead(QTcpSocket *socket)
    {
        QByteArray &buffer = m_buffers[socket];
        buffer += socket->readAll();

        int headerEnd = buffer.indexOf("\r\n\r\n");
        if (headerEnd < 0) {
            return;
        }

        QByteArray headers = buffer.left(headerEnd);
        int contentLength = 0;
        for (const QByteArray &line : headers.split('\n')) {
            if (line.toLower().startsWith("content-length:")) {
                contentLength = line.mid(15).trimmed().toInt();
            }
        }
        if (buffer.size() < headerEnd + 4 + contentLength) {
            return;
        }

        lastRequestLine = headers.left(headers.indexOf("\r\n"));
        lastHeaders = headers;
        lastBody = buffer.mid(headerEnd + 4, contentLength);
        requestCount++;
        m_buffers.remove(socket);

        if (!respond) {
            return;
        }

        QByteArray reply = "HTTP/1.1 " + QByteArray::number(status) + " Status\r\n"
            "Content-Type: application/json\r\n"
            "Content-Length: " + QByteArray::number(responseBody.size()) + "\r\n"
            "Connection: close\r\n\r\n" + responseBody;
        socket->write(reply);
        socket->disconnectFromHost();
    }

    QTcpServer m_server;
    QMap<QTcpSocket*, QByteArray> m_buffers;
};

class TestHttpTransport : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ========== URL Tests ==========
    void testJoinPathTrailingSlash();
    void testJoinPathWithPrefix();
    void testProcedureUrl();
    void testQueryUrlEncodesInput();
    void testDispositionFileName();

    // ========== Request Tests ==========
    void testMutatePostsJson();
    void testAuthorizationHeader();
    void testErrorStatusKeepsBody();
    void testUploadIsMultipart();
    void testUploadSanitizesFileName();
    void testQueryUsesGet();

    // ========== Probe Tests ==========
    void testProbeReachable();
    void testProbeServerError();
    void testProbeTimeout();
    void testConnectionRefused();

private:
    LocalHttpServer *m_server = nullptr;
    HttpTransport *m_transport = nullptr;
};

void TestHttpTransport::init()
{
    m_server = new LocalHttpServer();
    QVERIFY(m_server->listen());
    m_transport = new HttpTransport(m_server->url());
    m_transport->setRequestTimeout(5000);
}

void TestHttpTransport::cleanup()
{
    delete m_transport;
    delete m_server;
    m_transport = nullptr;
    m_server = nullptr;
}

// ========== URL Tests ==========

void TestHttpTransport::testJoinPathTrailingSlash()
{
    QUrl url = HttpTransport::joinPath(QUrl("http://localhost:3000/"), "/api/health");
    QCOMPARE(url.toString(), QString("http://localhost:3000/api/health"));

    url = HttpTransport::joinPath(QUrl("http://localhost:3000"), "api/health");
    QCOMPARE(url.toString(), QString("http://localhost:3000/api/health"));
}

void TestHttpTransport::testJoinPathWithPrefix()
{
    QUrl url = HttpTransport::joinPath(QUrl("https://audit.example.org/app/"), "/api/health");
    QCOMPARE(url.toString(), QString("https://audit.example.org/app/api/health"));
}

void TestHttpTransport::testProcedureUrl()
{
    QUrl url = HttpTransport::procedureUrl(QUrl("http://localhost:3000"), "fieldworkSync.syncChecklistItem");
    QCOMPARE(url.path(), QString("/api/trpc/fieldworkSync.syncChecklistItem"));
}

void TestHttpTransport::testQueryUrlEncodesInput()
{
    QJsonObject input;
    input["id"] = "review 1&2";

    QUrl url = HttpTransport::queryUrl(QUrl("http://localhost:3000"), "review.getById", input);
    QCOMPARE(url.path(), QString("/api/trpc/review.getById"));

    QString decoded = QUrlQuery(url).queryItemValue("input", QUrl::FullyDecoded);
    QJsonObject parsed = QJsonDocument::fromJson(decoded.toUtf8()).object();
    QCOMPARE(parsed["id"].toString(), QString("review 1&2"));
}

void TestHttpTransport::testDispositionFileName()
{
    QCOMPARE(HttpTransport::dispositionFileName("hangar.jpg"), QString("hangar.jpg"));
    QCOMPARE(HttpTransport::dispositionFileName("a\"b\\c.png"), QString("a_b_c.png"));
    QCOMPARE(HttpTransport::dispositionFileName("line\r\nbreak"), QString("line__break"));
    QCOMPARE(HttpTransport::dispositionFileName(QString()), QString("upload"));
}

// ========== Request Tests ==========

void TestHttpTransport::testMutatePostsJson()
{
    m_server->responseBody = R"({"result":{"data":{"json":{"status":"ok"}}}})";

    QJsonObject input;
    input["itemId"] = "item-1";
    TransportResponse response = m_transport->mutate("fieldworkSync.syncChecklistItem", input);

    QCOMPARE(response.httpStatus, 200);
    QVERIFY(response.isSuccess());
    QVERIFY(!response.networkError);
    QVERIFY(m_server->lastRequestLine.startsWith("POST /api/trpc/fieldworkSync.syncChecklistItem"));
    QCOMPARE(QJsonDocument::fromJson(m_server->lastBody).object()["itemId"].toString(), QString("item-1"));
    QVERIFY(m_server->lastHeaders.toLower().contains("content-type: application/json"));
    QVERIFY(m_server->lastHeaders.contains("FieldSync/"));
}

void TestHttpTransport::testAuthorizationHeader()
{
    m_transport->setAuthToken("secret-token");
    m_transport->mutate("fieldworkSync.syncOfflineSession", QJsonObject());
    QVERIFY(m_server->lastHeaders.contains("Bearer secret-token"));
}

void TestHttpTransport::testErrorStatusKeepsBody()
{
    m_server->status = 409;
    m_server->responseBody = R"({"message":"Conflict"})";

    TransportResponse response = m_transport->mutate("fieldworkSync.syncChecklistItem", QJsonObject());
    QCOMPARE(response.httpStatus, 409);
    QVERIFY(!response.networkError);
    QCOMPARE(response.json()["message"].toString(), QString("Conflict"));
}

void TestHttpTransport::testUploadIsMultipart()
{
    QJsonObject metadata;
    metadata["checklistItemId"] = "item-1";

    TransportResponse response = m_transport->upload(QByteArray(512, 'p'), "hangar.jpg", "image/jpeg", metadata);
    QVERIFY(response.isSuccess());

    QVERIFY(m_server->lastRequestLine.startsWith("POST /api/fieldwork/evidence"));
    QVERIFY(m_server->lastHeaders.toLower().contains("multipart/form-data"));
    QVERIFY(m_server->lastBody.contains("filename=\"hangar.jpg\""));
    QVERIFY(m_server->lastBody.contains("name=\"metadata\""));
    QVERIFY(m_server->lastBody.contains("item-1"));
}

void TestHttpTransport::testUploadSanitizesFileName()
{
    TransportResponse response = m_transport->upload(QByteArray(64, 'p'), "apron \"west\"\r\nX-Evil: 1.jpg",
                                                     "image/jpeg", QJsonObject());
    QVERIFY(response.isSuccess());

    QVERIFY(m_server->lastBody.contains("filename=\"apron _west___X-Evil: 1.jpg\""));
    QVERIFY(!m_server->lastBody.contains("\r\nX-Evil"));
}

void TestHttpTransport::testQueryUsesGet()
{
    QJsonObject input;
    input["reviewId"] = "review-1";
    m_transport->query("fieldwork.getChecklistTemplate", input);
    QVERIFY(m_server->lastRequestLine.startsWith("GET /api/trpc/fieldwork.getChecklistTemplate?input="));
}

// ========== Probe Tests ==========

void TestHttpTransport::testProbeReachable()
{
    QVERIFY(m_transport->probe(2000));
    QVERIFY(m_server->lastRequestLine.startsWith("GET /api/health"));
}

void TestHttpTransport::testProbeServerError()
{
    m_server->status = 503;
    QVERIFY(!m_transport->probe(2000));
}

void TestHttpTransport::testProbeTimeout()
{
    m_server->respond = false;

    QElapsedTimer timer;
    timer.start();
    QVERIFY(!m_transport->probe(200));
    QVERIFY(timer.elapsed() < 2000);
}

void TestHttpTransport::testConnectionRefused()
{
    QTcpServer probe;
    QVERIFY(probe.listen(QHostAddress::LocalHost));
    quint16 port = probe.serverPort();
    probe.close();

    HttpTransport transport(QUrl(QString("http://127.0.0.1:%1").arg(port)));
    transport.setRequestTimeout(2000);
    TransportResponse response = transport.mutate("fieldworkSync.syncChecklistItem", QJsonObject());
    QCOMPARE(response.httpStatus, 0);
    QVERIFY(response.networkError);
    QVERIFY(!response.errorString.isEmpty());
}

QTEST_MAIN(TestHttpTransport)
#include "test_httptransport.moc"
