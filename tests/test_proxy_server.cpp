#include <QtTest>
#include <QJsonArray>
#include <QJsonDocument>
#include <QLocalSocket>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <ngd/Sender/NotificationSender.hpp>
#include <ngd/Text/StringPolicy.hpp>
#include <ngd/Transport/ReplayNotificationTransport.hpp>
#include "core/services/ProxyServer.hpp"

namespace {

QJsonObject iconObject(int width, int height, int rowStride, bool hasAlpha, int channels,
                       const QByteArray& data)
{
    QJsonObject icon;
    icon["width"] = width;
    icon["height"] = height;
    icon["rowstride"] = rowStride;
    icon["has_alpha"] = hasAlpha;
    icon["bits_per_sample"] = 8;
    icon["channels"] = channels;
    icon["data"] = QString::fromLatin1(data.toBase64());
    return icon;
}

} // namespace

class TestProxyServer : public QObject {
    Q_OBJECT

private:
    ngd::ReplayNotificationTransport* transport_ = nullptr;
    ngd::NotificationSender* sender_ = nullptr;
    ngp::ProxyServer* server_ = nullptr;
    QList<QJsonObject> replies_;

    void send(const QJsonObject& request)
    {
        server_->handleRequest(QJsonDocument(request).toJson(QJsonDocument::Compact),
                               [this](const QJsonObject& reply) { replies_.append(reply); });
    }

    void sendRaw(const QByteArray& line)
    {
        server_->handleRequest(line, [this](const QJsonObject& reply) { replies_.append(reply); });
    }

    // Appends every complete line the client has received; true once there are n.
    static bool collect(QLocalSocket& client, QList<QJsonObject>* received, int n)
    {
        while (client.canReadLine())
            received->append(QJsonDocument::fromJson(client.readLine()).object());
        return received->size() >= n;
    }

    static bool connectClient(QLocalSocket& client, const QString& path)
    {
        client.connectToServer(path);
        return client.waitForConnected(1000);
    }

    static QJsonObject notifyRequest(int id)
    {
        QJsonObject request;
        request["id"] = id;
        request["command"] = "notify";
        request["summary"] = "Backup finished";
        request["body"] = "42 files copied";
        return request;
    }

private slots:
    void init()
    {
        transport_ = new ngd::ReplayNotificationTransport(this);
        sender_ = new ngd::NotificationSender(transport_, this);
        server_ = new ngp::ProxyServer(sender_, this);
        replies_.clear();
    }

    void cleanup()
    {
        delete server_;
        delete sender_;
        delete transport_;
    }

    void testMalformedJson()
    {
        sendRaw("{not json");
        sendRaw("[1,2,3]");
        QCOMPARE(replies_.size(), 2);
        QCOMPARE(replies_[0]["error"].toString(), QString("InvalidRequest"));
        QVERIFY(!replies_[0].contains("id"));
        QCOMPARE(replies_[1]["error"].toString(), QString("InvalidRequest"));
    }

    void testUnknownCommand()
    {
        QJsonObject request;
        request["id"] = 5;
        request["command"] = "shutdown";
        send(request);
        QCOMPARE(replies_.size(), 1);
        QCOMPARE(replies_[0]["id"].toInt(), 5);
        QCOMPARE(replies_[0]["error"].toString(), QString("UnknownCommand"));
    }

    void testNotifyRepliesWithServerId()
    {
        send(notifyRequest(1));
        // Reply waits for the server
        QCOMPARE(replies_.size(), 0);
        QCOMPARE(transport_->sentRequests().size(), 1);
        QCOMPARE(transport_->sentRequests()[0].summary(), QString("Backup finished"));
        QCOMPARE(transport_->sentRequests()[0].expireTimeoutMillis(), -1);
        QVERIFY(transport_->sentRequests()[0].hints().isEmpty());

        QVERIFY(transport_->completeNext(9));
        QCOMPARE(replies_.size(), 1);
        QCOMPARE(replies_[0]["id"].toInt(), 1);
        QCOMPARE(replies_[0]["result"].toInt(), 9);
    }

    void testNotifyFieldsForwarded()
    {
        QJsonObject request = notifyRequest(2);
        request["actions"] = QJsonArray{"default", "Open"};
        request["urgency"] = "low";
        request["replaces_id"] = 4294967295.0;
        request["expire_timeout"] = 3000;
        send(request);

        QCOMPARE(transport_->sentRequests().size(), 1);
        const auto& sent = transport_->sentRequests()[0];
        QCOMPARE(sent.actions(), (QStringList{"default", "Open"}));
        QCOMPARE(sent.hints().value("urgency").value<uchar>(), uchar(0));
        QCOMPARE(sent.replacesId(), uint32_t(4294967295u));
        QCOMPARE(sent.expireTimeoutMillis(), 3000);
    }

    void testMalformedFields_data()
    {
        QTest::addColumn<QString>("field");
        QTest::addColumn<QJsonValue>("value");

        QTest::newRow("summary number") << "summary" << QJsonValue(3);
        QTest::newRow("body object") << "body" << QJsonValue(QJsonObject());
        QTest::newRow("actions string") << "actions" << QJsonValue("default");
        QTest::newRow("actions element") << "actions" << QJsonValue(QJsonArray{"ok", 1});
        QTest::newRow("urgency unknown") << "urgency" << QJsonValue("urgent");
        QTest::newRow("urgency number") << "urgency" << QJsonValue(2);
        QTest::newRow("replaces_id negative") << "replaces_id" << QJsonValue(-1);
        QTest::newRow("replaces_id too big") << "replaces_id" << QJsonValue(4294967296.0);
        QTest::newRow("timeout fraction") << "expire_timeout" << QJsonValue(1.5);
        QTest::newRow("timeout string") << "expire_timeout" << QJsonValue("-1");
        QTest::newRow("icon array") << "icon" << QJsonValue(QJsonArray());
    }

    void testMalformedFields()
    {
        QFETCH(QString, field);
        QFETCH(QJsonValue, value);

        QJsonObject request = notifyRequest(3);
        request[field] = value;
        send(request);

        QCOMPARE(replies_.size(), 1);
        QCOMPARE(replies_[0]["error"].toString(), QString("InvalidRequest"));
        QCOMPARE(transport_->sentRequests().size(), 0);
    }

    void testUnsupportedTimeout()
    {
        QJsonObject request = notifyRequest(4);
        request["expire_timeout"] = -2;
        send(request);

        QCOMPARE(replies_.size(), 1);
        QCOMPARE(replies_[0]["id"].toInt(), 4);
        QCOMPARE(replies_[0]["error"].toString(), QString("UnsupportedTimeout"));
        QCOMPARE(transport_->sentRequests().size(), 0);
    }

    void testIconRejected_data()
    {
        QTest::addColumn<QJsonObject>("icon");
        QTest::addColumn<QString>("reason");

        QTest::newRow("zero width") << iconObject(0, 10, 30, false, 3, QByteArray(300, 0))
                                    << "GeometryTooSmall";
        QTest::newRow("alpha mismatch") << iconObject(10, 10, 40, true, 3, QByteArray(400, 0))
                                        << "ChannelCountMismatch";
        QTest::newRow("too wide") << iconObject(256, 1, 768, false, 3, QByteArray(768, 0))
                                  << "DimensionTooLarge";
        QTest::newRow("short buffer") << iconObject(10, 10, 30, false, 3, QByteArray(299, 0))
                                      << "BufferTooSmallForHeight";
        QTest::newRow("narrow stride") << iconObject(10, 10, 20, false, 3, QByteArray(200, 0))
                                       << "RowStrideTooSmallForWidth";
    }

    void testIconRejected()
    {
        QFETCH(QJsonObject, icon);
        QFETCH(QString, reason);

        QJsonObject request = notifyRequest(6);
        request["icon"] = icon;
        send(request);

        QCOMPARE(replies_.size(), 1);
        QCOMPARE(replies_[0]["error"].toString(), reason);
        QCOMPARE(transport_->sentRequests().size(), 0);
    }

    void testIconBadBase64()
    {
        QJsonObject icon = iconObject(10, 10, 30, false, 3, QByteArray(300, 0));
        icon["data"] = "@@not base64@@";
        QJsonObject request = notifyRequest(7);
        request["icon"] = icon;
        send(request);

        QCOMPARE(replies_.size(), 1);
        QCOMPARE(replies_[0]["error"].toString(), QString("InvalidRequest"));
    }

    void testValidIconAccepted()
    {
        QJsonObject request = notifyRequest(8);
        request["icon"] = iconObject(10, 10, 40, true, 4, QByteArray(400, '\xff'));
        send(request);

        QCOMPARE(replies_.size(), 0);
        QCOMPARE(transport_->sentRequests().size(), 1);
        QVERIFY(transport_->sentRequests()[0].icon().isEmpty());
    }

    void testDisallowedCharacters()
    {
        ngd::CodePointPolicy noMarkup([](char32_t cp) { return cp != '<' && cp != '>'; });
        server_->setStringPolicy(&noMarkup);

        QJsonObject request = notifyRequest(10);
        request["body"] = "<b>bold</b>";
        send(request);

        QCOMPARE(replies_.size(), 1);
        QCOMPARE(replies_[0]["error"].toString(), QString("DisallowedCharacters"));
        QCOMPARE(replies_[0]["field"].toString(), QString("body"));
        QCOMPARE(replies_[0]["positions"].toArray(), (QJsonArray{0, 2, 7, 10}));
        QCOMPARE(replies_[0]["code_points"].toArray(), (QJsonArray{0x3c, 0x3e, 0x3c, 0x3e}));
        QCOMPARE(transport_->sentRequests().size(), 0);

        // Null restores accept-all
        server_->setStringPolicy(nullptr);
        send(request);
        QCOMPARE(transport_->sentRequests().size(), 1);
    }

    void testTransportError()
    {
        send(notifyRequest(11));
        QVERIFY(transport_->failNext("org.freedesktop.DBus.Error.ServiceUnknown",
                                     "The name is not activatable"));

        QCOMPARE(replies_.size(), 1);
        QCOMPARE(replies_[0]["id"].toInt(), 11);
        QCOMPARE(replies_[0]["error"].toString(), QString("TransportError"));
        QCOMPARE(replies_[0]["name"].toString(), QString("org.freedesktop.DBus.Error.ServiceUnknown"));
        QCOMPARE(replies_[0]["message"].toString(), QString("The name is not activatable"));
    }

    void testClose()
    {
        QJsonObject request;
        request["id"] = 12;
        request["command"] = "close";
        request["notification_id"] = 9;
        send(request);

        QCOMPARE(transport_->closedIds(), (QList<uint32_t>{9}));
        QCOMPARE(replies_.size(), 1);
        QCOMPARE(replies_[0]["result"].toBool(), true);

        request["notification_id"] = "9";
        send(request);
        QCOMPARE(replies_[1]["error"].toString(), QString("InvalidRequest"));
    }

    void testCapabilitiesAndServerInfo()
    {
        transport_->setCapabilities({"body", "actions", "icon-static"});
        transport_->setServerInformation({"mako", "emersion", "1.8.0", "1.2"});

        QJsonObject request;
        request["id"] = 13;
        request["command"] = "capabilities";
        send(request);
        QCOMPARE(replies_[0]["result"].toArray(), (QJsonArray{"body", "actions", "icon-static"}));

        request["command"] = "server_info";
        send(request);
        const QJsonObject info = replies_[1]["result"].toObject();
        QCOMPARE(info["name"].toString(), QString("mako"));
        QCOMPARE(info["vendor"].toString(), QString("emersion"));
        QCOMPARE(info["version"].toString(), QString("1.8.0"));
        QCOMPARE(info["spec_version"].toString(), QString("1.2"));

        transport_->setQueryError({"org.freedesktop.DBus.Error.NoReply", "timeout"});
        send(request);
        QCOMPARE(replies_[2]["error"].toString(), QString("TransportError"));
    }

    void testRequestTooLarge()
    {
        server_->setMaxRequestBytes(64);
        QJsonObject request = notifyRequest(14);
        request["body"] = QString(200, 'x');
        send(request);

        QCOMPARE(replies_.size(), 1);
        QCOMPARE(replies_[0]["error"].toString(), QString("RequestTooLarge"));
        QCOMPARE(transport_->sentRequests().size(), 0);
    }

    void testEventsForwarded()
    {
        QSignalSpy spy(server_, &ngp::ProxyServer::eventForwarded);

        transport_->simulateClosed(9, 2);
        transport_->simulateAction(9, "default");

        QCOMPARE(spy.count(), 2);
        const QJsonObject closed = spy.at(0).at(0).toJsonObject();
        QCOMPARE(closed["event"].toString(), QString("closed"));
        QCOMPARE(closed["notification_id"].toInt(), 9);
        QCOMPARE(closed["reason"].toInt(), 2);
        const QJsonObject action = spy.at(1).at(0).toJsonObject();
        QCOMPARE(action["event"].toString(), QString("action"));
        QCOMPARE(action["action_key"].toString(), QString("default"));
    }

    void testEventsSuppressed()
    {
        server_->setForwardEvents(false);
        QSignalSpy spy(server_, &ngp::ProxyServer::eventForwarded);
        transport_->simulateClosed(9, 1);
        QCOMPARE(spy.count(), 0);
    }

    void testSocketRoundTrip()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("proxy.sock");
        QVERIFY(server_->start(path));
        QVERIFY(server_->isListening());

        transport_->setCapabilities({"body"});

        QLocalSocket client;
        client.connectToServer(path);
        QVERIFY(client.waitForConnected(1000));

        client.write("{\"id\":1,\"command\":\"capabilities\"}\n");
        client.flush();
        QTRY_VERIFY(client.canReadLine());
        const QJsonObject reply = QJsonDocument::fromJson(client.readLine()).object();
        QCOMPARE(reply["id"].toInt(), 1);
        QCOMPARE(reply["result"].toArray(), (QJsonArray{"body"}));

        transport_->simulateAction(3, "open");
        QTRY_VERIFY(client.canReadLine());
        const QJsonObject event = QJsonDocument::fromJson(client.readLine()).object();
        QCOMPARE(event["event"].toString(), QString("action"));
        QCOMPARE(event["action_key"].toString(), QString("open"));

        client.disconnectFromServer();
        server_->stop();
        QVERIFY(!server_->isListening());
    }

    void testSeveralLinesInOneWrite()
    {
        QTemporaryDir dir;
        const QString path = dir.filePath("proxy.sock");
        QVERIFY(server_->start(path));
        transport_->setCapabilities({"body"});

        QLocalSocket client;
        QVERIFY(connectClient(client, path));
        client.write("{\"id\":1,\"command\":\"capabilities\"}\n"
                     "{\"id\":2,\"command\":\"reboot\"}\n"
                     "{\"id\":3,\"command\":\"close\",\"notification_id\":4}\n");
        client.flush();

        QList<QJsonObject> received;
        QTRY_VERIFY(collect(client, &received, 3));
        QCOMPARE(received[0]["id"].toInt(), 1);
        QCOMPARE(received[0]["result"].toArray(), (QJsonArray{"body"}));
        QCOMPARE(received[1]["id"].toInt(), 2);
        QCOMPARE(received[1]["error"].toString(), QString("UnknownCommand"));
        QCOMPARE(received[2]["id"].toInt(), 3);
        QCOMPARE(transport_->closedIds(), (QList<uint32_t>{4}));
    }

    void testLineSplitAcrossWrites()
    {
        QTemporaryDir dir;
        const QString path = dir.filePath("proxy.sock");
        QVERIFY(server_->start(path));

        QLocalSocket client;
        QVERIFY(connectClient(client, path));
        client.write("{\"id\":7,\"command\":\"notify\",\"summ");
        client.flush();
        QTest::qWait(50);
        QCOMPARE(transport_->sentRequests().size(), 0);
        QCOMPARE(client.bytesAvailable(), qint64(0));

        client.write("ary\":\"Split\",\"body\":\"line\"}\n");
        client.flush();
        QTRY_COMPARE(transport_->sentRequests().size(), 1);
        QCOMPARE(transport_->sentRequests()[0].summary(), QString("Split"));
        QCOMPARE(transport_->sentRequests()[0].body(), QString("line"));

        QVERIFY(transport_->completeNext(21));
        QList<QJsonObject> received;
        QTRY_VERIFY(collect(client, &received, 1));
        QCOMPARE(received[0]["id"].toInt(), 7);
        QCOMPARE(received[0]["result"].toInt(), 21);
    }

    void testBlankLinesSkipped()
    {
        QTemporaryDir dir;
        const QString path = dir.filePath("proxy.sock");
        QVERIFY(server_->start(path));

        QLocalSocket client;
        QVERIFY(connectClient(client, path));
        client.write("\n   \n\r\n{\"id\":8,\"command\":\"capabilities\"}\n\n");
        client.flush();

        QList<QJsonObject> received;
        QTRY_VERIFY(collect(client, &received, 1));
        QTest::qWait(50);
        collect(client, &received, 1);
        QCOMPARE(received.size(), 1);
        QCOMPARE(received[0]["id"].toInt(), 8);
    }

    void testUnterminatedRequestTooLarge()
    {
        QTemporaryDir dir;
        const QString path = dir.filePath("proxy.sock");
        QVERIFY(server_->start(path));
        server_->setMaxRequestBytes(64);

        QLocalSocket client;
        QVERIFY(connectClient(client, path));
        QTRY_COMPARE(server_->clientCount(), 1);

        client.write(QByteArray(100, 'x'));
        client.flush();

        QList<QJsonObject> received;
        QTRY_VERIFY(collect(client, &received, 1));
        QCOMPARE(received[0]["error"].toString(), QString("RequestTooLarge"));
        QVERIFY(!received[0].contains("id"));
        QTRY_COMPARE(server_->clientCount(), 0);
        QTRY_COMPARE(client.state(), QLocalSocket::UnconnectedState);
        QCOMPARE(transport_->sentRequests().size(), 0);
    }

    void testClientClosingMidReplyLeavesServerRunning()
    {
        QTemporaryDir dir;
        const QString path = dir.filePath("proxy.sock");
        QVERIFY(server_->start(path));
        transport_->setCapabilities({"body"});

        QLocalSocket steady;
        QLocalSocket abrupt;
        QVERIFY(connectClient(steady, path));
        QVERIFY(connectClient(abrupt, path));
        QTRY_COMPARE(server_->clientCount(), 2);

        // Both lines are answered synchronously while the peer is gone
        abrupt.write("garbage\n{\"id\":5,\"command\":\"capabilities\"}\n");
        QVERIFY(abrupt.waitForBytesWritten(1000));
        abrupt.abort();
        QTRY_COMPARE(server_->clientCount(), 1);

        transport_->simulateAction(2, "default");
        QList<QJsonObject> received;
        QTRY_VERIFY(collect(steady, &received, 1));
        QCOMPARE(received[0]["event"].toString(), QString("action"));

        steady.write("{\"id\":6,\"command\":\"capabilities\"}\n");
        steady.flush();
        QTRY_VERIFY(collect(steady, &received, 2));
        QCOMPARE(received[1]["id"].toInt(), 6);
        QVERIFY(server_->isListening());
    }
};

QTEST_MAIN(TestProxyServer)
#include "test_proxy_server.moc"
