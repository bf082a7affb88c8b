#pragma once

#include <QHash>
#include <QJsonObject>
#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>
#include <functional>

namespace ngd {
class IStringPolicy;
class NotificationSender;
}

namespace ngp {

/// Unix domain socket front end for untrusted clients.
///
/// Each line on the socket is one JSON request. Every field is checked
/// before anything reaches the notification server: JSON shape first, then
/// the text policy, the image sanitizer and the request builder.
///
///   {"id":1,"command":"notify","summary":"...","body":"...","actions":["k","Label"],
///    "urgency":"critical","replaces_id":0,"expire_timeout":-1,"icon":{...}}
///   {"id":2,"command":"close","notification_id":7}
///   {"id":3,"command":"capabilities"}
///   {"id":4,"command":"server_info"}
///
/// Replies carry the request id and either "result" or "error". Server-side
/// events are pushed to every client as {"event":"closed"|"action",...}.
class ProxyServer : public QObject {
    Q_OBJECT

public:
    using Reply = std::function<void(const QJsonObject& reply)>;

    explicit ProxyServer(ngd::NotificationSender* sender, QObject* parent = nullptr);
    ~ProxyServer() override;

    /// Start listening. Returns false if the socket cannot be bound.
    bool start(const QString& socketPath);
    void stop();
    bool isListening() const;
    int clientCount() const;

    /// Not owned. Null restores the accept-all default.
    void setStringPolicy(const ngd::IStringPolicy* policy);
    void setMaxRequestBytes(int bytes);
    void setForwardEvents(bool enabled);

    /// Processes one request line. reply runs exactly once, possibly after
    /// the notification server answers.
    void handleRequest(const QByteArray& line, const Reply& reply);

signals:
    void eventForwarded(const QJsonObject& event);

private slots:
    void onNewConnection();
    void onReadyRead();
    void onDisconnected();
    void onNotificationClosed(uint notificationId, uint reason);
    void onActionInvoked(uint notificationId, const QString& actionKey);

private:
    void handleNotify(const QJsonObject& request, const QJsonValue& id, const Reply& reply);
    void handleClose(const QJsonObject& request, const QJsonValue& id, const Reply& reply);
    void handleCapabilities(const QJsonValue& id, const Reply& reply);
    void handleServerInfo(const QJsonValue& id, const Reply& reply);

    void broadcast(const QJsonObject& event);
    static void writeLine(QLocalSocket* socket, const QJsonObject& message);

    ngd::NotificationSender* sender_ = nullptr;
    const ngd::IStringPolicy* policy_ = nullptr;
    QLocalServer* server_ = nullptr;
    QHash<QLocalSocket*, QByteArray> buffers_;
    int maxRequestBytes_ = 4194304;
    bool forwardEvents_ = true;
};

} // namespace ngp
