#include "ProxyServer.hpp"
#include <ngd/Image/ImageSanitizer.hpp>
#include <ngd/Sender/NotificationSender.hpp>
#include <ngd/Text/StringPolicy.hpp>
#include <ngd/Text/TrustedString.hpp>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QPointer>
#include <boost/log/trivial.hpp>
#include <cmath>
#include <limits>
#include <optional>

namespace ngp {

namespace {

const ngd::AcceptAllPolicy kAcceptAll{};

const QString kInvalidRequest = QStringLiteral("InvalidRequest");

QJsonObject makeReply(const QJsonValue& id)
{
    QJsonObject reply;
    if (!id.isUndefined())
        reply["id"] = id;
    return reply;
}

QJsonObject errorReply(const QJsonValue& id, const QString& error)
{
    QJsonObject reply = makeReply(id);
    reply["error"] = error;
    return reply;
}

QJsonObject transportErrorReply(const QJsonValue& id, const ngd::TransportError& error)
{
    QJsonObject reply = errorReply(id, QStringLiteral("TransportError"));
    reply["name"] = error.name;
    reply["message"] = error.message;
    return reply;
}

// JSON numbers are doubles; accept only exact integers inside [min, max].
bool readInteger(const QJsonValue& value, qint64 min, qint64 max, qint64* out)
{
    if (!value.isDouble())
        return false;
    const double d = value.toDouble();
    if (!std::isfinite(d) || std::floor(d) != d)
        return false;
    if (d < static_cast<double>(min) || d > static_cast<double>(max))
        return false;
    *out = static_cast<qint64>(d);
    return true;
}

bool readInt32(const QJsonObject& obj, const QString& key, int32_t* out)
{
    qint64 v = 0;
    if (!readInteger(obj.value(key), std::numeric_limits<int32_t>::min(),
                     std::numeric_limits<int32_t>::max(), &v))
        return false;
    *out = static_cast<int32_t>(v);
    return true;
}

// Absent means empty; any non-string type is malformed.
bool readString(const QJsonObject& obj, const QString& key, QString* out)
{
    const QJsonValue value = obj.value(key);
    if (value.isUndefined() || value.isNull()) {
        out->clear();
        return true;
    }
    if (!value.isString())
        return false;
    *out = value.toString();
    return true;
}

bool passesPolicy(const ngd::IStringPolicy& policy, const QString& field, const QString& raw,
                  const QJsonValue& id, QJsonObject* error)
{
    const ngd::StringValidation checked = policy.check(raw);
    if (checked.isAccepted())
        return true;

    QJsonArray positions;
    QJsonArray codePoints;
    for (const auto& violation : checked.violations()) {
        positions.append(violation.position);
        codePoints.append(static_cast<qint64>(violation.codePoint));
    }

    *error = errorReply(id, QStringLiteral("DisallowedCharacters"));
    (*error)["field"] = field;
    (*error)["positions"] = positions;
    (*error)["code_points"] = codePoints;

    BOOST_LOG_TRIVIAL(warning) << "ProxyServer: " << field.toStdString() << " has "
                               << checked.violations().size() << " disallowed code point(s)";
    return false;
}

} // namespace

ProxyServer::ProxyServer(ngd::NotificationSender* sender, QObject* parent)
    : QObject(parent)
    , sender_(sender)
    , policy_(&kAcceptAll)
{
    ngd::INotificationTransport* transport = sender_->transport();
    connect(transport, &ngd::INotificationTransport::notificationClosed,
            this, &ProxyServer::onNotificationClosed);
    connect(transport, &ngd::INotificationTransport::actionInvoked,
            this, &ProxyServer::onActionInvoked);
}

ProxyServer::~ProxyServer()
{
    stop();
}

bool ProxyServer::start(const QString& socketPath)
{
    if (server_) return false;

    // Remove stale socket file
    QFile::remove(socketPath);

    server_ = new QLocalServer(this);
    server_->setSocketOptions(QLocalServer::UserAccessOption);

    connect(server_, &QLocalServer::newConnection, this, &ProxyServer::onNewConnection);

    if (!server_->listen(socketPath)) {
        BOOST_LOG_TRIVIAL(error) << "ProxyServer: failed to listen on " << socketPath.toStdString()
                                 << ": " << server_->errorString().toStdString();
        delete server_;
        server_ = nullptr;
        return false;
    }

    BOOST_LOG_TRIVIAL(info) << "ProxyServer: listening on " << socketPath.toStdString();
    return true;
}

void ProxyServer::stop()
{
    // Client sockets are children of server_ and go away with it
    for (auto it = buffers_.constBegin(); it != buffers_.constEnd(); ++it)
        disconnect(it.key(), nullptr, this, nullptr);
    buffers_.clear();

    if (server_) {
        server_->close();
        delete server_;
        server_ = nullptr;
    }
}

bool ProxyServer::isListening() const
{
    return server_ && server_->isListening();
}

int ProxyServer::clientCount() const
{
    return buffers_.size();
}

void ProxyServer::setStringPolicy(const ngd::IStringPolicy* policy)
{
    policy_ = policy ? policy : &kAcceptAll;
}

void ProxyServer::setMaxRequestBytes(int bytes)
{
    maxRequestBytes_ = bytes;
}

void ProxyServer::setForwardEvents(bool enabled)
{
    forwardEvents_ = enabled;
}

void ProxyServer::onNewConnection()
{
    while (auto* socket = server_->nextPendingConnection()) {
        buffers_.insert(socket, QByteArray());
        connect(socket, &QLocalSocket::readyRead, this, &ProxyServer::onReadyRead);
        connect(socket, &QLocalSocket::disconnected, this, &ProxyServer::onDisconnected);
    }
}

void ProxyServer::onReadyRead()
{
    auto* socket = qobject_cast<QLocalSocket*>(sender());
    if (!socket) return;

    auto it = buffers_.find(socket);
    if (it == buffers_.end()) return;

    // A synchronous reply can fail the write and drop the client from
    // buffers_, so the pending bytes are worked on outside the hash.
    QByteArray pending = it.value() + socket->readAll();
    it.value().clear();

    QPointer<QLocalSocket> target(socket);
    const Reply reply = [target](const QJsonObject& message) {
        if (target)
            writeLine(target, message);
    };

    int start = 0;
    while (true) {
        const int idx = pending.indexOf('\n', start);
        if (idx < 0) break;
        const QByteArray line = pending.mid(start, idx - start);
        start = idx + 1;
        if (line.trimmed().isEmpty())
            continue;
        handleRequest(line, reply);
        if (!target || !buffers_.contains(socket))
            return;
    }
    pending.remove(0, start);

    if (pending.size() > maxRequestBytes_) {
        BOOST_LOG_TRIVIAL(warning) << "ProxyServer: request exceeds " << maxRequestBytes_
                                   << " bytes, dropping client";
        writeLine(socket, errorReply(QJsonValue::Undefined, QStringLiteral("RequestTooLarge")));
        if (target && buffers_.contains(socket))
            socket->disconnectFromServer();
        return;
    }

    buffers_[socket] = pending;
}

void ProxyServer::onDisconnected()
{
    auto* socket = qobject_cast<QLocalSocket*>(sender());
    if (!socket) return;
    buffers_.remove(socket);
    socket->deleteLater();
}

void ProxyServer::writeLine(QLocalSocket* socket, const QJsonObject& message)
{
    if (socket->state() != QLocalSocket::ConnectedState)
        return;
    socket->write(QJsonDocument(message).toJson(QJsonDocument::Compact) + "\n");
    socket->flush();
}

void ProxyServer::handleRequest(const QByteArray& line, const Reply& reply)
{
    if (line.size() > maxRequestBytes_) {
        reply(errorReply(QJsonValue::Undefined, QStringLiteral("RequestTooLarge")));
        return;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(line, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        BOOST_LOG_TRIVIAL(warning) << "ProxyServer: malformed request line";
        reply(errorReply(QJsonValue::Undefined, kInvalidRequest));
        return;
    }

    const QJsonObject request = doc.object();
    const QJsonValue id = request.value("id");
    const QString command = request.value("command").toString();

    if (command == QLatin1String("notify"))
        handleNotify(request, id, reply);
    else if (command == QLatin1String("close"))
        handleClose(request, id, reply);
    else if (command == QLatin1String("capabilities"))
        handleCapabilities(id, reply);
    else if (command == QLatin1String("server_info"))
        handleServerInfo(id, reply);
    else
        reply(errorReply(id, QStringLiteral("UnknownCommand")));
}

void ProxyServer::handleNotify(const QJsonObject& request, const QJsonValue& id, const Reply& reply)
{
    // --- JSON shape ---
    QString summary;
    QString body;
    if (!readString(request, "summary", &summary) || !readString(request, "body", &body)) {
        reply(errorReply(id, kInvalidRequest));
        return;
    }

    QStringList actions;
    const QJsonValue actionsValue = request.value("actions");
    if (!actionsValue.isUndefined() && !actionsValue.isNull()) {
        if (!actionsValue.isArray()) {
            reply(errorReply(id, kInvalidRequest));
            return;
        }
        for (const QJsonValue& action : actionsValue.toArray()) {
            if (!action.isString()) {
                reply(errorReply(id, kInvalidRequest));
                return;
            }
            actions.append(action.toString());
        }
    }

    std::optional<ngd::Urgency> urgency;
    const QJsonValue urgencyValue = request.value("urgency");
    if (!urgencyValue.isUndefined() && !urgencyValue.isNull()) {
        ngd::Urgency parsed;
        if (!urgencyValue.isString() || !ngd::urgencyFromName(urgencyValue.toString(), &parsed)) {
            reply(errorReply(id, kInvalidRequest));
            return;
        }
        urgency = parsed;
    }

    qint64 replacesId = 0;
    const QJsonValue replacesValue = request.value("replaces_id");
    if (!replacesValue.isUndefined()
        && !readInteger(replacesValue, 0, std::numeric_limits<uint32_t>::max(), &replacesId)) {
        reply(errorReply(id, kInvalidRequest));
        return;
    }

    int32_t expireTimeout = -1;
    if (request.contains("expire_timeout") && !readInt32(request, "expire_timeout", &expireTimeout)) {
        reply(errorReply(id, kInvalidRequest));
        return;
    }

    // --- Icon ---
    const QJsonValue iconValue = request.value("icon");
    if (!iconValue.isUndefined() && !iconValue.isNull()) {
        if (!iconValue.isObject()) {
            reply(errorReply(id, kInvalidRequest));
            return;
        }
        const QJsonObject icon = iconValue.toObject();
        int32_t width = 0, height = 0, rowStride = 0, bitsPerSample = 0, channels = 0;
        const QJsonValue hasAlpha = icon.value("has_alpha");
        const QJsonValue data = icon.value("data");
        if (!readInt32(icon, "width", &width) || !readInt32(icon, "height", &height)
            || !readInt32(icon, "rowstride", &rowStride)
            || !readInt32(icon, "bits_per_sample", &bitsPerSample)
            || !readInt32(icon, "channels", &channels)
            || !hasAlpha.isBool() || !data.isString()) {
            reply(errorReply(id, kInvalidRequest));
            return;
        }

        auto decoded = QByteArray::fromBase64Encoding(data.toString().toLatin1(),
                                                      QByteArray::AbortOnBase64DecodingErrors);
        if (!decoded) {
            reply(errorReply(id, kInvalidRequest));
            return;
        }

        const ngd::ImageValidation image = ngd::ImageSanitizer::validate(
            width, height, rowStride, hasAlpha.toBool(), bitsPerSample, channels,
            std::move(decoded.decoded));
        if (!image.isValid()) {
            BOOST_LOG_TRIVIAL(warning) << "ProxyServer: icon rejected ("
                                       << ngd::rejectionName(image.reason()) << ")";
            reply(errorReply(id, QString::fromLatin1(ngd::rejectionName(image.reason()))));
            return;
        }
        // Validated icons are not forwarded yet; the request keeps the empty icon.
    }

    // --- Text policy ---
    QJsonObject policyError;
    if (!passesPolicy(*policy_, QStringLiteral("summary"), summary, id, &policyError)
        || !passesPolicy(*policy_, QStringLiteral("body"), body, id, &policyError)) {
        reply(policyError);
        return;
    }
    ngd::TrustedStringList trustedActions;
    trustedActions.reserve(actions.size());
    for (const QString& action : actions) {
        if (!passesPolicy(*policy_, QStringLiteral("actions"), action, id, &policyError)) {
            reply(policyError);
            return;
        }
        trustedActions.append(ngd::TrustedString::mark(action));
    }

    // --- Build and send ---
    const ngd::SendResult sent = sender_->send(
        static_cast<uint32_t>(replacesId),
        ngd::TrustedString::mark(summary),
        ngd::TrustedString::mark(body),
        trustedActions,
        urgency,
        expireTimeout,
        [id, reply](const ngd::TransportError& error, uint32_t notificationId) {
            if (error.isSet()) {
                reply(transportErrorReply(id, error));
                return;
            }
            QJsonObject success = makeReply(id);
            success["result"] = static_cast<qint64>(notificationId);
            reply(success);
        });

    if (!sent.isValid())
        reply(errorReply(id, QString::fromLatin1(ngd::rejectionName(sent.reason()))));
}

void ProxyServer::handleClose(const QJsonObject& request, const QJsonValue& id, const Reply& reply)
{
    qint64 notificationId = 0;
    if (!readInteger(request.value("notification_id"), 0, std::numeric_limits<uint32_t>::max(),
                     &notificationId)) {
        reply(errorReply(id, kInvalidRequest));
        return;
    }

    sender_->transport()->closeNotification(
        static_cast<uint32_t>(notificationId),
        [id, reply](const ngd::TransportError& error) {
            if (error.isSet()) {
                reply(transportErrorReply(id, error));
                return;
            }
            QJsonObject success = makeReply(id);
            success["result"] = true;
            reply(success);
        });
}

void ProxyServer::handleCapabilities(const QJsonValue& id, const Reply& reply)
{
    sender_->transport()->getCapabilities(
        [id, reply](const ngd::TransportError& error, const QStringList& capabilities) {
            if (error.isSet()) {
                reply(transportErrorReply(id, error));
                return;
            }
            QJsonObject success = makeReply(id);
            success["result"] = QJsonArray::fromStringList(capabilities);
            reply(success);
        });
}

void ProxyServer::handleServerInfo(const QJsonValue& id, const Reply& reply)
{
    sender_->transport()->getServerInformation(
        [id, reply](const ngd::TransportError& error, const ngd::ServerInformation& info) {
            if (error.isSet()) {
                reply(transportErrorReply(id, error));
                return;
            }
            QJsonObject result;
            result["name"] = info.name;
            result["vendor"] = info.vendor;
            result["version"] = info.version;
            result["spec_version"] = info.specVersion;
            QJsonObject success = makeReply(id);
            success["result"] = result;
            reply(success);
        });
}

void ProxyServer::onNotificationClosed(uint notificationId, uint reason)
{
    QJsonObject event;
    event["event"] = QStringLiteral("closed");
    event["notification_id"] = static_cast<qint64>(notificationId);
    event["reason"] = static_cast<qint64>(reason);
    broadcast(event);
}

void ProxyServer::onActionInvoked(uint notificationId, const QString& actionKey)
{
    QJsonObject event;
    event["event"] = QStringLiteral("action");
    event["notification_id"] = static_cast<qint64>(notificationId);
    event["action_key"] = actionKey;
    broadcast(event);
}

void ProxyServer::broadcast(const QJsonObject& event)
{
    if (!forwardEvents_)
        return;
    // Writing can drop a client, so walk a snapshot
    const QList<QLocalSocket*> sockets = buffers_.keys();
    for (QLocalSocket* socket : sockets) {
        if (buffers_.contains(socket))
            writeLine(socket, event);
    }
    emit eventForwarded(event);
}

} // namespace ngp
