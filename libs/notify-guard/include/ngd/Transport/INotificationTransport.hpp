#pragma once

#include <ngd/Request/NotificationRequest.hpp>
#include <QObject>
#include <QString>
#include <QStringList>
#include <cstdint>
#include <functional>

namespace ngd {

/// Failure reported by the notification server or the bus. Passed through
/// unchanged; an empty name means success.
struct TransportError {
    QString name;       // e.g. "org.freedesktop.DBus.Error.ServiceUnknown"
    QString message;

    bool isSet() const { return !name.isEmpty(); }
};

struct ServerInformation {
    QString name;
    QString vendor;
    QString version;
    QString specVersion;
};

/// Delivers validated requests to the notification server.
///
/// All calls are asynchronous; callbacks run on the transport's thread once
/// the server answers. A cancelled call never invokes its callback.
class INotificationTransport : public QObject {
    Q_OBJECT
public:
    using CallHandle = quint64;
    using NotifyCallback = std::function<void(const TransportError& error, uint32_t notificationId)>;
    using DoneCallback = std::function<void(const TransportError& error)>;
    using CapabilitiesCallback = std::function<void(const TransportError& error, const QStringList& capabilities)>;
    using ServerInformationCallback = std::function<void(const TransportError& error, const ServerInformation& info)>;

    using QObject::QObject;
    ~INotificationTransport() override = default;

    virtual CallHandle notify(const NotificationRequest& request, NotifyCallback callback) = 0;
    virtual void cancel(CallHandle handle) = 0;
    virtual void closeNotification(uint32_t notificationId, DoneCallback callback) = 0;
    virtual void getCapabilities(CapabilitiesCallback callback) = 0;
    virtual void getServerInformation(ServerInformationCallback callback) = 0;

signals:
    void notificationClosed(uint notificationId, uint reason);
    void actionInvoked(uint notificationId, const QString& actionKey);
};

} // namespace ngd
