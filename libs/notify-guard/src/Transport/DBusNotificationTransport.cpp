#include <ngd/Transport/DBusNotificationTransport.hpp>
#include <QDBusInterface>
#include <QDBusPendingCall>
#include <QDBusPendingCallWatcher>
#include <QDBusPendingReply>
#include <QVariant>
#include <boost/log/trivial.hpp>

namespace ngd {

namespace {

TransportError toTransportError(const QDBusError& error)
{
    return TransportError{error.name(), error.message()};
}

void logFailure(const char* method, const TransportError& error)
{
    BOOST_LOG_TRIVIAL(error) << "DBusNotificationTransport: " << method << " failed: "
                             << error.name.toStdString() << ": " << error.message.toStdString();
}

} // namespace

DBusNotificationTransport::DBusNotificationTransport(const DBusEndpoint& endpoint, QObject* parent)
    : INotificationTransport(parent)
    , endpoint_(endpoint)
{
    iface_ = new QDBusInterface(endpoint_.service, endpoint_.path, endpoint_.interface, bus(), this);
    iface_->setTimeout(endpoint_.callTimeoutMs);

    QDBusConnection connection = bus();
    if (!connection.connect(endpoint_.service, endpoint_.path, endpoint_.interface,
                            QStringLiteral("NotificationClosed"),
                            this, SLOT(onNotificationClosed(uint,uint)))) {
        BOOST_LOG_TRIVIAL(warning) << "DBusNotificationTransport: cannot subscribe to NotificationClosed";
    }
    if (!connection.connect(endpoint_.service, endpoint_.path, endpoint_.interface,
                            QStringLiteral("ActionInvoked"),
                            this, SLOT(onActionInvoked(uint,QString)))) {
        BOOST_LOG_TRIVIAL(warning) << "DBusNotificationTransport: cannot subscribe to ActionInvoked";
    }

    BOOST_LOG_TRIVIAL(info) << "DBusNotificationTransport: using "
                            << (endpoint_.systemBus ? "system" : "session") << " bus, "
                            << endpoint_.service.toStdString() << " " << endpoint_.path.toStdString();
}

DBusNotificationTransport::~DBusNotificationTransport() = default;

QDBusConnection DBusNotificationTransport::bus() const
{
    return endpoint_.systemBus ? QDBusConnection::systemBus() : QDBusConnection::sessionBus();
}

bool DBusNotificationTransport::isConnected() const
{
    return bus().isConnected();
}

INotificationTransport::CallHandle DBusNotificationTransport::notify(const NotificationRequest& request,
                                                                     NotifyCallback callback)
{
    // Notify(s app_name, u replaces_id, s app_icon, s summary, s body,
    //        as actions, a{sv} hints, i expire_timeout)
    QList<QVariant> args;
    args << request.applicationName()
         << QVariant::fromValue<uint>(request.replacesId())
         << request.icon()
         << request.summary()
         << request.body()
         << QVariant::fromValue(request.actions())
         << QVariant::fromValue(request.hints())
         << QVariant::fromValue<int>(request.expireTimeoutMillis());

    const CallHandle handle = nextHandle_++;
    QDBusPendingCall call = iface_->asyncCallWithArgumentList(QStringLiteral("Notify"), args);
    auto* watcher = new QDBusPendingCallWatcher(call, this);
    pending_.insert(handle, watcher);

    connect(watcher, &QDBusPendingCallWatcher::finished, this,
            [this, handle, watcher, callback = std::move(callback)]() {
        watcher->deleteLater();
        if (!pending_.remove(handle))
            return;  // cancelled

        QDBusPendingReply<uint> reply = *watcher;
        if (reply.isError()) {
            TransportError error = toTransportError(reply.error());
            logFailure("Notify", error);
            if (callback) callback(error, 0);
            return;
        }

        BOOST_LOG_TRIVIAL(debug) << "DBusNotificationTransport: Notify -> id " << reply.value();
        if (callback) callback(TransportError{}, reply.value());
    });

    return handle;
}

void DBusNotificationTransport::cancel(CallHandle handle)
{
    QDBusPendingCallWatcher* watcher = pending_.take(handle);
    if (!watcher)
        return;
    // The call itself is already on the bus; only the reply is discarded.
    watcher->disconnect(this);
    watcher->deleteLater();
    BOOST_LOG_TRIVIAL(debug) << "DBusNotificationTransport: cancelled call " << handle;
}

void DBusNotificationTransport::closeNotification(uint32_t notificationId, DoneCallback callback)
{
    QDBusPendingCall call = iface_->asyncCall(QStringLiteral("CloseNotification"),
                                              QVariant::fromValue<uint>(notificationId));
    auto* watcher = new QDBusPendingCallWatcher(call, this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this,
            [watcher, callback = std::move(callback)]() {
        watcher->deleteLater();
        QDBusPendingReply<> reply = *watcher;
        TransportError error;
        if (reply.isError()) {
            error = toTransportError(reply.error());
            logFailure("CloseNotification", error);
        }
        if (callback) callback(error);
    });
}

void DBusNotificationTransport::getCapabilities(CapabilitiesCallback callback)
{
    QDBusPendingCall call = iface_->asyncCall(QStringLiteral("GetCapabilities"));
    auto* watcher = new QDBusPendingCallWatcher(call, this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this,
            [watcher, callback = std::move(callback)]() {
        watcher->deleteLater();
        QDBusPendingReply<QStringList> reply = *watcher;
        if (reply.isError()) {
            TransportError error = toTransportError(reply.error());
            logFailure("GetCapabilities", error);
            if (callback) callback(error, {});
            return;
        }
        if (callback) callback(TransportError{}, reply.value());
    });
}

void DBusNotificationTransport::getServerInformation(ServerInformationCallback callback)
{
    QDBusPendingCall call = iface_->asyncCall(QStringLiteral("GetServerInformation"));
    auto* watcher = new QDBusPendingCallWatcher(call, this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this,
            [watcher, callback = std::move(callback)]() {
        watcher->deleteLater();
        QDBusPendingReply<QString, QString, QString, QString> reply = *watcher;
        if (reply.isError()) {
            TransportError error = toTransportError(reply.error());
            logFailure("GetServerInformation", error);
            if (callback) callback(error, {});
            return;
        }
        ServerInformation info;
        info.name = reply.argumentAt<0>();
        info.vendor = reply.argumentAt<1>();
        info.version = reply.argumentAt<2>();
        info.specVersion = reply.argumentAt<3>();
        if (callback) callback(TransportError{}, info);
    });
}

void DBusNotificationTransport::onNotificationClosed(uint notificationId, uint reason)
{
    emit notificationClosed(notificationId, reason);
}

void DBusNotificationTransport::onActionInvoked(uint notificationId, const QString& actionKey)
{
    emit actionInvoked(notificationId, actionKey);
}

} // namespace ngd
