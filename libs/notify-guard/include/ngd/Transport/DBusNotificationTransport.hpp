#pragma once

#include <ngd/Transport/INotificationTransport.hpp>
#include <QDBusConnection>
#include <QHash>

class QDBusInterface;
class QDBusPendingCallWatcher;

namespace ngd {

struct DBusEndpoint {
    QString service = QStringLiteral("org.freedesktop.Notifications");
    QString path = QStringLiteral("/org/freedesktop/Notifications");
    QString interface = QStringLiteral("org.freedesktop.Notifications");
    bool systemBus = false;
    int callTimeoutMs = 25000;
};

/// org.freedesktop.Notifications client over Qt D-Bus.
class DBusNotificationTransport : public INotificationTransport {
    Q_OBJECT
public:
    explicit DBusNotificationTransport(const DBusEndpoint& endpoint = {}, QObject* parent = nullptr);
    ~DBusNotificationTransport() override;

    bool isConnected() const;

    CallHandle notify(const NotificationRequest& request, NotifyCallback callback) override;
    void cancel(CallHandle handle) override;
    void closeNotification(uint32_t notificationId, DoneCallback callback) override;
    void getCapabilities(CapabilitiesCallback callback) override;
    void getServerInformation(ServerInformationCallback callback) override;

private slots:
    void onNotificationClosed(uint notificationId, uint reason);
    void onActionInvoked(uint notificationId, const QString& actionKey);

private:
    QDBusConnection bus() const;

    DBusEndpoint endpoint_;
    QDBusInterface* iface_ = nullptr;
    QHash<CallHandle, QDBusPendingCallWatcher*> pending_;
    CallHandle nextHandle_ = 1;
};

} // namespace ngd
