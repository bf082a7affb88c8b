#pragma once

#include <ngd/Transport/INotificationTransport.hpp>
#include <QList>
#include <QMap>

namespace ngd {

/// In-memory transport. Records outbound calls and lets the owner decide
/// when and how each one completes.
class ReplayNotificationTransport : public INotificationTransport {
    Q_OBJECT
public:
    explicit ReplayNotificationTransport(QObject* parent = nullptr);
    ~ReplayNotificationTransport() override;

    // INotificationTransport interface
    CallHandle notify(const NotificationRequest& request, NotifyCallback callback) override;
    void cancel(CallHandle handle) override;
    void closeNotification(uint32_t notificationId, DoneCallback callback) override;
    void getCapabilities(CapabilitiesCallback callback) override;
    void getServerInformation(ServerInformationCallback callback) override;

    // Test API
    QList<NotificationRequest> sentRequests() const;
    QList<uint32_t> closedIds() const;
    int pendingCount() const;
    /// Forgets recorded notify() and closeNotification() calls.
    void clearRecorded();

    /// Completes the oldest pending notify() with the given id.
    /// Returns false when nothing is pending.
    bool completeNext(uint32_t notificationId);
    /// Fails the oldest pending notify() with the given D-Bus error.
    bool failNext(const QString& errorName, const QString& errorMessage = {});

    void setCapabilities(const QStringList& capabilities);
    void setServerInformation(const ServerInformation& info);
    /// When set, every query and close fails with this error.
    void setQueryError(const TransportError& error);

    void simulateClosed(uint32_t notificationId, uint32_t reason);
    void simulateAction(uint32_t notificationId, const QString& actionKey);

private:
    QList<NotificationRequest> sent_;
    QList<uint32_t> closed_;
    QMap<CallHandle, NotifyCallback> pending_;
    CallHandle nextHandle_ = 1;
    QStringList capabilities_;
    ServerInformation serverInfo_;
    TransportError queryError_;
};

} // namespace ngd
