#include <ngd/Transport/ReplayNotificationTransport.hpp>

namespace ngd {

ReplayNotificationTransport::ReplayNotificationTransport(QObject* parent)
    : INotificationTransport(parent)
{
}

ReplayNotificationTransport::~ReplayNotificationTransport() = default;

INotificationTransport::CallHandle ReplayNotificationTransport::notify(const NotificationRequest& request,
                                                                       NotifyCallback callback)
{
    sent_.append(request);
    const CallHandle handle = nextHandle_++;
    pending_.insert(handle, std::move(callback));
    return handle;
}

void ReplayNotificationTransport::cancel(CallHandle handle)
{
    pending_.remove(handle);
}

void ReplayNotificationTransport::closeNotification(uint32_t notificationId, DoneCallback callback)
{
    closed_.append(notificationId);
    if (callback) callback(queryError_);
}

void ReplayNotificationTransport::getCapabilities(CapabilitiesCallback callback)
{
    if (!callback) return;
    if (queryError_.isSet())
        callback(queryError_, {});
    else
        callback(TransportError{}, capabilities_);
}

void ReplayNotificationTransport::getServerInformation(ServerInformationCallback callback)
{
    if (!callback) return;
    if (queryError_.isSet())
        callback(queryError_, {});
    else
        callback(TransportError{}, serverInfo_);
}

QList<NotificationRequest> ReplayNotificationTransport::sentRequests() const
{
    return sent_;
}

QList<uint32_t> ReplayNotificationTransport::closedIds() const
{
    return closed_;
}

int ReplayNotificationTransport::pendingCount() const
{
    return pending_.size();
}

void ReplayNotificationTransport::clearRecorded()
{
    sent_.clear();
    closed_.clear();
}

bool ReplayNotificationTransport::completeNext(uint32_t notificationId)
{
    if (pending_.isEmpty())
        return false;
    NotifyCallback callback = pending_.take(pending_.firstKey());
    if (callback) callback(TransportError{}, notificationId);
    return true;
}

bool ReplayNotificationTransport::failNext(const QString& errorName, const QString& errorMessage)
{
    if (pending_.isEmpty())
        return false;
    NotifyCallback callback = pending_.take(pending_.firstKey());
    if (callback) callback(TransportError{errorName, errorMessage}, 0);
    return true;
}

void ReplayNotificationTransport::setCapabilities(const QStringList& capabilities)
{
    capabilities_ = capabilities;
}

void ReplayNotificationTransport::setServerInformation(const ServerInformation& info)
{
    serverInfo_ = info;
}

void ReplayNotificationTransport::setQueryError(const TransportError& error)
{
    queryError_ = error;
}

void ReplayNotificationTransport::simulateClosed(uint32_t notificationId, uint32_t reason)
{
    emit notificationClosed(notificationId, reason);
}

void ReplayNotificationTransport::simulateAction(uint32_t notificationId, const QString& actionKey)
{
    emit actionInvoked(notificationId, actionKey);
}

} // namespace ngd
