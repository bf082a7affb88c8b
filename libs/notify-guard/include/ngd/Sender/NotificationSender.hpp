#pragma once

#include <ngd/Request/RequestBuilder.hpp>
#include <ngd/Transport/INotificationTransport.hpp>
#include <QObject>
#include <optional>

namespace ngd {

using SendResult = Validated<INotificationTransport::CallHandle>;

/// Send path: validate, then hand off to the transport.
///
/// A rejected request is reported synchronously and never reaches the
/// transport. Transport errors arrive through the callback exactly as the
/// transport reported them; nothing is retried.
class NotificationSender : public QObject {
    Q_OBJECT
public:
    explicit NotificationSender(INotificationTransport* transport, QObject* parent = nullptr);

    SendResult send(uint32_t replacesId,
                    TrustedString summary,
                    TrustedString body,
                    const TrustedStringList& actions,
                    std::optional<Urgency> urgency,
                    int32_t expireTimeoutMillis,
                    INotificationTransport::NotifyCallback done);

    /// Drops the reply of an in-flight send; done will not be called.
    void cancel(INotificationTransport::CallHandle handle);

    INotificationTransport* transport() const { return transport_; }

private:
    INotificationTransport* transport_ = nullptr;
};

} // namespace ngd
