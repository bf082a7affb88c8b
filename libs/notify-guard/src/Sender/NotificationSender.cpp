#include <ngd/Sender/NotificationSender.hpp>
#include <boost/log/trivial.hpp>
#include <utility>

namespace ngd {

NotificationSender::NotificationSender(INotificationTransport* transport, QObject* parent)
    : QObject(parent)
    , transport_(transport)
{
}

SendResult NotificationSender::send(uint32_t replacesId,
                                    TrustedString summary,
                                    TrustedString body,
                                    const TrustedStringList& actions,
                                    std::optional<Urgency> urgency,
                                    int32_t expireTimeoutMillis,
                                    INotificationTransport::NotifyCallback done)
{
    BuildResult built = RequestBuilder::build(replacesId, std::move(summary), std::move(body),
                                              actions, urgency, expireTimeoutMillis);
    if (!built.isValid()) {
        BOOST_LOG_TRIVIAL(warning) << "NotificationSender: request rejected ("
                                   << rejectionName(built.reason()) << ")";
        return SendResult::reject(built.reason());
    }

    const NotificationRequest& request = built.value();
    BOOST_LOG_TRIVIAL(debug) << "NotificationSender: sending summary=" << request.summary().size()
                             << " chars, body=" << request.body().size()
                             << " chars, actions=" << request.actions().size()
                             << ", hints=" << request.hints().size();

    return SendResult::accept(transport_->notify(request, std::move(done)));
}

void NotificationSender::cancel(INotificationTransport::CallHandle handle)
{
    transport_->cancel(handle);
}

} // namespace ngd
