#include <ngd/Request/RequestBuilder.hpp>
#include <boost/log/trivial.hpp>
#include <QVariant>
#include <utility>

namespace ngd {

BuildResult RequestBuilder::build(uint32_t replacesId,
                                  TrustedString summary,
                                  TrustedString body,
                                  const TrustedStringList& actions,
                                  std::optional<Urgency> urgency,
                                  int32_t expireTimeoutMillis)
{
    if (expireTimeoutMillis < SERVER_DEFAULT_TIMEOUT) {
        BOOST_LOG_TRIVIAL(debug) << "RequestBuilder: expire timeout " << expireTimeoutMillis
                                 << " out of range";
        return BuildResult::reject(RejectionReason::UnsupportedTimeout);
    }

    NotificationRequest request;

    // Placeholders until per-caller names and icons can be validated.
    request.applicationName_ = QString();
    request.icon_ = QString();

    request.replacesId_ = replacesId;
    request.summary_ = summary.inner();
    request.body_ = body.inner();

    request.actions_.reserve(actions.size());
    for (const auto& action : actions)
        request.actions_.append(action.inner());

    if (urgency) {
        request.hints_.insert(QString::fromLatin1(URGENCY_HINT),
                              QVariant::fromValue<uchar>(urgencyCode(*urgency)));
    }

    request.expireTimeoutMillis_ = expireTimeoutMillis;
    return BuildResult::accept(std::move(request));
}

} // namespace ngd
