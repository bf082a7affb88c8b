#include <ngd/Request/NotificationRequest.hpp>

namespace ngd {

bool NotificationRequest::operator==(const NotificationRequest& other) const
{
    return applicationName_ == other.applicationName_
        && replacesId_ == other.replacesId_
        && icon_ == other.icon_
        && summary_ == other.summary_
        && body_ == other.body_
        && actions_ == other.actions_
        && hints_ == other.hints_
        && expireTimeoutMillis_ == other.expireTimeoutMillis_;
}

} // namespace ngd
