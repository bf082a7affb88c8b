#pragma once

#include <ngd/Request/NotificationRequest.hpp>
#include <ngd/Request/Rejection.hpp>
#include <ngd/Request/Urgency.hpp>
#include <ngd/Text/TrustedString.hpp>
#include <cstdint>
#include <optional>

namespace ngd {

using BuildResult = Validated<NotificationRequest>;

/// Assembles trusted fields into a NotificationRequest. Performs no I/O.
class RequestBuilder {
public:
    static constexpr int32_t SERVER_DEFAULT_TIMEOUT = -1;
    static constexpr const char* URGENCY_HINT = "urgency";

    /// Application name and icon are fixed empty placeholders. The only hint
    /// ever set is "urgency" (a byte), and only when urgency is given.
    /// replacesId is forwarded as-is; the server owns its meaning.
    static BuildResult build(uint32_t replacesId,
                             TrustedString summary,
                             TrustedString body,
                             const TrustedStringList& actions,
                             std::optional<Urgency> urgency,
                             int32_t expireTimeoutMillis);
};

} // namespace ngd
