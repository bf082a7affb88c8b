#pragma once

#include <utility>

namespace ngd {

/// Why a field was refused at the trust boundary.
/// Each value names exactly one failed check so callers can log precisely.
enum class RejectionReason {
    GeometryTooSmall,
    PayloadTooLarge,
    UnsupportedSampleDepth,
    ChannelCountMismatch,
    DimensionTooLarge,
    BufferTooSmallForHeight,
    RowStrideTooSmallForWidth,
    UnsupportedTimeout
};

/// Stable identifier for a reason ("GeometryTooSmall", ...). Used in logs and
/// in replies to untrusted clients.
const char* rejectionName(RejectionReason reason);

/// Either a validated value or the reason it was refused.
/// A rejected result holds a default-constructed value that must not be used.
template <typename T>
class Validated {
public:
    static Validated accept(T value)
    {
        Validated v;
        v.valid_ = true;
        v.value_ = std::move(value);
        return v;
    }

    static Validated reject(RejectionReason reason)
    {
        Validated v;
        v.reason_ = reason;
        return v;
    }

    bool isValid() const { return valid_; }
    RejectionReason reason() const { return reason_; }
    const T& value() const { return value_; }
    T take() { return std::move(value_); }

    bool operator==(const Validated& other) const
    {
        if (valid_ != other.valid_)
            return false;
        return valid_ ? value_ == other.value_ : reason_ == other.reason_;
    }

private:
    Validated() = default;

    bool valid_ = false;
    RejectionReason reason_ = RejectionReason::GeometryTooSmall;
    T value_{};
};

} // namespace ngd
