#include <ngd/Request/Rejection.hpp>

namespace ngd {

const char* rejectionName(RejectionReason reason)
{
    switch (reason) {
    case RejectionReason::GeometryTooSmall:          return "GeometryTooSmall";
    case RejectionReason::PayloadTooLarge:           return "PayloadTooLarge";
    case RejectionReason::UnsupportedSampleDepth:    return "UnsupportedSampleDepth";
    case RejectionReason::ChannelCountMismatch:      return "ChannelCountMismatch";
    case RejectionReason::DimensionTooLarge:         return "DimensionTooLarge";
    case RejectionReason::BufferTooSmallForHeight:   return "BufferTooSmallForHeight";
    case RejectionReason::RowStrideTooSmallForWidth: return "RowStrideTooSmallForWidth";
    case RejectionReason::UnsupportedTimeout:        return "UnsupportedTimeout";
    }
    return "Unknown";
}

} // namespace ngd
