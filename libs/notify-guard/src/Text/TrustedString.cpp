#include <ngd/Text/TrustedString.hpp>
#include <utility>

namespace ngd {

TrustedString::TrustedString(QString text)
    : text_(std::move(text))
{
}

TrustedString TrustedString::mark(QString raw)
{
    // No content rule is enforced here. Which characters the display layer
    // must never see is decided by the IStringPolicy the caller applies.
    return TrustedString(std::move(raw));
}

} // namespace ngd
