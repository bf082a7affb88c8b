#include <ngd/Request/Urgency.hpp>

namespace ngd {

uint8_t urgencyCode(Urgency urgency)
{
    // No default: a new Urgency value must get a wire code here (-Werror=switch).
    switch (urgency) {
    case Urgency::Low:      return 0;
    case Urgency::Normal:   return 1;
    case Urgency::Critical: return 2;
    }
    return 1;
}

bool urgencyFromName(const QString& name, Urgency* out)
{
    Urgency parsed;
    if (name == QLatin1String("low"))
        parsed = Urgency::Low;
    else if (name == QLatin1String("normal"))
        parsed = Urgency::Normal;
    else if (name == QLatin1String("critical"))
        parsed = Urgency::Critical;
    else
        return false;

    if (out)
        *out = parsed;
    return true;
}

} // namespace ngd
