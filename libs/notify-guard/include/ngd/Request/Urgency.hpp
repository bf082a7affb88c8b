#pragma once

#include <QString>
#include <cstdint>

namespace ngd {

enum class Urgency : uint8_t {
    Low,
    Normal,
    Critical
};

/// Wire code for the "urgency" hint (Low=0, Normal=1, Critical=2).
uint8_t urgencyCode(Urgency urgency);

/// "low", "normal", "critical". Returns false for anything else and leaves
/// out untouched.
bool urgencyFromName(const QString& name, Urgency* out);

} // namespace ngd
