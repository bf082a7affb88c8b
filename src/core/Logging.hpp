#pragma once

#include <QString>

namespace ngp {

/// Sets the Boost.Log severity threshold from a config name
/// ("trace", "debug", "info", "warning", "error", "fatal").
/// Unknown names leave the filter at "info" and return false.
bool applyLogLevel(const QString& level);

} // namespace ngp
