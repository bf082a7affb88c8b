#include "core/Logging.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

namespace ngp {

namespace logging = boost::log;

bool applyLogLevel(const QString& level)
{
    logging::trivial::severity_level severity = logging::trivial::info;
    bool known = true;

    if (level == QLatin1String("trace")) severity = logging::trivial::trace;
    else if (level == QLatin1String("debug")) severity = logging::trivial::debug;
    else if (level == QLatin1String("info")) severity = logging::trivial::info;
    else if (level == QLatin1String("warning")) severity = logging::trivial::warning;
    else if (level == QLatin1String("error")) severity = logging::trivial::error;
    else if (level == QLatin1String("fatal")) severity = logging::trivial::fatal;
    else known = false;

    logging::core::get()->set_filter(logging::trivial::severity >= severity);

    if (!known) {
        BOOST_LOG_TRIVIAL(warning) << "Unknown log level '" << level.toStdString()
                                   << "', using info";
    }
    return known;
}

} // namespace ngp
