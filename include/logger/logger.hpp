#ifndef ARCHIVER_LOGGER_HPP
#define ARCHIVER_LOGGER_HPP

#include <optional>
#include <string>
#include <boost/log/trivial.hpp>

namespace archiver {
namespace logger {

using severity_level = boost::log::trivial::severity_level;

// Parses trace|debug|info|warning|error|fatal
std::optional<severity_level> parse_severity(const std::string& name);

// Installs a console sink, plus a rotating file sink when log_file is not empty.
// Replaces any sinks installed before.
void init_logging(severity_level min_level = boost::log::trivial::info,
                  const std::string& log_file = "");

} // namespace logger
} // namespace archiver

#endif // ARCHIVER_LOGGER_HPP
