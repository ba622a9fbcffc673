#ifndef BUCKETD_LOGGER_HPP
#define BUCKETD_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace bucketd {
namespace logging {

using severity_level = boost::log::trivial::severity_level;

// Installs a single sink on the Boost.Log core. An empty file name logs to the console.
void init_logging(const std::string& log_file = "",
                  severity_level min_level = boost::log::trivial::info);

// Replaces the core severity filter
void set_log_level(severity_level min_level);

void enable_logging();
void disable_logging();

// Parses "trace", "debug", "info", "warning", "error" or "fatal".
// Throws std::invalid_argument for anything else
severity_level parse_severity(const std::string& name);

} // namespace logging
} // namespace bucketd

#endif // BUCKETD_LOGGER_HPP
