#ifndef NETFS_LOGGER_HPP
#define NETFS_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace netfs {
namespace logging {

// Installs the rotating file sink (and optionally a console sink) plus
// timestamp and thread id attributes. Safe to call more than once, the
// previous sinks are replaced.
void init_logging(const std::string& log_file,
                  boost::log::trivial::severity_level min_level = boost::log::trivial::info,
                  bool console = false);

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
bool parse_severity(const std::string& text, boost::log::trivial::severity_level& level);

} // namespace logging
} // namespace netfs

#endif // NETFS_LOGGER_HPP
