#ifndef VAULT_LOGGER_HPP
#define VAULT_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <string>

namespace vault::logging {

// Parses "trace", "debug", "info", "warning", "error" or "fatal".
// Throws std::invalid_argument for anything else.
boost::log::trivial::severity_level parse_severity(const std::string& name);

// Initialize logging system with a file sink and optional console sink
void init_logging(const std::string& log_file,
                  boost::log::trivial::severity_level min_level = boost::log::trivial::info,
                  bool console = false);

// Changes the severity filter of an initialized logging core
void set_log_level(boost::log::trivial::severity_level min_level);

} // namespace vault::logging

#endif // VAULT_LOGGER_HPP
