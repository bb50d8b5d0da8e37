#ifndef PASTEBOX_LOGGER_HPP
#define PASTEBOX_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <string>

namespace pastebox::logger {

using severity_level = boost::log::trivial::severity_level;

// Installs a synchronous file sink and sets the minimum severity
void init_logging(const std::string& log_file = "pastebox.log",
                  severity_level min_level = boost::log::trivial::info);

// Adjusts the minimum severity that reaches the sinks
void set_log_level(severity_level min_level);

void enable_logging();
void disable_logging();

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
bool parse_level(const std::string& name, severity_level& level);

} // namespace pastebox::logger

#endif // PASTEBOX_LOGGER_HPP
