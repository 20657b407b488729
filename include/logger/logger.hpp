#ifndef SFT_LOGGER_HPP
#define SFT_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace sft {
namespace logger {

using severity_level = boost::log::trivial::severity_level;

// Installs a single sink: console when log_file is empty, otherwise a file
// truncated on startup. Records below min_level are dropped.
void init_logging(const std::string& log_file = "",
                  severity_level min_level = boost::log::trivial::info);

// Maps trace|debug|info|warning|error|fatal, throws std::invalid_argument otherwise
severity_level parse_severity(const std::string& text);

} // namespace logger
} // namespace sft

#endif // SFT_LOGGER_HPP
