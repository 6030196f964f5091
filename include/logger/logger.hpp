#ifndef BLOBNET_LOGGER_LOGGER_HPP
#define BLOBNET_LOGGER_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace blobnet {
namespace logging {

// Maps trace|debug|info|warning|error|fatal, throws std::invalid_argument otherwise
boost::log::trivial::severity_level parse_severity(const std::string& name);

// Installs the process-wide sink: the console when log_file is empty,
// otherwise a text file rotated every 10 MB. Records below level are dropped.
void init(const std::string& log_file, boost::log::trivial::severity_level level);

} // namespace logging
} // namespace blobnet

#endif // BLOBNET_LOGGER_LOGGER_HPP
