#include "logger/logger.hpp"
#include <iostream>
#include <stdexcept>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace blobnet {
namespace logging {

namespace {
constexpr std::size_t LOG_ROTATION_BYTES = 10 * 1024 * 1024;
}

boost::log::trivial::severity_level parse_severity(const std::string& name) {
  using boost::log::trivial::severity_level;

  if (name == "trace")   return severity_level::trace;
  if (name == "debug")   return severity_level::debug;
  if (name == "info")    return severity_level::info;
  if (name == "warning") return severity_level::warning;
  if (name == "error")   return severity_level::error;
  if (name == "fatal")   return severity_level::fatal;
  throw std::invalid_argument("unknown log level: " + name);
}

void init(const std::string& log_file, boost::log::trivial::severity_level level) {
  namespace bl = boost::log;
  namespace keywords = boost::log::keywords;
  namespace expr = boost::log::expressions;

  bl::core::get()->remove_all_sinks();
  bl::add_common_attributes();

  auto format = (
    expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%H:%M:%S.%f")
      << " [" << bl::trivial::severity << "]"
      << " [" << expr::attr<bl::attributes::current_thread_id::value_type>("ThreadID") << "]"
      << " " << expr::smessage
  );

  if (log_file.empty()) {
    bl::add_console_log(
      std::clog,
      keywords::format = format,
      keywords::auto_flush = true
    );
  } else {
    bl::add_file_log(
      keywords::file_name = log_file,
      keywords::format = format,
      keywords::rotation_size = LOG_ROTATION_BYTES,
      keywords::open_mode = std::ios_base::app,
      keywords::auto_flush = true
    );
  }

  bl::core::get()->set_filter(bl::trivial::severity >= level);
}

} // namespace logging
} // namespace blobnet
