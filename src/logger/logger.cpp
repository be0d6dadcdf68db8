#include "logger/logger.hpp"
#include <iostream>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>

namespace archiver {
namespace logger {

std::optional<severity_level> parse_severity(const std::string& name) {
  severity_level level;
  if (boost::log::trivial::from_string(name.c_str(), name.size(), level)) {
    return level;
  }
  return std::nullopt;
}

void init_logging(severity_level min_level, const std::string& log_file) {
  namespace logging = boost::log;
  namespace keywords = boost::log::keywords;
  namespace expr = boost::log::expressions;

  // Remove any existing sinks to prevent duplicates
  logging::core::get()->remove_all_sinks();

  logging::register_simple_formatter_factory<logging::trivial::severity_level, char>("Severity");
  logging::add_console_log(
    std::clog,
    keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%",
    keywords::auto_flush = true
  );

  if (!log_file.empty()) {
    logging::add_file_log(
      keywords::file_name = log_file,
      keywords::open_mode = std::ios::out | std::ios::app,
      keywords::format = (
        expr::stream
          << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
          << " [" << logging::trivial::severity << "]"
          << " [Thread " << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
          << " " << expr::smessage
      ),
      keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
      keywords::auto_flush = true
    );
  }

  logging::core::get()->set_filter(logging::trivial::severity >= min_level);
  logging::add_common_attributes();

  BOOST_LOG_TRIVIAL(debug) << "Logger: Logging initialized"
                           << (log_file.empty() ? std::string() : " with file: " + log_file);
}

} // namespace logger
} // namespace archiver
