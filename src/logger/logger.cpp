#include "logger/logger.hpp"
#include <iostream>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace netfs {
namespace logging {

namespace blog = boost::log;
namespace keywords = boost::log::keywords;
namespace expr = boost::log::expressions;

void init_logging(const std::string& log_file, blog::trivial::severity_level min_level, bool console) {
  blog::core::get()->remove_all_sinks();
  blog::add_common_attributes();

  const auto format = (
    expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [" << blog::trivial::severity << "]"
      << " [Thread " << expr::attr<blog::attributes::current_thread_id::value_type>("ThreadID") << "]"
      << " " << expr::smessage
  );

  if (!log_file.empty()) {
    blog::add_file_log(
      keywords::file_name = log_file,
      keywords::format = format,
      keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
      keywords::open_mode = std::ios_base::app,
      keywords::auto_flush = true
    );
  }

  if (console) {
    blog::add_console_log(std::clog, keywords::format = format, keywords::auto_flush = true);
  }

  blog::core::get()->set_filter(blog::trivial::severity >= min_level);
  BOOST_LOG_TRIVIAL(debug) << "Logger: Initialized, file: " << (log_file.empty() ? "<none>" : log_file);
}

bool parse_severity(const std::string& text, blog::trivial::severity_level& level) {
  // from_string accepts exactly the names operator<< prints
  return blog::trivial::from_string(text.c_str(), text.size(), level);
}

} // namespace logging
} // namespace netfs
