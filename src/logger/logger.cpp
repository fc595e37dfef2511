#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/make_shared.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace vault::logging {

namespace {

const auto& log_format() {
  namespace expr = boost::log::expressions;
  static const auto format = expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [" << boost::log::trivial::severity << "]"
      << " [" << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << "] "
      << expr::smessage;
  return format;
}

} // namespace

boost::log::trivial::severity_level parse_severity(const std::string& name) {
  if (name == "trace")   return boost::log::trivial::trace;
  if (name == "debug")   return boost::log::trivial::debug;
  if (name == "info")    return boost::log::trivial::info;
  if (name == "warning") return boost::log::trivial::warning;
  if (name == "error")   return boost::log::trivial::error;
  if (name == "fatal")   return boost::log::trivial::fatal;
  throw std::invalid_argument("Unknown log level: " + name);
}

void init_logging(const std::string& log_file,
                  boost::log::trivial::severity_level min_level,
                  bool console) {
  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();

    // Create and configure text file sink backend
    auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();

    std::filesystem::path log_path = std::filesystem::absolute(log_file);
    backend->set_file_name_pattern(log_path.string());
    backend->set_open_mode(std::ios::out | std::ios::app);
    backend->set_rotation_size(10 * 1024 * 1024);  // 10 MB
    backend->auto_flush(true);

    using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
    auto sink = boost::make_shared<text_sink>(backend);
    sink->set_formatter(log_format());
    boost::log::core::get()->add_sink(sink);

    if (console) {
      auto console_sink = boost::log::add_console_log(std::clog);
      console_sink->set_formatter(log_format());
    }

    boost::log::add_common_attributes();
    set_log_level(min_level);
    boost::log::core::get()->set_logging_enabled(true);

    BOOST_LOG_TRIVIAL(info) << "Logger: Logging initialized with file: " << log_path.string();
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void set_log_level(boost::log::trivial::severity_level min_level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

} // namespace vault::logging
