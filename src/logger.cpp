#include "logger.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

static const char* kLoggerName = "cmdpal";

std::shared_ptr<spdlog::logger> cmdpal_log() {
  auto lg = spdlog::get(kLoggerName);
  if (!lg) {
    lg = spdlog::stderr_color_mt(kLoggerName);
    lg->set_level(spdlog::level::warn);
  }
  return lg;
}

bool init_file_logging(const std::string& path, std::string& msg) {
  auto level = cmdpal_log()->level();
  try {
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
    spdlog::drop(kLoggerName);
    auto lg = std::make_shared<spdlog::logger>(kLoggerName, sink);
    lg->set_level(level);
    lg->flush_on(spdlog::level::warn);
    spdlog::register_logger(lg);
  } catch (const spdlog::spdlog_ex& e) {
    msg = std::string("can not open log file: ") + path + " (" + e.what() + ")";
    return false;
  }
  msg = std::string("logging to ") + path;
  return true;
}

bool set_log_level(const std::string& level) {
  auto lv = spdlog::level::from_str(level);
  // from_str maps unknown names to off; only accept "off" when asked for it
  if (lv == spdlog::level::off && level != "off") return false;
  cmdpal_log()->set_level(lv);
  return true;
}
