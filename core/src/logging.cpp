#include "logging.hpp"

#include <algorithm>
#include <cstdlib>
#include <mutex>
#include <optional>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace hvctl {

static std::optional<spdlog::level::level_enum>
parse_level(const std::string &level) {
  std::string lvl = level;
  std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::tolower);
  if (lvl == "debug")
    return spdlog::level::debug;
  else if (lvl == "info")
    return spdlog::level::info;
  else if (lvl == "warn" || lvl == "warning")
    return spdlog::level::warn;
  else if (lvl == "error")
    return spdlog::level::err;
  else if (lvl == "critical")
    return spdlog::level::critical;
  else
    return std::nullopt;
}

std::shared_ptr<spdlog::logger> get_logger() {
  static std::once_flag once;
  static std::shared_ptr<spdlog::logger> logger = nullptr;

  std::call_once(once, [] {
    logger = spdlog::get("HVCTL");
    if (!logger)
      logger = spdlog::stdout_color_mt("HVCTL");

    const char *env = std::getenv("HVCTL_LOG_LEVEL");
    if (env) {
      auto lvl = parse_level(env);
      if (lvl.has_value())
        logger->set_level(lvl.value());
      else
        logger->warn("Unknown log level: {}", env);
    }
  });

  return logger;
}

void set_log_level(const std::string &level) {
  auto lvl = parse_level(level);
  if (lvl.has_value())
    get_logger()->set_level(lvl.value());
  else
    get_logger()->warn("Unknown log level: {}", level);
}

void set_log_format(const std::string &fmt) { get_logger()->set_pattern(fmt); }

void debug(const std::string &msg) { get_logger()->debug(msg); }

void info(const std::string &msg) { get_logger()->info(msg); }

void warn(const std::string &msg) { get_logger()->warn(msg); }

void error(const std::string &msg) { get_logger()->error(msg); }

void critical(const std::string &msg) { get_logger()->critical(msg); }

} // namespace hvctl
