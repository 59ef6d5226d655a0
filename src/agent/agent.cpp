// Framework initialization
#include "agent/agent.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace relay {

void init(const Config &config) {
  // stdout carries turn events, logs go to stderr
  auto logger = spdlog::get(config.app_name);
  if (!logger) {
    logger = spdlog::stderr_color_mt(config.app_name);
  }
  spdlog::set_default_logger(logger);

  auto level = spdlog::level::from_str(config.log_level);
  if (level == spdlog::level::off && config.log_level != "off") {
    spdlog::warn("Unknown log level '{}', using info", config.log_level);
    level = spdlog::level::info;
  }
  spdlog::set_level(level);
}

std::string version() {
  return "0.1.0";
}

}  // namespace relay
