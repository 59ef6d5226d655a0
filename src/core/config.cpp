#include "core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace relay {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace config_paths {

fs::path home_dir() {
  if (const char *home = std::getenv("HOME")) {
    return fs::path(home);
  }
  return fs::temp_directory_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "relay";
}

fs::path config_file() {
  return config_dir() / "config.json";
}

}  // namespace config_paths

namespace {

void apply_json(const json &j, Config &config) {
  config.app_name = j.value("app_name", config.app_name);
  config.log_level = j.value("log_level", config.log_level);
  config.app_passcode = j.value("app_passcode", config.app_passcode);
  config.model = j.value("model", config.model);
  config.base_url = j.value("base_url", config.base_url);
  config.session_ttl_seconds = j.value("session_ttl_seconds", config.session_ttl_seconds);
  config.thread_ttl_seconds = j.value("thread_ttl_seconds", config.thread_ttl_seconds);
  config.reaper_interval_seconds = j.value("reaper_interval_seconds", config.reaper_interval_seconds);
  config.cascade_thread_deletion = j.value("cascade_thread_deletion", config.cascade_thread_deletion);
  config.max_iterations = j.value("max_iterations", config.max_iterations);
  config.request_timeout_seconds = j.value("request_timeout_seconds", config.request_timeout_seconds);
}

int at_least_one(const char *key, int value) {
  if (value >= 1) return value;
  spdlog::warn("[Config] {} must be at least 1 (got {}), using 1", key, value);
  return 1;
}

void clamp_limits(Config &config) {
  config.session_ttl_seconds = at_least_one("session_ttl_seconds", config.session_ttl_seconds);
  config.thread_ttl_seconds = at_least_one("thread_ttl_seconds", config.thread_ttl_seconds);
  config.reaper_interval_seconds = at_least_one("reaper_interval_seconds", config.reaper_interval_seconds);
  config.max_iterations = at_least_one("max_iterations", config.max_iterations);
  config.request_timeout_seconds = at_least_one("request_timeout_seconds", config.request_timeout_seconds);
}

json as_json(const Config &config) {
  return json{{"app_name", config.app_name},
              {"log_level", config.log_level},
              {"app_passcode", config.app_passcode},
              {"model", config.model},
              {"base_url", config.base_url},
              {"session_ttl_seconds", config.session_ttl_seconds},
              {"thread_ttl_seconds", config.thread_ttl_seconds},
              {"reaper_interval_seconds", config.reaper_interval_seconds},
              {"cascade_thread_deletion", config.cascade_thread_deletion},
              {"max_iterations", config.max_iterations},
              {"request_timeout_seconds", config.request_timeout_seconds}};
}

}  // namespace

Config Config::load(const fs::path &path) {
  Config config;

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::debug("[Config] No config file at {}, using defaults", path.string());
    return config;
  }

  try {
    json j = json::parse(file);
    apply_json(j, config);
    clamp_limits(config);
  } catch (const json::exception &e) {
    spdlog::warn("[Config] Failed to parse {}: {}", path.string(), e.what());
    return Config{};
  }

  return config;
}

Config Config::load_default() {
  auto config = load(config_paths::config_file());
  config.apply_env();
  return config;
}

void Config::save(const fs::path &path) const {
  auto parent = path.parent_path();
  if (!parent.empty() && !fs::exists(parent)) {
    fs::create_directories(parent);
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open config file for writing: " + path.string());
  }
  file << as_json(*this).dump(2);
}

void Config::apply_env() {
  if (const char *v = std::getenv("RELAY_PASSCODE")) app_passcode = v;
  if (const char *v = std::getenv("RELAY_LOG_LEVEL")) log_level = v;
  if (const char *v = std::getenv("RELAY_MODEL")) model = v;
  if (const char *v = std::getenv("RELAY_BASE_URL")) base_url = v;
}

}  // namespace relay
