#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace relay {

namespace config_paths {

std::filesystem::path home_dir();

// ~/.config/relay
std::filesystem::path config_dir();

// ~/.config/relay/config.json
std::filesystem::path config_file();

}  // namespace config_paths

// Application configuration
struct Config {
  std::string app_name = "relay";
  std::string log_level = "info";

  // Login is refused while the passcode is empty
  std::string app_passcode;

  // Completion service
  std::string model = "gpt-4-turbo-preview";
  std::string base_url = "http://localhost:11434/v1";
  // Bounds every connect, handshake and read on the completion connection
  int request_timeout_seconds = 120;

  // Lifecycle store
  int session_ttl_seconds = 3600;
  int thread_ttl_seconds = 7200;
  int reaper_interval_seconds = 60;
  bool cascade_thread_deletion = true;

  // Turn engine
  int max_iterations = 10;

  // Load from a JSON file; missing keys keep their defaults.
  // Durations, intervals and the iteration budget are raised to at least 1.
  static Config load(const std::filesystem::path &path);

  // Load ~/.config/relay/config.json (if present) and apply environment overrides
  static Config load_default();

  void save(const std::filesystem::path &path) const;

  // RELAY_PASSCODE, RELAY_LOG_LEVEL, RELAY_MODEL, RELAY_BASE_URL
  void apply_env();
};

}  // namespace relay
