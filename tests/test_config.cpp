#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "core/config.hpp"
#include "service/chat_service.hpp"

using namespace relay;

namespace fs = std::filesystem;

// --- ConfigTest ---

TEST(ConfigTest, Defaults) {
  Config config;

  EXPECT_EQ(config.app_name, "relay");
  EXPECT_EQ(config.log_level, "info");
  // 未配置口令时禁止登录
  EXPECT_TRUE(config.app_passcode.empty());
  EXPECT_EQ(config.model, "gpt-4-turbo-preview");
  EXPECT_EQ(config.session_ttl_seconds, 3600);
  EXPECT_EQ(config.thread_ttl_seconds, 7200);
  EXPECT_EQ(config.reaper_interval_seconds, 60);
  EXPECT_TRUE(config.cascade_thread_deletion);
  EXPECT_EQ(config.max_iterations, 10);
  EXPECT_EQ(config.request_timeout_seconds, 120);
}

TEST(ConfigTest, SaveAndLoad) {
  Config config;
  config.app_passcode = "open-sesame";
  config.model = "gpt-4o-mini";
  config.base_url = "http://127.0.0.1:8000/v1";
  config.session_ttl_seconds = 120;
  config.thread_ttl_seconds = 240;
  config.reaper_interval_seconds = 5;
  config.cascade_thread_deletion = false;
  config.max_iterations = 4;

  auto tmp_path = fs::temp_directory_path() / "relay_test_config.json";
  config.save(tmp_path);

  auto loaded = Config::load(tmp_path);
  EXPECT_EQ(loaded.app_passcode, "open-sesame");
  EXPECT_EQ(loaded.model, "gpt-4o-mini");
  EXPECT_EQ(loaded.base_url, "http://127.0.0.1:8000/v1");
  EXPECT_EQ(loaded.session_ttl_seconds, 120);
  EXPECT_EQ(loaded.thread_ttl_seconds, 240);
  EXPECT_EQ(loaded.reaper_interval_seconds, 5);
  EXPECT_FALSE(loaded.cascade_thread_deletion);
  EXPECT_EQ(loaded.max_iterations, 4);

  fs::remove(tmp_path);
}

TEST(ConfigTest, PartialFileKeepsDefaults) {
  auto tmp_path = fs::temp_directory_path() / "relay_test_partial.json";
  {
    std::ofstream out(tmp_path);
    out << R"({"model": "local-llama", "max_iterations": 3})";
  }

  auto loaded = Config::load(tmp_path);
  EXPECT_EQ(loaded.model, "local-llama");
  EXPECT_EQ(loaded.max_iterations, 3);
  EXPECT_EQ(loaded.session_ttl_seconds, 3600);
  EXPECT_EQ(loaded.log_level, "info");

  fs::remove(tmp_path);
}

TEST(ConfigTest, MissingFileGivesDefaults) {
  auto loaded = Config::load(fs::temp_directory_path() / "relay_does_not_exist.json");
  EXPECT_EQ(loaded.model, "gpt-4-turbo-preview");
}

TEST(ConfigTest, MalformedFileGivesDefaults) {
  auto tmp_path = fs::temp_directory_path() / "relay_test_malformed.json";
  {
    std::ofstream out(tmp_path);
    out << "{ not json";
  }

  auto loaded = Config::load(tmp_path);
  EXPECT_EQ(loaded.model, "gpt-4-turbo-preview");
  EXPECT_EQ(loaded.max_iterations, 10);

  fs::remove(tmp_path);
}

TEST(ConfigTest, NonPositiveLimitsAreRaisedToOne) {
  auto tmp_path = fs::temp_directory_path() / "relay_test_limits.json";
  {
    std::ofstream out(tmp_path);
    out << R"({"max_iterations": 0, "reaper_interval_seconds": -5, "session_ttl_seconds": 0, "request_timeout_seconds": -1, "thread_ttl_seconds": 30})";
  }

  auto loaded = Config::load(tmp_path);
  // 预算为 0 会导致回合不执行任何迭代，间隔为 0 会让清理线程空转
  EXPECT_EQ(loaded.max_iterations, 1);
  EXPECT_EQ(loaded.reaper_interval_seconds, 1);
  EXPECT_EQ(loaded.session_ttl_seconds, 1);
  EXPECT_EQ(loaded.request_timeout_seconds, 1);
  EXPECT_EQ(loaded.thread_ttl_seconds, 30);

  fs::remove(tmp_path);
}

TEST(ConfigTest, EnvironmentOverrides) {
  setenv("RELAY_PASSCODE", "from-env", 1);
  setenv("RELAY_MODEL", "env-model", 1);

  Config config;
  config.apply_env();
  EXPECT_EQ(config.app_passcode, "from-env");
  EXPECT_EQ(config.model, "env-model");

  unsetenv("RELAY_PASSCODE");
  unsetenv("RELAY_MODEL");
}

TEST(ConfigTest, DerivedOptions) {
  Config config;
  config.session_ttl_seconds = 30;
  config.thread_ttl_seconds = 90;
  config.reaper_interval_seconds = 2;
  config.cascade_thread_deletion = false;
  config.max_iterations = 7;
  config.model = "m";

  auto store = store_options(config);
  EXPECT_EQ(store.session_ttl, std::chrono::seconds(30));
  EXPECT_EQ(store.thread_ttl, std::chrono::seconds(90));
  EXPECT_EQ(store.reaper_interval, std::chrono::seconds(2));
  EXPECT_FALSE(store.cascade_thread_deletion);

  auto engine = engine_options(config);
  EXPECT_EQ(engine.max_iterations, 7);
  EXPECT_EQ(engine.model, "m");
  EXPECT_EQ(engine.initial_agent, AgentType::Concierge);
}

// --- ConfigPathsTest ---

TEST(ConfigPathsTest, ConfigDir) {
  auto config_dir = config_paths::config_dir();

  EXPECT_FALSE(config_dir.empty());
  // 配置目录应以 "relay" 结尾
  EXPECT_EQ(config_dir.filename(), "relay");
  EXPECT_EQ(config_dir.parent_path().filename(), ".config");
  EXPECT_EQ(config_paths::config_file().filename(), "config.json");
}
