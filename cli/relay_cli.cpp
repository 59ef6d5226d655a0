#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

#include "agent/agent.hpp"

using namespace relay;

namespace {

void print_status(ChatService &service, const std::string &session_id) {
  auto status = service.status(session_id);
  if (!status.ok()) {
    std::cerr << "Status: " << *status.error << "\n";
    return;
  }
  json out = {
      {"session", short_id(status.value->session_id)},
      {"passcode_verified", status.value->passcode_verified},
      {"credential_set", status.value->credential_set},
      {"fully_authenticated", status.value->fully_authenticated},
      {"sessions", service.store().session_count()},
      {"threads", service.store().thread_count()},
  };
  std::cout << out.dump() << std::endl;
}

}  // namespace

int main() {
  // ===== Configuration =====
  Config config = Config::load_default();
  init(config);

  const char *api_key = std::getenv("OPENAI_API_KEY");
  if (!api_key || std::string(api_key).empty()) {
    std::cerr << "Error: OPENAI_API_KEY is not set\n";
    return 1;
  }
  if (config.app_passcode.empty()) {
    std::cerr << "Error: no passcode configured. Set RELAY_PASSCODE or \"app_passcode\" in " << config_paths::config_file().string()
              << "\n";
    return 1;
  }

  // ===== Service =====
  auto store = std::make_shared<LifecycleStore>(store_options(config));
  ClientFactory factory = [&config](const std::string &credential) {
    return std::make_shared<llm::OpenAiClient>(
        llm::OpenAiConfig{config.base_url, credential, config.model, std::chrono::seconds(config.request_timeout_seconds)});
  };
  ChatService service(config, store, factory);

  auto session = service.login(config.app_passcode);
  if (!session.ok()) {
    std::cerr << "Login failed: " << *session.error << "\n";
    return 1;
  }
  const std::string session_id = session.value->session_id;

  auto authed = service.set_credential(session_id, api_key);
  if (!authed.ok()) {
    std::cerr << "Credential rejected: " << *authed.error << "\n";
    return 1;
  }

  auto thread = service.create_thread(session_id);
  if (!thread.ok()) {
    std::cerr << "Failed to create thread: " << *thread.error << "\n";
    return 1;
  }
  std::string thread_id = thread.value->thread_id;

  std::cerr << "relay " << version() << " (model: " << config.model << ", thread: " << thread_id << ")\n";
  std::cerr << "Commands: /status, /new, /quit\n";

  // ===== Line loop =====
  std::string line;
  while (std::cerr << "> " && std::getline(std::cin, line)) {
    if (line.empty()) continue;

    if (line == "/quit" || line == "/exit") {
      break;
    }
    if (line == "/status") {
      print_status(service, session_id);
      continue;
    }
    if (line == "/new") {
      auto fresh = service.create_thread(session_id);
      if (!fresh.ok()) {
        std::cerr << "Failed to create thread: " << *fresh.error << "\n";
        continue;
      }
      thread_id = fresh.value->thread_id;
      std::cerr << "Thread: " << thread_id << "\n";
      continue;
    }

    auto outcome = service.chat(session_id, thread_id, line, [](const events::TurnEvent &event) {
      std::cout << events::to_json(event).dump(-1, ' ', false, json::error_handler_t::replace) << std::endl;
    });
    if (!outcome.ok()) {
      std::cerr << "Chat failed: " << *outcome.error << "\n";
    }
  }

  service.logout(session_id);
  return 0;
}
