#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "agent/agent_definition.hpp"
#include "agent/orchestrator.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "llm/provider.hpp"
#include "store/lifecycle_store.hpp"
#include "tool/tool.hpp"

namespace relay {

// Builds a completion client for a session credential
using ClientFactory = std::function<std::shared_ptr<llm::CompletionClient>(const std::string &credential)>;

struct SessionStatus {
  std::string session_id;
  bool passcode_verified = false;
  bool credential_set = false;
  bool fully_authenticated = false;
};

StoreOptions store_options(const Config &config);
EngineOptions engine_options(const Config &config);

// Application facade: login flow, thread ownership and chat turns.
//
// Keeps one Orchestrator per thread so the active agent and the history
// survive between turns. Turns on the same thread are serialized, turns on
// different threads run concurrently.
class ChatService {
 public:
  ChatService(Config config, std::shared_ptr<LifecycleStore> store, ClientFactory factory);
  ~ChatService();

  ChatService(const ChatService &) = delete;
  ChatService &operator=(const ChatService &) = delete;

  // ---- Authentication ----

  Result<Session> login(const std::string &passcode);
  Result<Session> set_credential(const std::string &session_id, const std::string &credential);
  bool logout(const std::string &session_id);
  Result<SessionStatus> status(const std::string &session_id);

  // ---- Threads ----

  Result<Thread> create_thread(const std::string &session_id);
  Result<Thread> get_thread(const std::string &session_id, const std::string &thread_id);

  // ---- Chat ----

  // Runs one turn; every event goes to `sink`. Fails without emitting
  // anything when the session or thread check does not pass.
  Result<TurnOutcome> chat(const std::string &session_id, const std::string &thread_id, const std::string &message,
                           const EventSink &sink);

  LifecycleStore &store() {
    return *store_;
  }
  const ToolRegistry &tools() const {
    return tools_;
  }
  const AgentCatalog &agents() const {
    return agents_;
  }

  // Number of threads with a live engine
  size_t conversation_count() const;

 private:
  struct Conversation {
    std::string session_id;
    std::mutex mutex;
    std::unique_ptr<Orchestrator> engine;
  };

  Result<Session> require_authenticated(const std::string &session_id);
  Result<Thread> require_owned_thread(const std::string &session_id, const std::string &thread_id);
  std::shared_ptr<Conversation> conversation_for(const std::string &session_id, const std::string &thread_id);
  void prune_conversations();

  Config config_;
  std::shared_ptr<LifecycleStore> store_;
  ClientFactory factory_;
  ToolRegistry tools_;
  AgentCatalog agents_;

  mutable std::mutex conversations_mutex_;
  std::map<std::string, std::shared_ptr<Conversation>> conversations_;

  // Declared last: the reaper stops before anything above is torn down
  ReaperGuard reaper_;
};

}  // namespace relay
