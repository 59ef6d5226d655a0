#include "service/chat_service.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <vector>

#include "core/uuid.hpp"
#include "tool/builtin/builtins.hpp"

namespace relay {

namespace {

// Comparison time depends only on the lengths
bool same_secret(const std::string &a, const std::string &b) {
  if (a.size() != b.size()) return false;
  unsigned char diff = 0;
  for (size_t i = 0; i < a.size(); ++i) {
    diff |= static_cast<unsigned char>(a[i] ^ b[i]);
  }
  return diff == 0;
}

}  // namespace

StoreOptions store_options(const Config &config) {
  StoreOptions options;
  options.session_ttl = std::chrono::seconds(config.session_ttl_seconds);
  options.thread_ttl = std::chrono::seconds(config.thread_ttl_seconds);
  options.reaper_interval = std::chrono::seconds(config.reaper_interval_seconds);
  options.cascade_thread_deletion = config.cascade_thread_deletion;
  return options;
}

EngineOptions engine_options(const Config &config) {
  EngineOptions options;
  options.max_iterations = config.max_iterations;
  options.model = config.model;
  return options;
}

ChatService::ChatService(Config config, std::shared_ptr<LifecycleStore> store, ClientFactory factory)
    : config_(std::move(config)),
      store_(store ? std::move(store) : throw std::invalid_argument("ChatService requires a store")),
      factory_(std::move(factory)),
      agents_(AgentCatalog::builtin()),
      reaper_(*store_) {
  tools::register_note_tools(tools_, *store_);
  spdlog::info("[Chat] Service ready ({} agents, {} tools)", agents_.size(), tools_.names().size());
}

ChatService::~ChatService() = default;

// ============================================================
// Authentication
// ============================================================

Result<Session> ChatService::login(const std::string &passcode) {
  if (config_.app_passcode.empty()) {
    spdlog::error("[Chat] Login refused: no passcode configured");
    return Result<Session>::failure("Login is disabled: no passcode configured");
  }
  if (!same_secret(passcode, config_.app_passcode)) {
    spdlog::warn("[Chat] Login refused: invalid passcode");
    return Result<Session>::failure("Invalid passcode");
  }

  auto session = store_->create_session();
  if (!store_->mark_passcode_verified(session.session_id)) {
    return Result<Session>::failure("Session expired during login");
  }
  session.passcode_verified = true;

  spdlog::info("[Chat] Session {} logged in", short_id(session.session_id));
  return Result<Session>::success(std::move(session));
}

Result<Session> ChatService::set_credential(const std::string &session_id, const std::string &credential) {
  if (credential.empty()) {
    return Result<Session>::failure("Credential must not be empty");
  }

  auto session = store_->get_session(session_id);
  if (!session) {
    return Result<Session>::failure("Session not found or expired");
  }
  if (!session->passcode_verified) {
    return Result<Session>::failure("Passcode not verified");
  }
  if (!store_->set_credential(session_id, credential)) {
    return Result<Session>::failure("Session not found or expired");
  }

  session->credential = credential;
  spdlog::info("[Chat] Credential set for session {}", short_id(session_id));
  return Result<Session>::success(std::move(*session));
}

bool ChatService::logout(const std::string &session_id) {
  if (!store_->delete_session(session_id)) {
    return false;
  }

  {
    std::lock_guard lock(conversations_mutex_);
    for (auto it = conversations_.begin(); it != conversations_.end();) {
      if (it->second->session_id == session_id) {
        it = conversations_.erase(it);
      } else {
        ++it;
      }
    }
  }

  spdlog::info("[Chat] Session {} logged out", short_id(session_id));
  return true;
}

Result<SessionStatus> ChatService::status(const std::string &session_id) {
  auto session = store_->get_session(session_id);
  if (!session) {
    return Result<SessionStatus>::failure("Session not found or expired");
  }

  SessionStatus status;
  status.session_id = session->session_id;
  status.passcode_verified = session->passcode_verified;
  status.credential_set = session->credential.has_value();
  status.fully_authenticated = session->is_authenticated();
  return Result<SessionStatus>::success(std::move(status));
}

Result<Session> ChatService::require_authenticated(const std::string &session_id) {
  auto session = store_->get_session(session_id);
  if (!session) {
    return Result<Session>::failure("Session not found or expired");
  }
  if (!session->is_authenticated()) {
    return Result<Session>::failure("Session is not fully authenticated");
  }
  return Result<Session>::success(std::move(*session));
}

// ============================================================
// Threads
// ============================================================

Result<Thread> ChatService::create_thread(const std::string &session_id) {
  auto session = require_authenticated(session_id);
  if (!session.ok()) {
    return Result<Thread>::failure(*session.error);
  }

  auto thread = store_->create_thread(session_id);
  spdlog::info("[Chat] Thread {} created for session {}", thread.thread_id, short_id(session_id));
  return Result<Thread>::success(std::move(thread));
}

Result<Thread> ChatService::get_thread(const std::string &session_id, const std::string &thread_id) {
  auto session = require_authenticated(session_id);
  if (!session.ok()) {
    return Result<Thread>::failure(*session.error);
  }
  return require_owned_thread(session_id, thread_id);
}

Result<Thread> ChatService::require_owned_thread(const std::string &session_id, const std::string &thread_id) {
  auto thread = store_->get_thread(thread_id);
  if (!thread) {
    return Result<Thread>::failure("Thread not found or expired");
  }
  if (thread->session_id != session_id) {
    spdlog::warn("[Chat] Session {} denied access to thread {}", short_id(session_id), thread_id);
    return Result<Thread>::failure("Thread does not belong to this session");
  }
  return Result<Thread>::success(std::move(*thread));
}

// ============================================================
// Chat
// ============================================================

Result<TurnOutcome> ChatService::chat(const std::string &session_id, const std::string &thread_id, const std::string &message,
                                      const EventSink &sink) {
  if (message.empty()) {
    return Result<TurnOutcome>::failure("Message must not be empty");
  }

  auto session = require_authenticated(session_id);
  if (!session.ok()) {
    return Result<TurnOutcome>::failure(*session.error);
  }
  auto thread = require_owned_thread(session_id, thread_id);
  if (!thread.ok()) {
    return Result<TurnOutcome>::failure(*thread.error);
  }

  std::shared_ptr<llm::CompletionClient> client;
  if (factory_) {
    try {
      client = factory_(*session.value->credential);
    } catch (const std::exception &e) {
      spdlog::error("[Chat] Failed to create completion client: {}", e.what());
      return Result<TurnOutcome>::failure(std::string("Failed to create completion client: ") + e.what());
    }
  }

  prune_conversations();
  auto conversation = conversation_for(session_id, thread_id);

  std::lock_guard lock(conversation->mutex);
  if (!conversation->engine) {
    conversation->engine = std::make_unique<Orchestrator>(session_id, client, tools_, agents_, engine_options(config_));
  } else {
    conversation->engine->set_client(client);
  }

  store_->append_thread_message(thread_id, json{{"role", "user"}, {"content", message}});

  std::string reply;
  auto outcome = conversation->engine->run_turn(message, [&](const events::TurnEvent &event) {
    if (const auto *fragment = std::get_if<events::ContentFragment>(&event)) {
      reply += fragment->delta;
    }
    if (sink) sink(event);
  });

  // The thread may have been deleted while the turn ran; the reply is dropped then
  json record = {
      {"role", "assistant"},
      {"agent", to_string(conversation->engine->current_agent())},
      {"content", reply},
      {"outcome", to_string(outcome)},
  };
  if (!store_->append_thread_message(thread_id, std::move(record))) {
    spdlog::warn("[Chat] Thread {} disappeared before the reply was recorded", thread_id);
  }

  return Result<TurnOutcome>::success(outcome);
}

std::shared_ptr<ChatService::Conversation> ChatService::conversation_for(const std::string &session_id, const std::string &thread_id) {
  std::lock_guard lock(conversations_mutex_);
  auto &slot = conversations_[thread_id];
  if (!slot) {
    slot = std::make_shared<Conversation>();
    slot->session_id = session_id;
  }
  return slot;
}

// Drops engines whose thread expired or was deleted
void ChatService::prune_conversations() {
  std::vector<std::string> thread_ids;
  {
    std::lock_guard lock(conversations_mutex_);
    for (const auto &[thread_id, conversation] : conversations_) {
      thread_ids.push_back(thread_id);
    }
  }

  std::vector<std::string> stale;
  for (const auto &thread_id : thread_ids) {
    if (!store_->has_thread(thread_id)) {
      stale.push_back(thread_id);
    }
  }
  if (stale.empty()) return;

  std::lock_guard lock(conversations_mutex_);
  for (const auto &thread_id : stale) {
    conversations_.erase(thread_id);
  }
  spdlog::debug("[Chat] Released {} idle engines", stale.size());
}

size_t ChatService::conversation_count() const {
  std::lock_guard lock(conversations_mutex_);
  return conversations_.size();
}

}  // namespace relay
