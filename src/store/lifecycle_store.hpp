#pragma once

#include <asio.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace relay {

using json = nlohmann::json;

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using NowFn = std::function<TimePoint()>;

// Identity unit: passcode check plus an optional user credential
struct Session {
  std::string session_id;
  bool passcode_verified = false;
  std::optional<std::string> credential;
  TimePoint created_at;
  TimePoint last_accessed;
  std::chrono::seconds ttl{0};

  bool is_expired(TimePoint now) const {
    return now - last_accessed > ttl;
  }

  // Passcode verified AND credential present
  bool is_authenticated() const {
    return passcode_verified && credential.has_value();
  }
};

// Conversation record bound to a session by id (lookup key, not ownership)
struct Thread {
  std::string thread_id;
  std::string session_id;
  std::vector<json> messages;
  TimePoint created_at;
  TimePoint last_accessed;
  std::chrono::seconds ttl{0};

  bool is_expired(TimePoint now) const {
    return now - last_accessed > ttl;
  }
};

struct StoreOptions {
  std::chrono::seconds session_ttl{3600};
  std::chrono::seconds thread_ttl{7200};
  std::chrono::milliseconds reaper_interval{std::chrono::seconds(60)};

  // Deleting a session also deletes the threads that reference it
  bool cascade_thread_deletion = true;

  // Time source; system clock when empty
  NowFn now;
};

// In-memory session/thread store with TTL expiry and a background reaper.
//
// Sessions and their auxiliary key-value namespaces share one lock, threads
// have their own. No operation holds both locks at once.
class LifecycleStore {
 public:
  explicit LifecycleStore(StoreOptions options = {});
  ~LifecycleStore();

  LifecycleStore(const LifecycleStore &) = delete;
  LifecycleStore &operator=(const LifecycleStore &) = delete;

  // ---- Sessions ----

  Session create_session();

  // Touches the session on hit; removes it (and its namespace) when expired
  std::optional<Session> get_session(const std::string &session_id);

  bool delete_session(const std::string &session_id);

  // Present and not expired; does not touch
  bool has_session(const std::string &session_id) const;

  // Mutators return false when the session is absent or expired. Both touch.
  bool mark_passcode_verified(const std::string &session_id);
  bool set_credential(const std::string &session_id, std::string credential);

  // ---- Threads ----

  // The owning session is not validated
  Thread create_thread(const std::string &session_id);

  std::optional<Thread> get_thread(const std::string &thread_id);

  bool append_thread_message(const std::string &thread_id, json message);

  bool delete_thread(const std::string &thread_id);

  // Present and not expired; does not touch
  bool has_thread(const std::string &thread_id) const;

  // ---- Auxiliary per-session namespace ----

  // False when the session's namespace no longer exists
  bool put_value(const std::string &session_id, const std::string &key, std::string value);
  std::optional<std::string> get_value(const std::string &session_id, const std::string &key) const;
  std::vector<std::string> list_keys(const std::string &session_id) const;
  bool has_namespace(const std::string &session_id) const;

  // ---- Expiry ----

  // One eviction pass over both tables; returns the number of records removed
  size_t evict_expired();

  void start_reaper();

  // Returns once the reaper thread has exited; no pass runs afterwards
  void stop_reaper();

  bool reaper_running() const;

  size_t session_count() const;
  size_t thread_count() const;

  const StoreOptions &options() const {
    return options_;
  }

 private:
  TimePoint now() const;
  void schedule_reap();
  void erase_session_locked(const std::string &session_id);
  size_t erase_threads_of(const std::string &session_id);

  StoreOptions options_;

  mutable std::mutex sessions_mutex_;
  std::unordered_map<std::string, Session> sessions_;
  std::unordered_map<std::string, std::map<std::string, std::string>> namespaces_;

  mutable std::mutex threads_mutex_;
  std::unordered_map<std::string, Thread> threads_;

  mutable std::mutex reaper_mutex_;
  std::unique_ptr<asio::io_context> reaper_io_;
  std::unique_ptr<asio::steady_timer> reaper_timer_;
  std::thread reaper_thread_;
};

// Runs the store's reaper for the lifetime of the guard
class ReaperGuard {
 public:
  explicit ReaperGuard(LifecycleStore &store) : store_(store) {
    store_.start_reaper();
  }
  ~ReaperGuard() {
    store_.stop_reaper();
  }

  ReaperGuard(const ReaperGuard &) = delete;
  ReaperGuard &operator=(const ReaperGuard &) = delete;

 private:
  LifecycleStore &store_;
};

}  // namespace relay
