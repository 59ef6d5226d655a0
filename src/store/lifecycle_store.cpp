#include "store/lifecycle_store.hpp"

#include <spdlog/spdlog.h>

#include "core/uuid.hpp"

namespace relay {

namespace {

constexpr size_t kSessionIdBytes = 32;
constexpr size_t kThreadIdBytes = 16;

}  // namespace

LifecycleStore::LifecycleStore(StoreOptions options) : options_(std::move(options)) {
  if (!options_.now) {
    options_.now = [] {
      return Clock::now();
    };
  }
}

LifecycleStore::~LifecycleStore() {
  stop_reaper();
}

TimePoint LifecycleStore::now() const {
  return options_.now();
}

// ============================================================
// Sessions
// ============================================================

Session LifecycleStore::create_session() {
  auto current = now();

  Session session;
  session.created_at = current;
  session.last_accessed = current;
  session.ttl = options_.session_ttl;

  std::lock_guard lock(sessions_mutex_);
  do {
    session.session_id = random_token(kSessionIdBytes);
  } while (sessions_.count(session.session_id) > 0);

  sessions_.emplace(session.session_id, session);
  namespaces_[session.session_id];  // empty namespace

  spdlog::debug("[Store] Created session {}", short_id(session.session_id));
  return session;
}

std::optional<Session> LifecycleStore::get_session(const std::string &session_id) {
  auto current = now();

  std::lock_guard lock(sessions_mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return std::nullopt;
  }

  if (it->second.is_expired(current)) {
    spdlog::debug("[Store] Session {} expired on access", short_id(session_id));
    erase_session_locked(session_id);
    return std::nullopt;
  }

  it->second.last_accessed = current;
  return it->second;
}

bool LifecycleStore::delete_session(const std::string &session_id) {
  {
    std::lock_guard lock(sessions_mutex_);
    if (sessions_.count(session_id) == 0) {
      return false;
    }
    erase_session_locked(session_id);
  }

  spdlog::debug("[Store] Deleted session {}", short_id(session_id));

  if (options_.cascade_thread_deletion) {
    auto removed = erase_threads_of(session_id);
    if (removed > 0) {
      spdlog::debug("[Store] Removed {} threads of session {}", removed, short_id(session_id));
    }
  }
  return true;
}

bool LifecycleStore::has_session(const std::string &session_id) const {
  auto current = now();
  std::lock_guard lock(sessions_mutex_);
  auto it = sessions_.find(session_id);
  return it != sessions_.end() && !it->second.is_expired(current);
}

bool LifecycleStore::mark_passcode_verified(const std::string &session_id) {
  auto current = now();

  std::lock_guard lock(sessions_mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) return false;
  if (it->second.is_expired(current)) {
    erase_session_locked(session_id);
    return false;
  }

  it->second.passcode_verified = true;
  it->second.last_accessed = current;
  return true;
}

bool LifecycleStore::set_credential(const std::string &session_id, std::string credential) {
  auto current = now();

  std::lock_guard lock(sessions_mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) return false;
  if (it->second.is_expired(current)) {
    erase_session_locked(session_id);
    return false;
  }

  it->second.credential = std::move(credential);
  it->second.last_accessed = current;
  return true;
}

// Caller holds sessions_mutex_
void LifecycleStore::erase_session_locked(const std::string &session_id) {
  sessions_.erase(session_id);
  namespaces_.erase(session_id);
}

// ============================================================
// Threads
// ============================================================

Thread LifecycleStore::create_thread(const std::string &session_id) {
  auto current = now();

  Thread thread;
  thread.session_id = session_id;
  thread.created_at = current;
  thread.last_accessed = current;
  thread.ttl = options_.thread_ttl;

  std::lock_guard lock(threads_mutex_);
  do {
    thread.thread_id = random_token(kThreadIdBytes);
  } while (threads_.count(thread.thread_id) > 0);

  threads_.emplace(thread.thread_id, thread);

  spdlog::debug("[Store] Created thread {} for session {}", thread.thread_id, short_id(session_id));
  return thread;
}

std::optional<Thread> LifecycleStore::get_thread(const std::string &thread_id) {
  auto current = now();

  std::lock_guard lock(threads_mutex_);
  auto it = threads_.find(thread_id);
  if (it == threads_.end()) {
    return std::nullopt;
  }

  if (it->second.is_expired(current)) {
    spdlog::debug("[Store] Thread {} expired on access", thread_id);
    threads_.erase(it);
    return std::nullopt;
  }

  it->second.last_accessed = current;
  return it->second;
}

bool LifecycleStore::append_thread_message(const std::string &thread_id, json message) {
  auto current = now();

  std::lock_guard lock(threads_mutex_);
  auto it = threads_.find(thread_id);
  if (it == threads_.end()) return false;
  if (it->second.is_expired(current)) {
    threads_.erase(it);
    return false;
  }

  it->second.messages.push_back(std::move(message));
  it->second.last_accessed = current;
  return true;
}

bool LifecycleStore::delete_thread(const std::string &thread_id) {
  std::lock_guard lock(threads_mutex_);
  return threads_.erase(thread_id) > 0;
}

bool LifecycleStore::has_thread(const std::string &thread_id) const {
  auto current = now();
  std::lock_guard lock(threads_mutex_);
  auto it = threads_.find(thread_id);
  return it != threads_.end() && !it->second.is_expired(current);
}

size_t LifecycleStore::erase_threads_of(const std::string &session_id) {
  std::lock_guard lock(threads_mutex_);
  size_t removed = 0;
  for (auto it = threads_.begin(); it != threads_.end();) {
    if (it->second.session_id == session_id) {
      it = threads_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

// ============================================================
// Auxiliary namespace
// ============================================================

bool LifecycleStore::put_value(const std::string &session_id, const std::string &key, std::string value) {
  std::lock_guard lock(sessions_mutex_);
  auto it = namespaces_.find(session_id);
  if (it == namespaces_.end()) {
    return false;
  }
  it->second[key] = std::move(value);
  return true;
}

std::optional<std::string> LifecycleStore::get_value(const std::string &session_id, const std::string &key) const {
  std::lock_guard lock(sessions_mutex_);
  auto ns = namespaces_.find(session_id);
  if (ns == namespaces_.end()) return std::nullopt;

  auto it = ns->second.find(key);
  if (it == ns->second.end()) return std::nullopt;
  return it->second;
}

std::vector<std::string> LifecycleStore::list_keys(const std::string &session_id) const {
  std::vector<std::string> keys;

  std::lock_guard lock(sessions_mutex_);
  auto ns = namespaces_.find(session_id);
  if (ns == namespaces_.end()) return keys;

  keys.reserve(ns->second.size());
  for (const auto &[key, value] : ns->second) {
    keys.push_back(key);
  }
  return keys;
}

bool LifecycleStore::has_namespace(const std::string &session_id) const {
  std::lock_guard lock(sessions_mutex_);
  return namespaces_.count(session_id) > 0;
}

// ============================================================
// Expiry and reaper
// ============================================================

size_t LifecycleStore::evict_expired() {
  auto current = now();
  size_t expired_sessions = 0;
  size_t expired_threads = 0;

  {
    std::lock_guard lock(sessions_mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      if (it->second.is_expired(current)) {
        spdlog::debug("[Reaper] Removed expired session {}", short_id(it->first));
        namespaces_.erase(it->first);
        it = sessions_.erase(it);
        ++expired_sessions;
      } else {
        ++it;
      }
    }
  }

  {
    std::lock_guard lock(threads_mutex_);
    for (auto it = threads_.begin(); it != threads_.end();) {
      if (it->second.is_expired(current)) {
        spdlog::debug("[Reaper] Removed expired thread {}", it->first);
        it = threads_.erase(it);
        ++expired_threads;
      } else {
        ++it;
      }
    }
  }

  if (expired_sessions > 0 || expired_threads > 0) {
    spdlog::info("[Reaper] Cleaned up {} sessions and {} threads", expired_sessions, expired_threads);
  }
  return expired_sessions + expired_threads;
}

void LifecycleStore::start_reaper() {
  std::lock_guard lock(reaper_mutex_);
  if (reaper_thread_.joinable()) {
    return;
  }

  reaper_io_ = std::make_unique<asio::io_context>();
  reaper_timer_ = std::make_unique<asio::steady_timer>(*reaper_io_);
  schedule_reap();

  reaper_thread_ = std::thread([io = reaper_io_.get()]() {
    io->run();
  });

  spdlog::info("[Reaper] Started (interval: {} ms)", options_.reaper_interval.count());
}

// Runs on the reaper thread
void LifecycleStore::schedule_reap() {
  reaper_timer_->expires_after(options_.reaper_interval);
  reaper_timer_->async_wait([this](const std::error_code &ec) {
    if (ec == asio::error::operation_aborted) {
      return;
    }
    try {
      evict_expired();
    } catch (const std::exception &e) {
      spdlog::error("[Reaper] Eviction pass failed: {}", e.what());
    }
    schedule_reap();
  });
}

void LifecycleStore::stop_reaper() {
  std::lock_guard lock(reaper_mutex_);
  if (!reaper_thread_.joinable()) {
    return;
  }

  // stop() makes run() return as soon as any in-flight pass finishes
  reaper_io_->stop();
  reaper_thread_.join();

  reaper_timer_.reset();
  reaper_io_.reset();

  spdlog::info("[Reaper] Stopped");
}

bool LifecycleStore::reaper_running() const {
  std::lock_guard lock(reaper_mutex_);
  return reaper_thread_.joinable();
}

size_t LifecycleStore::session_count() const {
  std::lock_guard lock(sessions_mutex_);
  return sessions_.size();
}

size_t LifecycleStore::thread_count() const {
  std::lock_guard lock(threads_mutex_);
  return threads_.size();
}

}  // namespace relay
