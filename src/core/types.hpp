#pragma once

#include <optional>
#include <string>
#include <utility>

namespace relay {

// Result type for operations that can fail without throwing
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<std::string> error;

  bool ok() const {
    return value.has_value();
  }
  bool failed() const {
    return error.has_value();
  }

  static Result success(T v) {
    Result r;
    r.value = std::move(v);
    return r;
  }

  static Result failure(std::string message) {
    Result r;
    r.error = std::move(message);
    return r;
  }
};

// Agent variants known to the engine
enum class AgentType { Concierge, Archivist };

std::string to_string(AgentType type);
std::optional<AgentType> parse_agent_type(const std::string &value);

// Conversation message roles
enum class Role { System, User, Assistant, Tool };

std::string to_string(Role role);

// How a turn ended
enum class TurnOutcome {
  Completed,        // no handoff in the final iteration
  BudgetExhausted,  // iteration budget reached while agents kept handing off
  Failed            // completion client raised
};

std::string to_string(TurnOutcome outcome);

}  // namespace relay
