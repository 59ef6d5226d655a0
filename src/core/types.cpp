#include "core/types.hpp"

namespace relay {

std::string to_string(AgentType type) {
  switch (type) {
    case AgentType::Concierge:
      return "concierge";
    case AgentType::Archivist:
      return "archivist";
  }
  return "unknown";
}

std::optional<AgentType> parse_agent_type(const std::string &value) {
  if (value == "concierge") return AgentType::Concierge;
  if (value == "archivist") return AgentType::Archivist;
  return std::nullopt;
}

std::string to_string(Role role) {
  switch (role) {
    case Role::System:
      return "system";
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
    case Role::Tool:
      return "tool";
  }
  return "unknown";
}

std::string to_string(TurnOutcome outcome) {
  switch (outcome) {
    case TurnOutcome::Completed:
      return "completed";
    case TurnOutcome::BudgetExhausted:
      return "budget_exhausted";
    case TurnOutcome::Failed:
      return "failed";
  }
  return "unknown";
}

}  // namespace relay
