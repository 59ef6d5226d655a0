#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <variant>

#include "core/types.hpp"

namespace relay::events {

using json = nlohmann::json;

// Events emitted by a turn, in emission order

struct UserEcho {
  std::string content;
};

struct AgentActivated {
  AgentType agent = AgentType::Concierge;
  std::string agent_name;
};

struct ContentFragment {
  AgentType agent = AgentType::Concierge;
  std::string delta;
};

struct ToolInvoked {
  AgentType agent = AgentType::Concierge;
  std::string call_id;
  std::string tool;
  json arguments;  // the raw argument text as a string when it is not valid JSON
};

struct ToolCompleted {
  AgentType agent = AgentType::Concierge;
  std::string call_id;
  std::string tool;
  json result;  // always carries "success"
};

struct TurnError {
  AgentType agent = AgentType::Concierge;
  std::string message;
};

// Terminal event, exactly one per turn
struct TurnComplete {
  AgentType agent = AgentType::Concierge;
  TurnOutcome outcome = TurnOutcome::Completed;
};

using TurnEvent = std::variant<UserEcho, AgentActivated, ContentFragment, ToolInvoked, ToolCompleted, TurnError, TurnComplete>;

// Stable wire name: user_message, agent_updated, content_delta, tool_call, tool_result, error, done
std::string event_name(const TurnEvent &event);

// {"type": <event_name>, ...fields}
json to_json(const TurnEvent &event);

}  // namespace relay::events
