#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "agent/agent_definition.hpp"
#include "agent/events.hpp"
#include "core/message.hpp"
#include "core/types.hpp"
#include "llm/provider.hpp"
#include "tool/tool.hpp"

namespace relay {

struct EngineOptions {
  // Upper bound on completion calls per turn, handoffs included
  int max_iterations = 10;
  AgentType initial_agent = AgentType::Concierge;
  std::string model;
};

// Receives every event of a turn in emission order
using EventSink = std::function<void(const events::TurnEvent &)>;

// Agent turn engine for one conversation.
//
// Owns the conversation history and the currently active agent, both of which
// carry over from one turn to the next. An instance must not run two turns
// at the same time.
class Orchestrator {
 public:
  Orchestrator(std::string session_id, std::shared_ptr<llm::CompletionClient> client, const ToolRegistry &tools, const AgentCatalog &agents,
               EngineOptions options = {});

  // Runs one turn for `user_message`. Never throws for upstream or tool
  // failures; those are reported through the sink.
  TurnOutcome run_turn(const std::string &user_message, const EventSink &sink);

  AgentType current_agent() const {
    return current_agent_;
  }
  const std::vector<Message> &history() const {
    return history_;
  }
  const std::string &session_id() const {
    return session_id_;
  }

  // Swap the completion client used by subsequent turns
  void set_client(std::shared_ptr<llm::CompletionClient> client);

 private:
  // Streams one completion; appends the assistant message and returns its tool calls
  std::vector<ToolCall> stream_completion(const AgentDefinition &agent, const EventSink &sink);

  // Executes calls in order; returns true when one of them was a handoff
  bool run_tool_calls(const AgentDefinition &agent, const std::vector<ToolCall> &calls, const EventSink &sink);

  std::string session_id_;
  std::shared_ptr<llm::CompletionClient> client_;
  const ToolRegistry &tools_;
  const AgentCatalog &agents_;
  EngineOptions options_;

  AgentType current_agent_;
  std::vector<Message> history_;
};

}  // namespace relay
