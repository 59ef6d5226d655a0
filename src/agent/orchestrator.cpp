#include "agent/orchestrator.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

#include "agent/tool_call_assembler.hpp"
#include "core/uuid.hpp"

namespace relay {

Orchestrator::Orchestrator(std::string session_id, std::shared_ptr<llm::CompletionClient> client, const ToolRegistry &tools,
                           const AgentCatalog &agents, EngineOptions options)
    : session_id_(std::move(session_id)),
      client_(std::move(client)),
      tools_(tools),
      agents_(agents),
      options_(std::move(options)),
      current_agent_(options_.initial_agent) {
  if (!agents_.contains(current_agent_)) {
    throw std::invalid_argument("Initial agent '" + to_string(current_agent_) + "' is not in the catalog");
  }
}

void Orchestrator::set_client(std::shared_ptr<llm::CompletionClient> client) {
  client_ = std::move(client);
}

TurnOutcome Orchestrator::run_turn(const std::string &user_message, const EventSink &sink) {
  history_.push_back(Message::user(user_message));
  sink(events::UserEcho{user_message});

  spdlog::info("[Engine] Turn started for session {} (agent: {})", short_id(session_id_), to_string(current_agent_));

  auto outcome = TurnOutcome::BudgetExhausted;
  for (int iteration = 0; iteration < options_.max_iterations; ++iteration) {
    const auto &agent = agents_.get(current_agent_);
    sink(events::AgentActivated{agent.type, agent.name});

    std::vector<ToolCall> calls;
    try {
      calls = stream_completion(agent, sink);
    } catch (const std::exception &e) {
      spdlog::error("[Engine] Completion failed for agent {}: {}", to_string(agent.type), e.what());
      sink(events::TurnError{agent.type, e.what()});
      outcome = TurnOutcome::Failed;
      break;
    }

    if (calls.empty()) {
      outcome = TurnOutcome::Completed;
      break;
    }

    if (!run_tool_calls(agent, calls, sink)) {
      outcome = TurnOutcome::Completed;
      break;
    }
  }

  if (outcome == TurnOutcome::BudgetExhausted) {
    spdlog::warn("[Engine] Iteration budget of {} exhausted for session {}", options_.max_iterations, short_id(session_id_));
  }

  sink(events::TurnComplete{current_agent_, outcome});
  spdlog::info("[Engine] Turn finished for session {} (agent: {}, outcome: {})", short_id(session_id_), to_string(current_agent_),
               to_string(outcome));
  return outcome;
}

std::vector<ToolCall> Orchestrator::stream_completion(const AgentDefinition &agent, const EventSink &sink) {
  if (!client_) {
    throw std::runtime_error("No completion client configured");
  }

  llm::CompletionRequest request;
  request.model = options_.model;
  request.instructions = agent.instructions;
  request.history = history_;
  request.tools = agent.tools;

  auto stream = client_->invoke(request);
  if (!stream) {
    throw std::runtime_error("Completion client '" + client_->name() + "' returned no stream");
  }

  std::string content;
  ToolCallAssembler assembler;

  while (auto fragment = stream->next()) {
    if (auto *text = std::get_if<llm::TextFragment>(&*fragment)) {
      if (text->text.empty()) continue;
      content += text->text;
      sink(events::ContentFragment{agent.type, text->text});
    } else if (auto *call = std::get_if<llm::ToolCallFragment>(&*fragment)) {
      assembler.add(*call);
    }
  }

  auto calls = assembler.finish();
  history_.push_back(Message::assistant(std::move(content), calls));
  return calls;
}

bool Orchestrator::run_tool_calls(const AgentDefinition &agent, const std::vector<ToolCall> &calls, const EventSink &sink) {
  bool handoff = false;
  ToolContext ctx{session_id_, agent.type};

  for (const auto &call : calls) {
    json arguments;
    std::optional<std::string> parse_error;
    try {
      arguments = call.arguments.empty() ? json::object() : json::parse(call.arguments);
    } catch (const json::parse_error &e) {
      parse_error = e.what();
      arguments = call.arguments;
    }

    sink(events::ToolInvoked{agent.type, call.id, call.name, arguments});

    ToolResult result;
    try {
      auto target = ToolRegistry::handoff_target(call.name);
      if (parse_error) {
        spdlog::warn("[Engine] Malformed arguments for tool '{}': {}", call.name, *parse_error);
        result = ToolResult::error("Invalid arguments for tool '" + call.name + "': " + *parse_error);
      } else if (target && agents_.contains(*target)) {
        spdlog::info("[Engine] Handoff {} -> {}", to_string(current_agent_), to_string(*target));
        current_agent_ = *target;
        handoff = true;
        result = ToolResult::success({{"handoff", to_string(*target)}});
      } else {
        result = tools_.execute(call.name, arguments, ctx);
      }
    } catch (const std::exception &e) {
      spdlog::error("[Engine] Tool call '{}' failed: {}", call.id, e.what());
      result = ToolResult::error(std::string("Tool call failed: ") + e.what());
    }

    auto result_json = result.to_json();
    sink(events::ToolCompleted{agent.type, call.id, call.name, result_json});
    // Tool names and parse errors may carry raw bytes from upstream
    history_.push_back(Message::tool(call.id, result_json.dump(-1, ' ', false, json::error_handler_t::replace)));
  }

  return handoff;
}

}  // namespace relay
