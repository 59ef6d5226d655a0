#include "agent/events.hpp"

namespace relay::events {

namespace {

// Every alternative needs an overload; a missing one fails to compile
template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

std::string event_name(const TurnEvent &event) {
  return std::visit(overloaded{[](const UserEcho &) {
                                 return "user_message";
                               },
                               [](const AgentActivated &) {
                                 return "agent_updated";
                               },
                               [](const ContentFragment &) {
                                 return "content_delta";
                               },
                               [](const ToolInvoked &) {
                                 return "tool_call";
                               },
                               [](const ToolCompleted &) {
                                 return "tool_result";
                               },
                               [](const TurnError &) {
                                 return "error";
                               },
                               [](const TurnComplete &) {
                                 return "done";
                               }},
                    event);
}

json to_json(const TurnEvent &event) {
  json j = std::visit(overloaded{[](const UserEcho &e) {
                                   return json{{"content", e.content}};
                                 },
                                 [](const AgentActivated &e) {
                                   return json{{"agent", to_string(e.agent)}, {"agent_name", e.agent_name}};
                                 },
                                 [](const ContentFragment &e) {
                                   return json{{"agent", to_string(e.agent)}, {"delta", e.delta}};
                                 },
                                 [](const ToolInvoked &e) {
                                   return json{{"agent", to_string(e.agent)}, {"call_id", e.call_id}, {"tool", e.tool}, {"arguments", e.arguments}};
                                 },
                                 [](const ToolCompleted &e) {
                                   return json{{"agent", to_string(e.agent)}, {"call_id", e.call_id}, {"tool", e.tool}, {"result", e.result}};
                                 },
                                 [](const TurnError &e) {
                                   return json{{"agent", to_string(e.agent)}, {"error", e.message}};
                                 },
                                 [](const TurnComplete &e) {
                                   return json{{"agent", to_string(e.agent)}, {"outcome", to_string(e.outcome)}};
                                 }},
                      event);
  j["type"] = event_name(event);
  return j;
}

}  // namespace relay::events
