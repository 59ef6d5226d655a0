#include "llm/provider.hpp"

namespace relay::llm {

namespace {

json message_to_openai(const Message &msg) {
  json j = {{"role", to_string(msg.role)}, {"content", msg.content}};

  if (!msg.tool_calls.empty()) {
    json calls = json::array();
    for (const auto &call : msg.tool_calls) {
      calls.push_back({{"id", call.id}, {"type", "function"}, {"function", {{"name", call.name}, {"arguments", call.arguments}}}});
    }
    j["tool_calls"] = std::move(calls);
  }

  if (msg.tool_call_id) {
    j["tool_call_id"] = *msg.tool_call_id;
  }
  return j;
}

}  // namespace

json CompletionRequest::to_openai_format() const {
  json j;
  j["model"] = model;
  j["stream"] = true;

  json messages = json::array();
  messages.push_back({{"role", "system"}, {"content", instructions}});
  for (const auto &msg : history) {
    messages.push_back(message_to_openai(msg));
  }
  j["messages"] = std::move(messages);

  if (!tools.empty()) {
    json tools_json = json::array();
    for (const auto &tool : tools) {
      tools_json.push_back({{"type", "function"},
                            {"function", {{"name", tool.name}, {"description", tool.description}, {"parameters", tool.to_json_schema()}}}});
    }
    j["tools"] = std::move(tools_json);
  }

  return j;
}

}  // namespace relay::llm
