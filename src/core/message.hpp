#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace relay {

// A complete tool call requested by the assistant.
// `arguments` is the raw JSON text exactly as it was streamed.
struct ToolCall {
  std::string id;
  std::string name;
  std::string arguments;
};

// One entry of the conversation history sent to the completion client
struct Message {
  Role role = Role::User;
  std::string content;
  std::vector<ToolCall> tool_calls;         // assistant only
  std::optional<std::string> tool_call_id;  // tool only

  Message() = default;
  Message(Role r, std::string c) : role(r), content(std::move(c)) {}

  static Message system(std::string content);
  static Message user(std::string content);
  static Message assistant(std::string content, std::vector<ToolCall> calls = {});
  static Message tool(std::string call_id, std::string content);
};

}  // namespace relay
