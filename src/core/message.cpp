#include "core/message.hpp"

namespace relay {

Message Message::system(std::string content) {
  return Message(Role::System, std::move(content));
}

Message Message::user(std::string content) {
  return Message(Role::User, std::move(content));
}

Message Message::assistant(std::string content, std::vector<ToolCall> calls) {
  Message msg(Role::Assistant, std::move(content));
  msg.tool_calls = std::move(calls);
  return msg;
}

Message Message::tool(std::string call_id, std::string content) {
  Message msg(Role::Tool, std::move(content));
  msg.tool_call_id = std::move(call_id);
  return msg;
}

}  // namespace relay
