#include "agent/tool_call_assembler.hpp"

#include "core/uuid.hpp"

namespace relay {

void ToolCallAssembler::add(const llm::ToolCallFragment &fragment) {
  auto [it, inserted] = calls_.try_emplace(fragment.index);
  if (inserted) {
    order_.push_back(fragment.index);
  }

  auto &call = it->second;
  if (call.id.empty() && fragment.id && !fragment.id->empty()) {
    call.id = *fragment.id;
  }
  if (call.name.empty() && fragment.name && !fragment.name->empty()) {
    call.name = *fragment.name;
  }
  call.arguments += fragment.arguments;
}

std::vector<ToolCall> ToolCallAssembler::finish() {
  std::vector<ToolCall> out;
  out.reserve(order_.size());

  for (int index : order_) {
    auto &call = calls_[index];
    if (call.id.empty()) {
      call.id = "call_" + random_token(12);
    }
    out.push_back(ToolCall{std::move(call.id), std::move(call.name), std::move(call.arguments)});
  }

  calls_.clear();
  order_.clear();
  return out;
}

}  // namespace relay
