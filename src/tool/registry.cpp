// ToolRegistry - name lookup and exception-safe execution
#include <spdlog/spdlog.h>

#include "tool/tool.hpp"

namespace relay {

namespace {
constexpr char kHandoffPrefix[] = "handoff_to_";
}

void ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
  if (!tool) return;

  std::lock_guard lock(mutex_);
  auto name = tool->name();
  if (tools_.count(name) > 0) {
    spdlog::warn("[Tools] Replacing tool '{}'", name);
  }
  tools_[name] = std::move(tool);
}

void ToolRegistry::unregister_tool(const std::string &name) {
  std::lock_guard lock(mutex_);
  tools_.erase(name);
}

bool ToolRegistry::has_tool(const std::string &name) const {
  std::lock_guard lock(mutex_);
  return tools_.count(name) > 0;
}

std::shared_ptr<Tool> ToolRegistry::get(const std::string &name) const {
  std::lock_guard lock(mutex_);
  auto it = tools_.find(name);
  if (it == tools_.end()) {
    return nullptr;
  }
  return it->second;
}

std::vector<std::string> ToolRegistry::names() const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> out;
  out.reserve(tools_.size());
  for (const auto &[name, tool] : tools_) {
    out.push_back(name);
  }
  return out;
}

ToolResult ToolRegistry::execute(const std::string &name, const json &args, const ToolContext &ctx) const {
  auto tool = get(name);
  if (!tool) {
    spdlog::warn("[Tools] Unknown tool '{}'", name);
    return ToolResult::error("Unknown tool: " + name);
  }

  try {
    return tool->execute(args, ctx).get();
  } catch (const std::exception &e) {
    spdlog::warn("[Tools] Tool '{}' failed: {}", name, e.what());
    return ToolResult::error(std::string("Tool '") + name + "' failed: " + e.what());
  } catch (...) {
    spdlog::warn("[Tools] Tool '{}' failed with a non-standard exception", name);
    return ToolResult::error("Tool '" + name + "' failed");
  }
}

std::optional<AgentType> ToolRegistry::handoff_target(const std::string &tool_name) {
  const std::string prefix = kHandoffPrefix;
  if (tool_name.rfind(prefix, 0) != 0) {
    return std::nullopt;
  }
  return parse_agent_type(tool_name.substr(prefix.size()));
}

std::string ToolRegistry::handoff_tool_name(AgentType target) {
  return kHandoffPrefix + to_string(target);
}

}  // namespace relay
