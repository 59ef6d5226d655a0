#pragma once

#include <map>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "tool/tool.hpp"

namespace relay {

// Static description of one agent variant
struct AgentDefinition {
  AgentType type = AgentType::Concierge;
  std::string name;          // display name
  std::string instructions;  // system prompt
  std::vector<ToolSchema> tools;

  bool exposes(const std::string &tool_name) const;
};

// Schema of the handoff pseudo-tool that switches control to `target`
ToolSchema handoff_schema(AgentType target, std::string description, std::string param_name, std::string param_description);

// Immutable lookup of agent definitions by type
class AgentCatalog {
 public:
  // Concierge + Archivist
  static AgentCatalog builtin();

  void add(AgentDefinition definition);

  bool contains(AgentType type) const;

  // Throws std::out_of_range for unknown agents
  const AgentDefinition &get(AgentType type) const;

  size_t size() const {
    return agents_.size();
  }

 private:
  std::map<AgentType, AgentDefinition> agents_;
};

}  // namespace relay
