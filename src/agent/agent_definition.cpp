#include "agent/agent_definition.hpp"

#include <algorithm>
#include <stdexcept>

namespace relay {

namespace {

constexpr char kConciergeInstructions[] = R"(You are the Concierge, a friendly front-facing assistant.
You help users with general queries and can hand off to the Archivist for note-related tasks.

When users want to:
- Save a note
- Retrieve a note
- List notes
- Manage their notes in any way

Respond with: "I'll hand this over to our Archivist specialist who handles notes."
And use the handoff_to_archivist function.

For all other queries, help the user directly.)";

constexpr char kArchivistInstructions[] = R"(You are the Archivist, a specialist in managing notes.
You have access to three tools:
- save_note: Save a note with title and content
- get_note: Retrieve a note by title
- list_titles: List all available notes

After completing note operations, you can return control to the Concierge
using handoff_to_concierge if the user has additional non-note queries.

Be efficient and clear in your note management.)";

}  // namespace

bool AgentDefinition::exposes(const std::string &tool_name) const {
  return std::any_of(tools.begin(), tools.end(), [&](const ToolSchema &t) {
    return t.name == tool_name;
  });
}

ToolSchema handoff_schema(AgentType target, std::string description, std::string param_name, std::string param_description) {
  ToolSchema schema;
  schema.name = ToolRegistry::handoff_tool_name(target);
  schema.description = std::move(description);
  schema.parameters.push_back({std::move(param_name), "string", std::move(param_description), true, std::nullopt, std::nullopt});
  return schema;
}

AgentCatalog AgentCatalog::builtin() {
  AgentCatalog catalog;

  AgentDefinition concierge;
  concierge.type = AgentType::Concierge;
  concierge.name = "Concierge";
  concierge.instructions = kConciergeInstructions;
  concierge.tools.push_back(
      handoff_schema(AgentType::Archivist, "Hand off conversation to the Archivist for note management", "reason", "Reason for handoff"));
  catalog.add(std::move(concierge));

  AgentDefinition archivist;
  archivist.type = AgentType::Archivist;
  archivist.name = "Archivist";
  archivist.instructions = kArchivistInstructions;
  archivist.tools.push_back({"save_note",
                             "Save a note with title and content",
                             {{"title", "string", "Title of the note", true, std::nullopt, std::nullopt},
                              {"content", "string", "Content of the note", true, std::nullopt, std::nullopt}}});
  archivist.tools.push_back(
      {"get_note", "Retrieve a note by title", {{"title", "string", "Title of the note", true, std::nullopt, std::nullopt}}});
  archivist.tools.push_back({"list_titles", "List all note titles", {}});
  archivist.tools.push_back(
      handoff_schema(AgentType::Concierge, "Return control to the Concierge", "summary", "Summary of completed work"));
  catalog.add(std::move(archivist));

  return catalog;
}

void AgentCatalog::add(AgentDefinition definition) {
  auto type = definition.type;
  agents_[type] = std::move(definition);
}

bool AgentCatalog::contains(AgentType type) const {
  return agents_.count(type) > 0;
}

const AgentDefinition &AgentCatalog::get(AgentType type) const {
  auto it = agents_.find(type);
  if (it == agents_.end()) {
    throw std::out_of_range("Unknown agent: " + to_string(type));
  }
  return it->second;
}

}  // namespace relay
