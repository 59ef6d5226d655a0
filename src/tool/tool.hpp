#pragma once

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace relay {

using json = nlohmann::json;

// Single parameter of a tool's input schema
struct ParameterSchema {
  std::string name;
  std::string type;  // "string", "number", "boolean", "array", "object"
  std::string description;
  bool required = true;
  std::optional<json> default_value;
  std::optional<std::vector<std::string>> enum_values;
};

// Name, description and parameters as exposed to the completion service
struct ToolSchema {
  std::string name;
  std::string description;
  std::vector<ParameterSchema> parameters;

  // JSON Schema object describing the parameters
  json to_json_schema() const;
};

// Outcome of a tool execution. Serializes to an object that always carries "success".
struct ToolResult {
  bool is_error = false;
  json data = json::object();  // extra fields merged into the serialized object
  std::string error_message;

  static ToolResult success(json fields = json::object());
  static ToolResult error(std::string message);

  json to_json() const;
};

// Per-call context handed to tools
struct ToolContext {
  std::string session_id;
  AgentType agent = AgentType::Concierge;
};

// Base interface for all tools
class Tool {
 public:
  virtual ~Tool() = default;

  virtual const std::string &name() const = 0;
  virtual const std::string &description() const = 0;
  virtual std::vector<ParameterSchema> parameters() const = 0;

  virtual std::future<ToolResult> execute(const json &args, const ToolContext &ctx) = 0;

  ToolSchema schema() const {
    return ToolSchema{name(), description(), parameters()};
  }
};

// Tool with a fixed name and description
class SimpleTool : public Tool {
 public:
  SimpleTool(std::string name, std::string description) : name_(std::move(name)), description_(std::move(description)) {}

  const std::string &name() const override {
    return name_;
  }
  const std::string &description() const override {
    return description_;
  }

 private:
  std::string name_;
  std::string description_;
};

// Maps tool names to tools and executes them without ever throwing.
//
// Handoff pseudo-tools (handoff_to_<agent>) are never registered here: they
// are control-plane instructions recognised through handoff_target().
class ToolRegistry {
 public:
  ToolRegistry() = default;

  ToolRegistry(const ToolRegistry &) = delete;
  ToolRegistry &operator=(const ToolRegistry &) = delete;

  void register_tool(std::shared_ptr<Tool> tool);
  void unregister_tool(const std::string &name);

  bool has_tool(const std::string &name) const;
  std::shared_ptr<Tool> get(const std::string &name) const;
  std::vector<std::string> names() const;

  // Runs the named tool; unknown tools and thrown exceptions become error results
  ToolResult execute(const std::string &name, const json &args, const ToolContext &ctx) const;

  // "handoff_to_archivist" -> AgentType::Archivist
  static std::optional<AgentType> handoff_target(const std::string &tool_name);
  static std::string handoff_tool_name(AgentType target);

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Tool>> tools_;
};

}  // namespace relay
