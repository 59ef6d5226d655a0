#include "tool/tool.hpp"

namespace relay {

json ToolSchema::to_json_schema() const {
  json properties = json::object();
  json required = json::array();

  for (const auto &param : parameters) {
    json prop = {{"type", param.type}, {"description", param.description}};
    if (param.default_value) {
      prop["default"] = *param.default_value;
    }
    if (param.enum_values) {
      prop["enum"] = *param.enum_values;
    }
    properties[param.name] = std::move(prop);

    if (param.required) {
      required.push_back(param.name);
    }
  }

  json schema = {{"type", "object"}, {"properties", std::move(properties)}};
  if (!required.empty()) {
    schema["required"] = std::move(required);
  }
  return schema;
}

ToolResult ToolResult::success(json fields) {
  ToolResult result;
  result.data = fields.is_object() ? std::move(fields) : json{{"result", std::move(fields)}};
  return result;
}

ToolResult ToolResult::error(std::string message) {
  ToolResult result;
  result.is_error = true;
  result.error_message = std::move(message);
  return result;
}

json ToolResult::to_json() const {
  json j = {{"success", !is_error}};
  for (auto it = data.begin(); it != data.end(); ++it) {
    if (it.key() != "success") {
      j[it.key()] = it.value();
    }
  }
  if (is_error) {
    j["error"] = error_message;
  }
  return j;
}

}  // namespace relay
