#include <spdlog/spdlog.h>

#include "builtins.hpp"
#include "core/uuid.hpp"

namespace relay::tools {

namespace {

// Reads a required string argument; empty when missing or not a string
std::string string_arg(const json &args, const char *key) {
  if (!args.is_object() || !args.contains(key) || !args[key].is_string()) {
    return "";
  }
  return args[key].get<std::string>();
}

}  // namespace

// ============================================================================
// SaveNoteTool
// ============================================================================

SaveNoteTool::SaveNoteTool(LifecycleStore &store) : SimpleTool("save_note", "Save a note with title and content"), store_(store) {}

std::vector<ParameterSchema> SaveNoteTool::parameters() const {
  return {{"title", "string", "Title of the note", true, std::nullopt, std::nullopt},
          {"content", "string", "Content of the note", true, std::nullopt, std::nullopt}};
}

std::future<ToolResult> SaveNoteTool::execute(const json &args, const ToolContext &ctx) {
  return std::async(std::launch::async, [this, args, ctx]() -> ToolResult {
    std::string title = string_arg(args, "title");
    if (title.empty()) {
      return ToolResult::error("title is required");
    }
    if (!args.contains("content") || !args["content"].is_string()) {
      return ToolResult::error("content is required");
    }

    if (!store_.put_value(ctx.session_id, title, args["content"].get<std::string>())) {
      return ToolResult::error("Session is no longer available");
    }

    spdlog::info("[Tools] Saved note '{}' for session {}", title, short_id(ctx.session_id));
    return ToolResult::success({{"message", "Note '" + title + "' saved successfully"}});
  });
}

// ============================================================================
// GetNoteTool
// ============================================================================

GetNoteTool::GetNoteTool(LifecycleStore &store) : SimpleTool("get_note", "Retrieve a note by title"), store_(store) {}

std::vector<ParameterSchema> GetNoteTool::parameters() const {
  return {{"title", "string", "Title of the note", true, std::nullopt, std::nullopt}};
}

std::future<ToolResult> GetNoteTool::execute(const json &args, const ToolContext &ctx) {
  return std::async(std::launch::async, [this, args, ctx]() -> ToolResult {
    std::string title = string_arg(args, "title");
    if (title.empty()) {
      return ToolResult::error("title is required");
    }

    auto content = store_.get_value(ctx.session_id, title);
    if (!content) {
      return ToolResult::error("Note '" + title + "' not found");
    }

    spdlog::info("[Tools] Retrieved note '{}' for session {}", title, short_id(ctx.session_id));
    return ToolResult::success({{"title", title}, {"content", *content}});
  });
}

// ============================================================================
// ListTitlesTool
// ============================================================================

ListTitlesTool::ListTitlesTool(LifecycleStore &store) : SimpleTool("list_titles", "List all note titles"), store_(store) {}

std::vector<ParameterSchema> ListTitlesTool::parameters() const {
  return {};
}

std::future<ToolResult> ListTitlesTool::execute(const json & /*args*/, const ToolContext &ctx) {
  return std::async(std::launch::async, [this, ctx]() -> ToolResult {
    auto titles = store_.list_keys(ctx.session_id);
    spdlog::info("[Tools] Listed {} note titles for session {}", titles.size(), short_id(ctx.session_id));
    return ToolResult::success({{"titles", titles}, {"count", titles.size()}});
  });
}

void register_note_tools(ToolRegistry &registry, LifecycleStore &store) {
  registry.register_tool(std::make_shared<SaveNoteTool>(store));
  registry.register_tool(std::make_shared<GetNoteTool>(store));
  registry.register_tool(std::make_shared<ListTitlesTool>(store));
}

}  // namespace relay::tools
