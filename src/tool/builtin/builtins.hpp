#pragma once

#include "store/lifecycle_store.hpp"
#include "tool/tool.hpp"

namespace relay::tools {

// Note tools persist into the auxiliary namespace of the calling session

class SaveNoteTool : public SimpleTool {
 public:
  explicit SaveNoteTool(LifecycleStore &store);

  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json &args, const ToolContext &ctx) override;

 private:
  LifecycleStore &store_;
};

class GetNoteTool : public SimpleTool {
 public:
  explicit GetNoteTool(LifecycleStore &store);

  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json &args, const ToolContext &ctx) override;

 private:
  LifecycleStore &store_;
};

class ListTitlesTool : public SimpleTool {
 public:
  explicit ListTitlesTool(LifecycleStore &store);

  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json &args, const ToolContext &ctx) override;

 private:
  LifecycleStore &store_;
};

// Register save_note, get_note and list_titles
void register_note_tools(ToolRegistry &registry, LifecycleStore &store);

}  // namespace relay::tools
