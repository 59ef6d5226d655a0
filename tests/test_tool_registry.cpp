#include <gtest/gtest.h>

#include <future>
#include <memory>
#include <stdexcept>
#include <string>

#include "agent/agent_definition.hpp"
#include "tool/tool.hpp"

using namespace relay;

namespace {

class EchoTool : public SimpleTool {
 public:
  EchoTool() : SimpleTool("echo", "Echo the input back") {}

  std::vector<ParameterSchema> parameters() const override {
    return {{"text", "string", "Text to echo", true, std::nullopt, std::nullopt},
            {"times", "number", "Repeat count", false, json(1), std::nullopt}};
  }

  std::future<ToolResult> execute(const json &args, const ToolContext &ctx) override {
    return std::async(std::launch::async, [args, ctx]() {
      return ToolResult::success({{"text", args.value("text", "")}, {"session", ctx.session_id}});
    });
  }
};

class ThrowingTool : public SimpleTool {
 public:
  ThrowingTool() : SimpleTool("explode", "Always throws") {}

  std::vector<ParameterSchema> parameters() const override {
    return {};
  }

  std::future<ToolResult> execute(const json &, const ToolContext &) override {
    return std::async(std::launch::async, []() -> ToolResult {
      throw std::runtime_error("boom");
    });
  }
};

// Throws something that is not a std::exception
class RawThrowTool : public SimpleTool {
 public:
  RawThrowTool() : SimpleTool("raw_throw", "Throws an int") {}

  std::vector<ParameterSchema> parameters() const override {
    return {};
  }

  std::future<ToolResult> execute(const json &, const ToolContext &) override {
    return std::async(std::launch::async, []() -> ToolResult {
      throw 42;
    });
  }
};

}  // namespace

// ============================================================================
// ToolSchema / ToolResult
// ============================================================================

TEST(ToolSchemaTest, JsonSchema) {
  EchoTool tool;
  auto schema = tool.schema().to_json_schema();

  EXPECT_EQ(schema["type"], "object");
  EXPECT_EQ(schema["properties"]["text"]["type"], "string");
  EXPECT_EQ(schema["properties"]["times"]["default"], 1);
  ASSERT_EQ(schema["required"].size(), 1u);
  EXPECT_EQ(schema["required"][0], "text");
}

TEST(ToolSchemaTest, NoParametersOmitsRequired) {
  ToolSchema schema{"list_titles", "List all note titles", {}};
  auto j = schema.to_json_schema();

  EXPECT_TRUE(j["properties"].empty());
  EXPECT_FALSE(j.contains("required"));
}

TEST(ToolResultTest, SuccessAlwaysCarriesFlag) {
  auto j = ToolResult::success({{"message", "ok"}}).to_json();
  EXPECT_EQ(j["success"], true);
  EXPECT_EQ(j["message"], "ok");
  EXPECT_FALSE(j.contains("error"));

  EXPECT_EQ(ToolResult::success().to_json(), json({{"success", true}}));
}

TEST(ToolResultTest, NonObjectPayloadIsWrapped) {
  auto j = ToolResult::success(json::array({1, 2})).to_json();
  EXPECT_EQ(j["success"], true);
  EXPECT_EQ(j["result"], json::array({1, 2}));
}

TEST(ToolResultTest, Error) {
  auto j = ToolResult::error("Note 'x' not found").to_json();
  EXPECT_EQ(j["success"], false);
  EXPECT_EQ(j["error"], "Note 'x' not found");
}

// ============================================================================
// ToolRegistry
// ============================================================================

TEST(ToolRegistryTest, RegisterAndLookup) {
  ToolRegistry registry;
  registry.register_tool(std::make_shared<EchoTool>());

  EXPECT_TRUE(registry.has_tool("echo"));
  EXPECT_NE(registry.get("echo"), nullptr);
  EXPECT_EQ(registry.get("missing"), nullptr);
  ASSERT_EQ(registry.names().size(), 1u);

  registry.unregister_tool("echo");
  EXPECT_FALSE(registry.has_tool("echo"));
}

TEST(ToolRegistryTest, ExecutePassesContext) {
  ToolRegistry registry;
  registry.register_tool(std::make_shared<EchoTool>());

  auto result = registry.execute("echo", {{"text", "hi"}}, ToolContext{"session-1", AgentType::Archivist});
  ASSERT_FALSE(result.is_error);
  EXPECT_EQ(result.data["text"], "hi");
  EXPECT_EQ(result.data["session"], "session-1");
}

TEST(ToolRegistryTest, UnknownToolIsErrorResult) {
  ToolRegistry registry;
  auto result = registry.execute("nope", json::object(), ToolContext{});

  EXPECT_TRUE(result.is_error);
  EXPECT_EQ(result.error_message, "Unknown tool: nope");
}

TEST(ToolRegistryTest, ThrowingToolIsErrorResult) {
  ToolRegistry registry;
  registry.register_tool(std::make_shared<ThrowingTool>());

  ToolResult result;
  EXPECT_NO_THROW(result = registry.execute("explode", json::object(), ToolContext{}));
  EXPECT_TRUE(result.is_error);
  EXPECT_NE(result.error_message.find("boom"), std::string::npos);
}

TEST(ToolRegistryTest, NonStandardExceptionIsErrorResult) {
  ToolRegistry registry;
  registry.register_tool(std::make_shared<RawThrowTool>());

  ToolResult result;
  EXPECT_NO_THROW(result = registry.execute("raw_throw", json::object(), ToolContext{}));
  EXPECT_TRUE(result.is_error);
  EXPECT_EQ(result.error_message, "Tool 'raw_throw' failed");
}

TEST(ToolRegistryTest, HandoffNames) {
  EXPECT_EQ(ToolRegistry::handoff_tool_name(AgentType::Archivist), "handoff_to_archivist");
  EXPECT_EQ(ToolRegistry::handoff_target("handoff_to_concierge"), AgentType::Concierge);
  EXPECT_EQ(ToolRegistry::handoff_target("handoff_to_archivist"), AgentType::Archivist);

  EXPECT_FALSE(ToolRegistry::handoff_target("handoff_to_nobody").has_value());
  EXPECT_FALSE(ToolRegistry::handoff_target("save_note").has_value());
}

// ============================================================================
// AgentCatalog
// ============================================================================

TEST(AgentCatalogTest, Builtin) {
  auto catalog = AgentCatalog::builtin();
  ASSERT_EQ(catalog.size(), 2u);

  const auto &concierge = catalog.get(AgentType::Concierge);
  EXPECT_EQ(concierge.name, "Concierge");
  ASSERT_EQ(concierge.tools.size(), 1u);
  EXPECT_TRUE(concierge.exposes("handoff_to_archivist"));
  EXPECT_FALSE(concierge.exposes("save_note"));

  const auto &archivist = catalog.get(AgentType::Archivist);
  EXPECT_EQ(archivist.name, "Archivist");
  EXPECT_TRUE(archivist.exposes("save_note"));
  EXPECT_TRUE(archivist.exposes("get_note"));
  EXPECT_TRUE(archivist.exposes("list_titles"));
  EXPECT_TRUE(archivist.exposes("handoff_to_concierge"));
}

TEST(AgentCatalogTest, HandoffSchemaParameter) {
  auto schema = handoff_schema(AgentType::Archivist, "Hand off", "reason", "Why").to_json_schema();
  EXPECT_EQ(schema["properties"]["reason"]["type"], "string");
  EXPECT_EQ(schema["required"][0], "reason");
}

TEST(AgentCatalogTest, UnknownAgentThrows) {
  AgentCatalog empty;
  EXPECT_FALSE(empty.contains(AgentType::Concierge));
  EXPECT_THROW(empty.get(AgentType::Concierge), std::out_of_range);
}
