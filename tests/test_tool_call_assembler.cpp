#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>

#include "agent/tool_call_assembler.hpp"

using namespace relay;
using relay::llm::ToolCallFragment;

namespace {

ToolCallFragment fragment(int index, std::optional<std::string> id, std::optional<std::string> name, std::string arguments) {
  ToolCallFragment f;
  f.index = index;
  f.id = std::move(id);
  f.name = std::move(name);
  f.arguments = std::move(arguments);
  return f;
}

}  // namespace

TEST(ToolCallAssemblerTest, EmptyStream) {
  ToolCallAssembler assembler;
  EXPECT_TRUE(assembler.empty());
  EXPECT_TRUE(assembler.finish().empty());
}

TEST(ToolCallAssemblerTest, ArgumentsSplitAcrossFragments) {
  ToolCallAssembler assembler;
  assembler.add(fragment(0, "call_abc", "save_note", "{\"a\":"));
  assembler.add(fragment(0, std::nullopt, std::nullopt, "1}"));

  auto calls = assembler.finish();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].id, "call_abc");
  EXPECT_EQ(calls[0].name, "save_note");
  EXPECT_EQ(calls[0].arguments, "{\"a\":1}");
  EXPECT_EQ(nlohmann::json::parse(calls[0].arguments)["a"], 1);
}

TEST(ToolCallAssemblerTest, InterleavedIndices) {
  ToolCallAssembler assembler;
  assembler.add(fragment(1, "call_b", "get_note", "{\"title\""));
  assembler.add(fragment(0, "call_a", "list_titles", "{"));
  assembler.add(fragment(1, std::nullopt, std::nullopt, ":\"x\"}"));
  assembler.add(fragment(0, std::nullopt, std::nullopt, "}"));
  EXPECT_EQ(assembler.size(), 2u);

  // 按首次出现的顺序输出，而非按索引排序
  auto calls = assembler.finish();
  ASSERT_EQ(calls.size(), 2u);
  EXPECT_EQ(calls[0].id, "call_b");
  EXPECT_EQ(calls[0].arguments, "{\"title\":\"x\"}");
  EXPECT_EQ(calls[1].id, "call_a");
  EXPECT_EQ(calls[1].arguments, "{}");
}

TEST(ToolCallAssemblerTest, NameAndIdAreNotOverwritten) {
  ToolCallAssembler assembler;
  assembler.add(fragment(0, "call_first", "save_note", ""));
  assembler.add(fragment(0, "call_second", "get_note", "{}"));
  assembler.add(fragment(0, "", "", ""));

  auto calls = assembler.finish();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].id, "call_first");
  EXPECT_EQ(calls[0].name, "save_note");
}

TEST(ToolCallAssemblerTest, NameArrivesLate) {
  ToolCallAssembler assembler;
  assembler.add(fragment(0, std::nullopt, std::nullopt, "{}"));
  assembler.add(fragment(0, "call_1", "list_titles", ""));

  auto calls = assembler.finish();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].id, "call_1");
  EXPECT_EQ(calls[0].name, "list_titles");
}

TEST(ToolCallAssemblerTest, MissingIdIsGenerated) {
  ToolCallAssembler assembler;
  assembler.add(fragment(0, std::nullopt, "list_titles", ""));
  assembler.add(fragment(1, std::nullopt, "list_titles", ""));

  auto calls = assembler.finish();
  ASSERT_EQ(calls.size(), 2u);
  EXPECT_EQ(calls[0].id.rfind("call_", 0), 0u);
  EXPECT_GT(calls[0].id.size(), 5u);
  EXPECT_NE(calls[0].id, calls[1].id);
}

TEST(ToolCallAssemblerTest, FinishResets) {
  ToolCallAssembler assembler;
  assembler.add(fragment(0, "call_1", "list_titles", "{}"));
  ASSERT_EQ(assembler.finish().size(), 1u);

  EXPECT_TRUE(assembler.empty());
  EXPECT_TRUE(assembler.finish().empty());
}
