#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "store/lifecycle_store.hpp"
#include "tool/builtin/builtins.hpp"
#include "tool/tool.hpp"

using namespace relay;
using namespace relay::tools;

// ============================================================================
// NoteToolsTest
// ============================================================================

class NoteToolsTest : public ::testing::Test {
 protected:
  void SetUp() override {
    register_note_tools(registry_, store_);
    session_id_ = store_.create_session().session_id;
  }

  json run(const std::string &tool, const json &args) {
    return registry_.execute(tool, args, ToolContext{session_id_, AgentType::Archivist}).to_json();
  }

  LifecycleStore store_;
  ToolRegistry registry_;
  std::string session_id_;
};

TEST_F(NoteToolsTest, Registered) {
  EXPECT_TRUE(registry_.has_tool("save_note"));
  EXPECT_TRUE(registry_.has_tool("get_note"));
  EXPECT_TRUE(registry_.has_tool("list_titles"));
}

TEST_F(NoteToolsTest, SaveAndGet) {
  auto saved = run("save_note", {{"title", "groceries"}, {"content", "milk, eggs"}});
  EXPECT_EQ(saved["success"], true);
  EXPECT_EQ(saved["message"], "Note 'groceries' saved successfully");

  auto note = run("get_note", {{"title", "groceries"}});
  EXPECT_EQ(note["success"], true);
  EXPECT_EQ(note["title"], "groceries");
  EXPECT_EQ(note["content"], "milk, eggs");

  // 笔记存放在会话的辅助命名空间中
  EXPECT_EQ(store_.get_value(session_id_, "groceries"), "milk, eggs");
}

TEST_F(NoteToolsTest, SaveOverwrites) {
  run("save_note", {{"title", "todo"}, {"content", "one"}});
  run("save_note", {{"title", "todo"}, {"content", "two"}});

  EXPECT_EQ(run("get_note", {{"title", "todo"}})["content"], "two");
  EXPECT_EQ(run("list_titles", json::object())["count"], 1);
}

TEST_F(NoteToolsTest, EmptyContentIsAllowed) {
  auto saved = run("save_note", {{"title", "blank"}, {"content", ""}});
  EXPECT_EQ(saved["success"], true);
  EXPECT_EQ(run("get_note", {{"title", "blank"}})["content"], "");
}

TEST_F(NoteToolsTest, MissingArguments) {
  auto no_title = run("save_note", {{"content", "x"}});
  EXPECT_EQ(no_title["success"], false);
  EXPECT_EQ(no_title["error"], "title is required");

  auto no_content = run("save_note", {{"title", "x"}});
  EXPECT_EQ(no_content["success"], false);
  EXPECT_EQ(no_content["error"], "content is required");

  auto get_no_title = run("get_note", json::object());
  EXPECT_EQ(get_no_title["success"], false);
}

TEST_F(NoteToolsTest, GetMissingNote) {
  auto note = run("get_note", {{"title", "nothing"}});
  EXPECT_EQ(note["success"], false);
  EXPECT_EQ(note["error"], "Note 'nothing' not found");
}

TEST_F(NoteToolsTest, ListTitles) {
  auto empty = run("list_titles", json::object());
  EXPECT_EQ(empty["success"], true);
  EXPECT_EQ(empty["count"], 0);
  EXPECT_TRUE(empty["titles"].empty());

  run("save_note", {{"title", "b"}, {"content", "2"}});
  run("save_note", {{"title", "a"}, {"content", "1"}});

  auto listed = run("list_titles", json::object());
  EXPECT_EQ(listed["count"], 2);
  EXPECT_EQ(listed["titles"], json::array({"a", "b"}));
}

TEST_F(NoteToolsTest, NotesAreScopedToSession) {
  run("save_note", {{"title", "private"}, {"content", "mine"}});

  auto other = store_.create_session().session_id;
  auto result = registry_.execute("get_note", {{"title", "private"}}, ToolContext{other, AgentType::Archivist});
  EXPECT_TRUE(result.is_error);
}

TEST_F(NoteToolsTest, SaveAfterSessionDeleted) {
  store_.delete_session(session_id_);

  auto saved = run("save_note", {{"title", "late"}, {"content", "x"}});
  EXPECT_EQ(saved["success"], false);
  EXPECT_EQ(saved["error"], "Session is no longer available");
}
