#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/message.hpp"
#include "tool/tool.hpp"

namespace relay::llm {

using json = nlohmann::json;

// Incremental assistant text
struct TextFragment {
  std::string text;
};

// Partial tool call. Fragments sharing an index belong to the same call.
struct ToolCallFragment {
  int index = 0;
  std::optional<std::string> id;
  std::optional<std::string> name;
  std::string arguments;  // argument text chunk, may split anywhere
};

using Fragment = std::variant<TextFragment, ToolCallFragment>;

// Lazy sequence of fragments for one completion. next() may throw.
class FragmentStream {
 public:
  virtual ~FragmentStream() = default;

  // std::nullopt once the completion is finished
  virtual std::optional<Fragment> next() = 0;
};

struct CompletionRequest {
  std::string model;
  std::string instructions;      // sent as the leading system message
  std::vector<Message> history;  // chronological, untruncated
  std::vector<ToolSchema> tools;

  // OpenAI chat-completions request body with stream=true
  json to_openai_format() const;
};

// Streaming completion service
class CompletionClient {
 public:
  virtual ~CompletionClient() = default;

  virtual std::string name() const = 0;

  // May throw on transport or service failure
  virtual std::unique_ptr<FragmentStream> invoke(const CompletionRequest &request) = 0;
};

// Serves a fixed list of fragments; used for replays and tests
class VectorFragmentStream : public FragmentStream {
 public:
  explicit VectorFragmentStream(std::vector<Fragment> fragments) : fragments_(std::move(fragments)) {}

  std::optional<Fragment> next() override {
    if (position_ >= fragments_.size()) return std::nullopt;
    return fragments_[position_++];
  }

 private:
  std::vector<Fragment> fragments_;
  size_t position_ = 0;
};

}  // namespace relay::llm
