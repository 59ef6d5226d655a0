#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include "llm/provider.hpp"

namespace relay::llm {

// Incremental Server-Sent-Events decoder. Input may be split at any byte.
class SseDecoder {
 public:
  // Returns the data payload of every event completed by this chunk
  std::vector<std::string> feed(std::string_view chunk);

 private:
  void process_line(std::string line, std::vector<std::string> &events);

  std::string line_buffer_;
  std::string data_;
  bool has_data_ = false;
};

// Fragments carried by one chat.completion.chunk object
std::vector<Fragment> parse_openai_chunk(const json &chunk);

struct OpenAiConfig {
  std::string base_url = "http://localhost:11434/v1";
  std::string api_key;
  std::string model = "gpt-4-turbo-preview";
  std::chrono::milliseconds timeout = std::chrono::seconds(120);
};

// Streams chat completions from an OpenAI-compatible endpoint over HTTP or HTTPS
class OpenAiClient : public CompletionClient {
 public:
  explicit OpenAiClient(OpenAiConfig config);

  std::string name() const override {
    return "openai";
  }

  // Throws when the endpoint cannot be reached or answers with a non-2xx status
  std::unique_ptr<FragmentStream> invoke(const CompletionRequest &request) override;

 private:
  OpenAiConfig config_;
};

}  // namespace relay::llm
