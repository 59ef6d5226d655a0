#include "llm/openai.hpp"

#include <spdlog/spdlog.h>

#include <deque>
#include <stdexcept>

#include "net/http_client.hpp"

namespace relay::llm {

// ============================================================
// SseDecoder
// ============================================================

std::vector<std::string> SseDecoder::feed(std::string_view chunk) {
  std::vector<std::string> events;
  line_buffer_.append(chunk.data(), chunk.size());

  size_t start = 0;
  while (true) {
    auto eol = line_buffer_.find('\n', start);
    if (eol == std::string::npos) break;

    std::string line = line_buffer_.substr(start, eol - start);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    process_line(std::move(line), events);
    start = eol + 1;
  }
  line_buffer_.erase(0, start);
  return events;
}

void SseDecoder::process_line(std::string line, std::vector<std::string> &events) {
  // Blank line dispatches the pending event
  if (line.empty()) {
    if (has_data_) {
      events.push_back(std::move(data_));
      data_.clear();
      has_data_ = false;
    }
    return;
  }

  if (line[0] == ':') return;  // comment

  auto colon = line.find(':');
  std::string field = line.substr(0, colon);
  std::string value;
  if (colon != std::string::npos) {
    value = line.substr(colon + 1);
    if (!value.empty() && value[0] == ' ') value.erase(0, 1);
  }

  if (field == "data") {
    if (has_data_) data_ += '\n';
    data_ += value;
    has_data_ = true;
  }
}

// ============================================================
// Chunk parsing
// ============================================================

std::vector<Fragment> parse_openai_chunk(const json &chunk) {
  std::vector<Fragment> fragments;

  if (!chunk.contains("choices") || !chunk["choices"].is_array() || chunk["choices"].empty()) {
    return fragments;
  }
  const auto &choice = chunk["choices"][0];
  if (!choice.contains("delta") || !choice["delta"].is_object()) {
    return fragments;
  }
  const auto &delta = choice["delta"];

  if (delta.contains("content") && delta["content"].is_string()) {
    auto text = delta["content"].get<std::string>();
    if (!text.empty()) {
      fragments.push_back(TextFragment{std::move(text)});
    }
  }

  if (delta.contains("tool_calls") && delta["tool_calls"].is_array()) {
    for (const auto &tc : delta["tool_calls"]) {
      ToolCallFragment frag;
      frag.index = tc.value("index", 0);
      if (tc.contains("id") && tc["id"].is_string()) {
        frag.id = tc["id"].get<std::string>();
      }
      if (tc.contains("function") && tc["function"].is_object()) {
        const auto &fn = tc["function"];
        if (fn.contains("name") && fn["name"].is_string()) {
          frag.name = fn["name"].get<std::string>();
        }
        if (fn.contains("arguments") && fn["arguments"].is_string()) {
          frag.arguments = fn["arguments"].get<std::string>();
        }
      }
      fragments.push_back(std::move(frag));
    }
  }

  return fragments;
}

// ============================================================
// OpenAiClient
// ============================================================

namespace {

class OpenAiFragmentStream : public FragmentStream {
 public:
  explicit OpenAiFragmentStream(std::unique_ptr<net::HttpStream> http) : http_(std::move(http)) {}

  std::optional<Fragment> next() override {
    while (pending_.empty() && !done_) {
      auto piece = http_->read_some();
      if (!piece) {
        done_ = true;
        break;
      }

      for (auto &payload : sse_.feed(*piece)) {
        if (payload == "[DONE]") {
          done_ = true;
          break;
        }

        json chunk = json::parse(payload);
        if (chunk.contains("error")) {
          const auto &err = chunk["error"];
          throw std::runtime_error("Completion service error: " + (err.is_object() ? err.value("message", err.dump()) : err.dump()));
        }
        for (auto &fragment : parse_openai_chunk(chunk)) {
          pending_.push_back(std::move(fragment));
        }
      }
    }

    if (pending_.empty()) return std::nullopt;
    auto fragment = std::move(pending_.front());
    pending_.pop_front();
    return fragment;
  }

 private:
  std::unique_ptr<net::HttpStream> http_;
  SseDecoder sse_;
  std::deque<Fragment> pending_;
  bool done_ = false;
};

}  // namespace

OpenAiClient::OpenAiClient(OpenAiConfig config) : config_(std::move(config)) {}

std::unique_ptr<FragmentStream> OpenAiClient::invoke(const CompletionRequest &request) {
  std::string base = config_.base_url;
  while (!base.empty() && base.back() == '/') base.pop_back();

  auto url = net::ParsedUrl::parse(base + "/chat/completions");
  if (!url) {
    throw std::runtime_error("Invalid completion base URL: " + config_.base_url);
  }

  auto body = request.to_openai_format();
  if (request.model.empty()) {
    body["model"] = config_.model;
  }

  net::HttpRequest http_request;
  http_request.method = "POST";
  http_request.url = *url;
  http_request.timeout = config_.timeout;
  http_request.headers["Content-Type"] = "application/json";
  http_request.headers["Accept"] = "text/event-stream";
  if (!config_.api_key.empty()) {
    http_request.headers["Authorization"] = "Bearer " + config_.api_key;
  }
  http_request.body = body.dump(-1, ' ', false, json::error_handler_t::replace);

  spdlog::debug("[OpenAI] POST {} ({} messages, {} tools)", url->target(), body["messages"].size(), request.tools.size());

  auto http = std::make_unique<net::HttpStream>(http_request);
  if (!http->ok()) {
    auto status = http->status_code();
    auto detail = http->read_all();
    spdlog::error("[OpenAI] Request failed with status {}", status);
    throw std::runtime_error("Completion request failed with status " + std::to_string(status) + ": " + detail);
  }

  return std::make_unique<OpenAiFragmentStream>(std::move(http));
}

}  // namespace relay::llm
