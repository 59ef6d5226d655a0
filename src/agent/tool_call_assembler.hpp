#pragma once

#include <map>
#include <string>
#include <vector>

#include "core/message.hpp"
#include "llm/provider.hpp"

namespace relay {

// Reassembles streamed tool-call fragments into complete calls.
//
// Fragments are keyed by their position index. The first fragment seen for an
// index opens a call; later fragments with the same index append their
// argument text in arrival order. The call id and name are taken from the
// first fragment that carries them and are never overwritten. Arguments stay
// raw text; parsing happens after the stream is complete.
class ToolCallAssembler {
 public:
  void add(const llm::ToolCallFragment &fragment);

  bool empty() const {
    return order_.empty();
  }
  size_t size() const {
    return order_.size();
  }

  // Completed calls in order of first appearance. Calls that never received an
  // id get a generated one so tool results can always reference them.
  std::vector<ToolCall> finish();

 private:
  struct PendingCall {
    std::string id;
    std::string name;
    std::string arguments;
  };

  std::map<int, PendingCall> calls_;
  std::vector<int> order_;
};

}  // namespace relay
