#pragma once

// Core types
#include "core/config.hpp"
#include "core/message.hpp"
#include "core/types.hpp"
#include "core/uuid.hpp"

// Session/thread store
#include "store/lifecycle_store.hpp"

// Completion clients
#include "llm/openai.hpp"
#include "llm/provider.hpp"

// Tool system
#include "tool/builtin/builtins.hpp"
#include "tool/tool.hpp"

// Turn engine
#include "agent/agent_definition.hpp"
#include "agent/events.hpp"
#include "agent/orchestrator.hpp"

// Application facade
#include "service/chat_service.hpp"

namespace relay {

// Configure the default spdlog logger from `config.log_level`
void init(const Config &config);

// Get version string
std::string version();

}  // namespace relay
