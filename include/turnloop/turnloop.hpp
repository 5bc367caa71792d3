#pragma once

// Core types
#include "turnloop/core/config.hpp"
#include "turnloop/core/message.hpp"
#include "turnloop/core/types.hpp"
#include "turnloop/core/uuid.hpp"

// LLM access
#include "turnloop/llm/provider.hpp"
#include "turnloop/llm/retry.hpp"
#include "turnloop/llm/router.hpp"

// Tool system
#include "turnloop/tool/policy.hpp"
#include "turnloop/tool/tool.hpp"

// Context management
#include "turnloop/context/compaction.hpp"
#include "turnloop/context/history.hpp"

// Checkpoints
#include "turnloop/snapshot/snapshot.hpp"
#include "turnloop/snapshot/store.hpp"

// Turn loop
#include "turnloop/session/orchestrator.hpp"

namespace turnloop {

// Set up process-wide logging from the config
void init(const Config& config = Config{});

// Flush and drop loggers
void shutdown();

std::string version();

}  // namespace turnloop
