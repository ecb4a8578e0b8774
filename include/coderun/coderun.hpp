#pragma once

// Core types
#include "core/abort.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/message.hpp"
#include "core/store.hpp"
#include "core/json_store.hpp"
#include "core/types.hpp"
#include "core/uuid.hpp"

// Event bus
#include "bus/bus.hpp"

// Model streams
#include "llm/provider.hpp"
#include "llm/scripted.hpp"
#include "llm/stream.hpp"

// Approvals and hooks
#include "permission/permission.hpp"
#include "plugin/hooks.hpp"

// Working tree snapshots
#include "snapshot/snapshot.hpp"

// Turn processing
#include "session/processor.hpp"
#include "session/status.hpp"

namespace coderun {

// Initialize logging from the configuration
void init(const Config &config = Config::from_env());

// Flush logs and drop hooks and subscriptions
void shutdown();

// Get version string
std::string version();

}  // namespace coderun
