#pragma once

#include "ctxpack/memory/thread.hpp"

#include <cstddef>

namespace ctxpack::memory {

// Removes tool results whose tool use is no longer in the thread, the
// messages this leaves empty, then any segment left without content. Returns the number of tool results
// removed; updated_at changes only when something was removed. Idempotent.
size_t repair_orphaned_tool_results(AgentThread& thread);

}  // namespace ctxpack::memory
