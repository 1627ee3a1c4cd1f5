#pragma once
#include <vector>
#include <nlohmann/json.hpp>
#include "conversation/context.hpp"

namespace foreman::conversation {

// Rebuild a conversation from an ordered agent event log.
//
// Assistant text, streaming deltas and tool uses accumulate into one turn
// that is flushed when a user message arrives and at the end of the log.
// Token usage sums result, message_start and message_delta counts.
// Deterministic apart from the returned context's timestamp.
ConversationContext build_conversation_context(const std::vector<nlohmann::json>& events);

} // namespace foreman::conversation
