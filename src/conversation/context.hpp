#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace foreman::conversation {

struct ToolResult {
    std::optional<std::string> output;
    std::optional<std::string> error;
    bool is_error = false;
};

struct ToolUse {
    std::string id;
    std::string name;
    nlohmann::json input = nlohmann::json::object();
    std::optional<ToolResult> result;
};

struct ConversationMessage {
    std::string role;     // "user" or "assistant"
    std::string content;
    int64_t timestamp = 0;
    std::vector<ToolUse> tool_uses;  // serialized only when non-empty
};

struct TokenUsage {
    int64_t input_tokens = 0;
    int64_t output_tokens = 0;
    int64_t total_tokens = 0;
};

// Replayable snapshot of one agent conversation
struct ConversationContext {
    std::vector<ConversationMessage> messages;
    std::optional<std::string> last_prompt;
    TokenUsage usage;
    int64_t timestamp = 0;
};

void to_json(nlohmann::json& j, const ToolResult& result);
void from_json(const nlohmann::json& j, ToolResult& result);
void to_json(nlohmann::json& j, const ToolUse& tool_use);
void from_json(const nlohmann::json& j, ToolUse& tool_use);
void to_json(nlohmann::json& j, const ConversationMessage& message);
void from_json(const nlohmann::json& j, ConversationMessage& message);
void to_json(nlohmann::json& j, const TokenUsage& usage);
void from_json(const nlohmann::json& j, TokenUsage& usage);
void to_json(nlohmann::json& j, const ConversationContext& context);
void from_json(const nlohmann::json& j, ConversationContext& context);

} // namespace foreman::conversation
