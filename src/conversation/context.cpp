#include "conversation/context.hpp"

using json = nlohmann::json;

namespace foreman::conversation {

namespace {

std::optional<std::string> optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

} // namespace

void to_json(json& j, const ToolResult& result) {
    j = json{{"isError", result.is_error}};
    if (result.output) j["output"] = *result.output;
    if (result.error) j["error"] = *result.error;
}

void from_json(const json& j, ToolResult& result) {
    result.output = optional_string(j, "output");
    result.error = optional_string(j, "error");
    result.is_error = j.value("isError", false);
}

void to_json(json& j, const ToolUse& tool_use) {
    j = json{
        {"id", tool_use.id},
        {"name", tool_use.name},
        {"input", tool_use.input}
    };
    if (tool_use.result) j["result"] = *tool_use.result;
}

void from_json(const json& j, ToolUse& tool_use) {
    tool_use.id = j.value("id", "");
    tool_use.name = j.value("name", "");
    tool_use.input = j.value("input", json::object());
    tool_use.result.reset();
    if (j.contains("result") && j["result"].is_object()) {
        tool_use.result = j["result"].get<ToolResult>();
    }
}

void to_json(json& j, const ConversationMessage& message) {
    j = json{
        {"role", message.role},
        {"content", message.content},
        {"timestamp", message.timestamp}
    };
    if (!message.tool_uses.empty()) j["toolUses"] = message.tool_uses;
}

void from_json(const json& j, ConversationMessage& message) {
    message.role = j.value("role", "");
    message.content = j.value("content", "");
    message.timestamp = j.value("timestamp", int64_t{0});
    message.tool_uses.clear();
    if (j.contains("toolUses") && j["toolUses"].is_array()) {
        message.tool_uses = j["toolUses"].get<std::vector<ToolUse>>();
    }
}

void to_json(json& j, const TokenUsage& usage) {
    j = json{
        {"inputTokens", usage.input_tokens},
        {"outputTokens", usage.output_tokens},
        {"totalTokens", usage.total_tokens}
    };
}

void from_json(const json& j, TokenUsage& usage) {
    usage.input_tokens = j.value("inputTokens", int64_t{0});
    usage.output_tokens = j.value("outputTokens", int64_t{0});
    usage.total_tokens = j.value("totalTokens", usage.input_tokens + usage.output_tokens);
}

void to_json(json& j, const ConversationContext& context) {
    j = json{
        {"messages", context.messages},
        {"usage", context.usage},
        {"timestamp", context.timestamp}
    };
    if (context.last_prompt) j["lastPrompt"] = *context.last_prompt;
}

void from_json(const json& j, ConversationContext& context) {
    context.messages = j.value("messages", std::vector<ConversationMessage>{});
    context.last_prompt = optional_string(j, "lastPrompt");
    context.usage = j.value("usage", TokenUsage{});
    context.timestamp = j.value("timestamp", int64_t{0});
}

} // namespace foreman::conversation
