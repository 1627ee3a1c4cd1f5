#include "conversation/reconstructor.hpp"
#include "core/clock.hpp"

using json = nlohmann::json;

namespace foreman::conversation {

namespace {

// Empty unless the field holds a string
std::string string_field(const json& j, const char* key) {
    if (!j.is_object()) return "";
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "";
}

int64_t int_field(const json& j, const char* key) {
    if (!j.is_object()) return 0;
    auto it = j.find(key);
    if (it != j.end() && it->is_number()) {
        return it->get<int64_t>();
    }
    return 0;
}

bool bool_field(const json& j, const char* key) {
    if (!j.is_object()) return false;
    auto it = j.find(key);
    return it != j.end() && it->is_boolean() && it->get<bool>();
}

const json& object_field(const json& j, const char* key) {
    static const json empty = json::object();
    if (!j.is_object()) return empty;
    auto it = j.find(key);
    if (it != j.end() && it->is_object()) {
        return *it;
    }
    return empty;
}

class TurnBuilder {
public:
    explicit TurnBuilder(ConversationContext& context) : context_(context) {}

    void append_text(const std::string& text, int64_t timestamp) {
        content_ += text;
        if (timestamp_ == 0) timestamp_ = timestamp;
    }

    void replace_text(const std::string& text, int64_t timestamp) {
        content_ = text;
        timestamp_ = timestamp;
    }

    void add_tool_use(ToolUse tool_use, int64_t timestamp) {
        tool_uses_.push_back(std::move(tool_use));
        if (timestamp_ == 0) timestamp_ = timestamp;
    }

    void attach_result(const std::string& tool_use_id, ToolResult result) {
        for (auto& tool_use : tool_uses_) {
            if (tool_use.id == tool_use_id) {
                tool_use.result = std::move(result);
                return;
            }
        }
    }

    // Emit the pending assistant turn, if it has any content
    void flush(int64_t fallback_timestamp) {
        if (content_.empty() && tool_uses_.empty()) {
            return;
        }

        ConversationMessage message;
        message.role = "assistant";
        message.content = std::move(content_);
        message.timestamp = timestamp_ != 0 ? timestamp_ : fallback_timestamp;
        message.tool_uses = std::move(tool_uses_);
        context_.messages.push_back(std::move(message));

        content_.clear();
        tool_uses_.clear();
        timestamp_ = 0;
    }

private:
    ConversationContext& context_;
    std::string content_;
    int64_t timestamp_ = 0;
    std::vector<ToolUse> tool_uses_;
};

void add_usage(TokenUsage& usage, int64_t input, int64_t output) {
    usage.input_tokens += input;
    usage.output_tokens += output;
    usage.total_tokens = usage.input_tokens + usage.output_tokens;
}

} // namespace

ConversationContext build_conversation_context(const std::vector<json>& events) {
    ConversationContext context;
    TurnBuilder turn(context);

    for (const auto& event : events) {
        if (!event.is_object()) {
            continue;
        }

        std::string type = string_field(event, "type");
        int64_t timestamp = int_field(event, "timestamp");

        if (type == "user_message") {
            turn.flush(timestamp);

            std::string content = string_field(event, "message");
            if (content.empty()) content = string_field(event, "content");
            if (!content.empty()) {
                ConversationMessage message;
                message.role = "user";
                message.content = content;
                message.timestamp = timestamp;
                context.messages.push_back(std::move(message));
                context.last_prompt = content;
            }

        } else if (type == "message") {
            std::string content = string_field(event, "content");
            if (bool_field(event, "isPartial")) {
                turn.append_text(content, timestamp);
            } else if (!content.empty()) {
                turn.replace_text(content, timestamp);
            }

        } else if (type == "content_block_start" || type == "content_block_delta") {
            const json& block = object_field(event, "content_block");
            const json& delta = object_field(event, "delta");
            if (string_field(block, "type") == "text" ||
                string_field(delta, "type") == "text_delta") {
                std::string text = string_field(block, "text");
                if (text.empty()) text = string_field(delta, "text");
                turn.append_text(text, timestamp);
            }

        } else if (type == "assistant") {
            std::string content = string_field(event, "content");
            if (content.empty()) content = string_field(event, "text");
            if (!content.empty()) {
                turn.replace_text(content, timestamp);
            }

        } else if (type == "tool_use") {
            ToolUse tool_use;
            tool_use.id = string_field(event, "toolUseId");
            if (tool_use.id.empty()) tool_use.id = string_field(event, "id");
            tool_use.name = string_field(event, "tool");
            if (tool_use.name.empty()) tool_use.name = string_field(event, "name");
            tool_use.input = object_field(event, "input");
            if (!tool_use.id.empty() && !tool_use.name.empty()) {
                turn.add_tool_use(std::move(tool_use), timestamp);
            }

        } else if (type == "tool_result") {
            std::string tool_use_id = string_field(event, "toolUseId");
            if (tool_use_id.empty()) tool_use_id = string_field(event, "id");

            ToolResult result;
            std::string output = string_field(event, "output");
            if (output.empty()) output = string_field(event, "result");
            if (!output.empty()) result.output = output;
            std::string error = string_field(event, "error");
            if (!error.empty()) result.error = error;
            result.is_error = bool_field(event, "isError") || result.error.has_value();

            turn.attach_result(tool_use_id, std::move(result));

        } else if (type == "result") {
            const json& usage = object_field(event, "usage");
            add_usage(context.usage, int_field(usage, "input_tokens"),
                      int_field(usage, "output_tokens"));

        } else if (type == "message_start") {
            const json& usage = object_field(object_field(event, "message"), "usage");
            add_usage(context.usage, int_field(usage, "input_tokens"), 0);

        } else if (type == "message_delta") {
            const json& usage = object_field(event, "usage");
            add_usage(context.usage, 0, int_field(usage, "output_tokens"));
        }
    }

    int64_t now = core::now_ms();
    turn.flush(now);
    context.timestamp = now;
    return context;
}

} // namespace foreman::conversation
