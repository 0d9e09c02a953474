#include "claude.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>

static agentbridge::BackendRegistrar reg_claude("claude",
    [](const agentbridge::BackendSettings& settings) {
        return std::make_unique<agentbridge::ClaudeBackend>(settings);
    });

using json = nlohmann::json;

namespace agentbridge {

ClaudeBackend::ClaudeBackend(BackendSettings settings)
    : Backend(std::move(settings))
{
    if (settings_.cli_path.empty()) settings_.cli_path = "claude";
}

std::vector<std::string> ClaudeBackend::build_command(const TurnPlan& plan,
                                                      OutputMode mode) const {
    std::vector<std::string> cmd = {settings_.cli_path};

    if (plan.is_new) {
        cmd.insert(cmd.end(), {"--session-id", plan.session_id});
    } else {
        cmd.insert(cmd.end(), {"--resume", plan.resume_id});
    }

    cmd.push_back("--print");
    if (mode == OutputMode::Streaming) {
        // stream-json is rejected without --verbose in print mode
        cmd.push_back("--verbose");
        cmd.insert(cmd.end(), {"--output-format", "stream-json"});
    } else {
        cmd.insert(cmd.end(), {"--output-format", "json"});
    }

    // Working directory is applied as the child's cwd; Claude has no flag for it
    for (const auto& dir : settings_.allowed_dirs) {
        cmd.insert(cmd.end(), {"--add-dir", dir});
    }
    if (!settings_.permission_mode.empty()) {
        cmd.insert(cmd.end(), {"--permission-mode", settings_.permission_mode});
    }

    cmd.insert(cmd.end(), {"-p", plan.prompt});
    return cmd;
}

std::unique_ptr<LineDecoder> ClaudeBackend::create_decoder() const {
    return std::make_unique<ClaudeDecoder>();
}

BufferedResult ClaudeBackend::parse_output(const std::string& output) const {
    BufferedResult result;
    std::string trimmed = trim(output);

    // Some configurations print plain text despite --output-format json
    auto parsed = json::parse(trimmed, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_object() && parsed.contains("result") && parsed["result"].is_string()) {
        result.text = parsed["result"].get<std::string>();
    } else {
        result.text = trimmed;
    }
    return result;
}

// ── ClaudeDecoder ───────────────────────────────────────────────

void ClaudeDecoder::emit_token(std::vector<StreamEvent>& out, const std::string& text) {
    if (text.empty()) return;
    saw_token_ = true;
    out.push_back(StreamEvent::token(text));
}

std::vector<StreamEvent> ClaudeDecoder::decode(const std::string& line) {
    std::vector<StreamEvent> out;
    std::string trimmed = trim(line);
    if (trimmed.empty()) return out;

    json event = parse_event_line(trimmed);
    std::string type = json_string(event, "type");

    if (type == "assistant") {
        const json* message = json_object(event, "message");
        const json* content = message ? json_array(*message, "content") : nullptr;
        if (content) {
            for (const auto& block : *content) {
                if (json_string(block, "type") == "text") {
                    emit_token(out, json_string(block, "text"));
                }
            }
        }
    } else if (type == "content_block_delta") {
        const json* delta = json_object(event, "delta");
        if (delta && json_string(*delta, "type") == "text_delta") {
            emit_token(out, json_string(*delta, "text"));
        }
    } else if (type == "result") {
        if (!saw_token_) {
            emit_token(out, json_string(event, "result"));
        }
    } else if (type == "text") {
        emit_token(out, json_string(event, "content"));
    } else if (type == "error") {
        std::string message = json_string(event, "error");
        if (message.empty()) {
            if (const json* err = json_object(event, "error")) {
                message = json_string(*err, "message");
            }
        }
        out.push_back(StreamEvent::error(message.empty() ? "Unknown error" : message));
    }

    return out;
}

} // namespace agentbridge
