#include "codex.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>

static agentbridge::BackendRegistrar reg_codex("codex",
    [](const agentbridge::BackendSettings& settings) {
        return std::make_unique<agentbridge::CodexBackend>(settings);
    });

using json = nlohmann::json;

namespace agentbridge {

static constexpr const char* kTurnFailedMessage = "Codex turn failed";

CodexBackend::CodexBackend(BackendSettings settings)
    : Backend(std::move(settings))
{
    if (settings_.cli_path.empty()) settings_.cli_path = "codex";
}

std::vector<std::string> CodexBackend::build_command(const TurnPlan& plan,
                                                     OutputMode /*mode*/) const {
    // exec --json emits JSON lines in both modes
    std::vector<std::string> cmd = {settings_.cli_path, "exec"};

    if (!settings_.working_dir.empty()) {
        cmd.insert(cmd.end(), {"--cd", settings_.working_dir});
    }
    for (const auto& dir : settings_.allowed_dirs) {
        cmd.insert(cmd.end(), {"--add-dir", dir});
    }
    if (!settings_.permission_mode.empty()) {
        cmd.insert(cmd.end(), {"--sandbox", settings_.permission_mode});
    }

    if (plan.is_new) {
        cmd.insert(cmd.end(), {"--json", plan.prompt});
    } else {
        cmd.insert(cmd.end(), {"resume", "--json", plan.resume_id, plan.prompt});
    }
    return cmd;
}

std::unique_ptr<LineDecoder> CodexBackend::create_decoder() const {
    return std::make_unique<CodexDecoder>();
}

std::string extract_item_text(const json& item) {
    if (!item.is_object()) return {};

    std::string text = json_string(item, "text");
    if (!text.empty()) return text;

    const json* message = json_object(item, "message");
    if (!message) return {};

    text = json_string(*message, "text");
    if (!text.empty()) return text;

    std::string joined;
    if (const json* content = json_array(*message, "content")) {
        for (const auto& part : *content) {
            joined += json_string(part, "text");
        }
    }
    return joined;
}

static bool is_item_event(const std::string& type) {
    return type.rfind("item.", 0) == 0;
}

BufferedResult CodexBackend::parse_output(const std::string& output) const {
    BufferedResult result;
    std::string trimmed = trim(output);
    if (trimmed.empty()) return result;

    std::string text;
    bool decoded_any = false;

    for (const auto& raw : split(trimmed, '\n')) {
        std::string line = trim(raw);
        if (line.empty()) continue;

        auto event = json::parse(line, nullptr, /*allow_exceptions=*/false);
        if (!event.is_object()) continue; // diagnostics interleaved with events
        decoded_any = true;

        std::string type = json_string(event, "type");
        if (type == "thread.started") {
            std::string id = json_string(event, "thread_id");
            if (!id.empty()) result.native_id = id;
            continue;
        }
        if (is_item_event(type)) {
            if (const json* item = json_object(event, "item")) {
                text += extract_item_text(*item);
            }
        }
    }

    result.text = decoded_any ? trim(text) : trimmed;
    return result;
}

// ── CodexDecoder ────────────────────────────────────────────────

std::vector<StreamEvent> CodexDecoder::decode(const std::string& line) {
    std::vector<StreamEvent> out;
    std::string trimmed = trim(line);
    if (trimmed.empty()) return out;

    json event = parse_event_line(trimmed);
    std::string type = json_string(event, "type");

    if (type == "thread.started") {
        std::string id = json_string(event, "thread_id");
        if (!id.empty()) thread_id_ = id;
    } else if (is_item_event(type)) {
        if (const json* item = json_object(event, "item")) {
            std::string text = extract_item_text(*item);
            if (!text.empty()) out.push_back(StreamEvent::token(text));
        }
    } else if (type == "error") {
        std::string message = json_string(event, "message");
        if (message.empty()) message = json_string(event, "error");
        if (message.empty()) {
            if (const json* err = json_object(event, "error")) {
                message = json_string(*err, "message");
            }
        }
        out.push_back(StreamEvent::error(message.empty() ? "Unknown error" : message));
    } else if (type == "turn.failed") {
        out.push_back(StreamEvent::error(kTurnFailedMessage));
    } else if (type == "text") {
        std::string content = json_string(event, "content");
        if (!content.empty()) out.push_back(StreamEvent::token(content));
    }

    return out;
}

} // namespace agentbridge
