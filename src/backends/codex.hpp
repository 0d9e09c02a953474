#pragma once
#include "../backend.hpp"

namespace agentbridge {

// Codex CLI in non-interactive exec mode. Codex assigns its own thread id on
// the first turn ("thread.started"); later turns must resume that thread id.
class CodexBackend : public Backend {
public:
    explicit CodexBackend(BackendSettings settings);

    std::string backend_name() const override { return "codex"; }
    char skill_sigil() const override { return '$'; }
    bool requires_native_resume_id() const override { return true; }

    std::vector<std::string> build_command(const TurnPlan& plan,
                                           OutputMode mode) const override;
    std::unique_ptr<LineDecoder> create_decoder() const override;
    BufferedResult parse_output(const std::string& output) const override;
};

// exec --json vocabulary: thread.started / item.* / error / turn.failed
class CodexDecoder : public LineDecoder {
public:
    std::vector<StreamEvent> decode(const std::string& line) override;
    std::optional<std::string> native_id() const override { return thread_id_; }

private:
    std::optional<std::string> thread_id_;
};

// Best-effort text of an item payload: item.text, then item.message.text,
// then the concatenated item.message.content[].text parts.
std::string extract_item_text(const nlohmann::json& item);

} // namespace agentbridge
