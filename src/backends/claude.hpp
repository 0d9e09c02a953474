#pragma once
#include "../backend.hpp"

namespace agentbridge {

// Claude Code CLI. The caller assigns the session id on the first turn
// (--session-id) and resumes with the same id (--resume).
class ClaudeBackend : public Backend {
public:
    explicit ClaudeBackend(BackendSettings settings);

    std::string backend_name() const override { return "claude"; }
    char skill_sigil() const override { return '/'; }

    std::vector<std::string> build_command(const TurnPlan& plan,
                                           OutputMode mode) const override;
    std::unique_ptr<LineDecoder> create_decoder() const override;
    BufferedResult parse_output(const std::string& output) const override;
};

// stream-json vocabulary: assistant / content_block_delta / result / error.
// A final "result" is dropped when deltas already carried the answer.
class ClaudeDecoder : public LineDecoder {
public:
    std::vector<StreamEvent> decode(const std::string& line) override;

private:
    void emit_token(std::vector<StreamEvent>& out, const std::string& text);

    bool saw_token_ = false;
};

} // namespace agentbridge
