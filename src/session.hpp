#pragma once
#include "backend.hpp"
#include "chat_sink.hpp"
#include "client.hpp"
#include "profile.hpp"
#include "registry.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentbridge {

enum class TurnIntent {
    Auto,   // resume when the key is known, otherwise start a conversation
    New,    // always start a conversation, replacing any previous one
    Resume  // the key must already be known
};

struct TurnRequest {
    std::string conversation_key;
    std::string question;
    std::string user_id = "default_user";
    std::string message_type = "@xo";
    std::string agent_type;
    TurnIntent intent = TurnIntent::Auto;
    // Id to assign when this turn starts a conversation; ignored on resume
    std::optional<std::string> session_id;
};

struct TurnResult {
    std::string text;
    std::string session_id;
    bool is_new = false;
    bool committed = false; // registry updated by this turn
};

// Runs turns for caller conversations: resolves the profile, decides between
// new and resumed invocation, runs the backend and records the outcome.
class SessionManager {
public:
    SessionManager(std::unique_ptr<Backend> backend,
                   ProcessRunner& runner,
                   int timeout_seconds,
                   ChatSink* sink = nullptr);

    // Buffered turn. Throws ConfigurationError, ProcessFailed, TimeoutError
    // or SpawnError; nothing is committed or pushed on failure.
    TurnResult ask(const TurnRequest& request);

    // Streamed turn. Failures arrive as Error events; Done is always last.
    TurnResult ask_streaming(const TurnRequest& request, const StreamCallback& callback);

    // Forget a conversation. Returns false if the key was not registered.
    bool remove_session(const std::string& conversation_key);

    std::vector<LogicalSession> list_sessions() const { return registry_.list(); }
    size_t session_count() const { return registry_.size(); }

    const Backend& backend() const { return client_.backend(); }
    const ProfileResolver& resolver() const { return *resolver_; }
    SessionRegistry& registry() { return registry_; }

private:
    // Throws ConfigurationError when a resume cannot be addressed
    TurnPlan plan_turn(const TurnRequest& request) const;

    void record(const TurnRequest& request, const TurnPlan& plan,
                const std::optional<std::string>& native_id,
                const std::string& answer);

    AgentClient client_;
    std::unique_ptr<ProfileResolver> resolver_;
    SessionRegistry registry_;
    ChatSink* sink_;
};

} // namespace agentbridge
