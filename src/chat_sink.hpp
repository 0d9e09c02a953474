#pragma once
#include "http.hpp"
#include <mutex>
#include <optional>
#include <string>

namespace agentbridge {

// Message type recorded for produced answers
constexpr const char* kAgentMessageType = "agent";

// Receives the question and the answer of every turn that produced output.
class ChatSink {
public:
    virtual ~ChatSink() = default;

    // Best effort: returns false on failure, never throws
    virtual bool push(const std::string& conversation_key,
                      const std::string& actor_id,
                      const std::string& text,
                      const std::string& message_type) = 0;
};

// Optional bearer credential attached to outbound chat calls
class AuthContext {
public:
    AuthContext() = default;
    explicit AuthContext(std::string token) : token_(std::move(token)) {}

    void set_token(std::string token);
    void clear();
    std::optional<std::string> bearer_token() const;

private:
    mutable std::mutex mutex_;
    std::string token_;
};

// POSTs {project_id, user_id, message, type} to <base_url>/chat/add_message
class HttpChatSink : public ChatSink {
public:
    HttpChatSink(HttpClient& http, std::string base_url,
                 const AuthContext& auth, long timeout_seconds = 30);

    bool push(const std::string& conversation_key,
              const std::string& actor_id,
              const std::string& text,
              const std::string& message_type) override;

    const std::string& endpoint() const { return endpoint_; }

private:
    HttpClient& http_;
    std::string endpoint_;
    const AuthContext& auth_;
    long timeout_seconds_;
};

} // namespace agentbridge
