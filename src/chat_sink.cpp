#include "chat_sink.hpp"
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace agentbridge {

// ── AuthContext ─────────────────────────────────────────────────

void AuthContext::set_token(std::string token) {
    std::lock_guard<std::mutex> lock(mutex_);
    token_ = std::move(token);
}

void AuthContext::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    token_.clear();
}

std::optional<std::string> AuthContext::bearer_token() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (token_.empty()) return std::nullopt;
    return token_;
}

// ── HttpChatSink ────────────────────────────────────────────────

HttpChatSink::HttpChatSink(HttpClient& http, std::string base_url,
                           const AuthContext& auth, long timeout_seconds)
    : http_(http), auth_(auth), timeout_seconds_(timeout_seconds)
{
    while (!base_url.empty() && base_url.back() == '/') base_url.pop_back();
    endpoint_ = base_url + "/chat/add_message";
}

bool HttpChatSink::push(const std::string& conversation_key,
                        const std::string& actor_id,
                        const std::string& text,
                        const std::string& message_type) {
    json payload = {
        {"project_id", conversation_key},
        {"user_id", actor_id},
        {"message", text},
        {"type", message_type}
    };

    std::vector<Header> headers = {{"Content-Type", "application/json"}};
    if (auto token = auth_.bearer_token()) {
        headers.emplace_back("Authorization", "Bearer " + *token);
    }

    HttpResponse response;
    try {
        response = http_.post(endpoint_,
                              payload.dump(-1, ' ', false, json::error_handler_t::replace),
                              headers, timeout_seconds_);
    } catch (const std::exception& e) {
        std::cerr << "[chat] Push failed: " << e.what() << "\n";
        return false;
    }

    if (response.status_code == 0) {
        std::cerr << "[chat] Push failed: " << endpoint_ << ": "
                  << (response.error.empty() ? "unreachable" : response.error) << "\n";
        return false;
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        std::cerr << "[chat] Push failed: HTTP " << response.status_code << "\n";
        return false;
    }
    std::cerr << "[chat] Pushed message: project=" << conversation_key
              << ", type=" << message_type << "\n";
    return true;
}

} // namespace agentbridge
