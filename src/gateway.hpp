#pragma once
#include "http_server.hpp"
#include "session.hpp"
#include <string>

namespace agentbridge {

// HTTP routes over a SessionManager:
//   GET    /                         liveness
//   GET    /health                   status, backend and session count
//   GET    /sessions                 conversation key -> session id
//   DELETE /sessions/<key>           forget a conversation
//   POST   /ask_question             buffered turn
//   POST   /ask_question_streaming   streamed turn as Server-Sent Events
//   GET    /auth/state               whether a chat API token is held
//   POST   /auth/token               store {"access_token": ...}
//   POST   /auth/logout              drop the stored token
//   OPTIONS *                        CORS preflight
// The /auth routes exist only when an AuthContext is supplied.
class Gateway {
public:
    Gateway(SessionManager& sessions, std::string chat_api_url,
            AuthContext* auth = nullptr);

    // Dispatch one request; usable without a socket
    void handle(const HttpRequest& request, ResponseWriter& out);

private:
    void health(ResponseWriter& out) const;
    void list_sessions(ResponseWriter& out) const;
    void delete_session(const std::string& key, ResponseWriter& out);
    void ask_question(const HttpRequest& request, ResponseWriter& out);
    void ask_question_streaming(const HttpRequest& request, ResponseWriter& out);
    void auth_route(const HttpRequest& request, ResponseWriter& out);

    SessionManager& sessions_;
    std::string chat_api_url_;
    AuthContext* auth_;
};

// Parse an ask_question body. Returns false with error set when the body is
// not a JSON object or project_name/question are missing.
bool parse_ask_request(const std::string& body, TurnRequest& request, std::string& error);

// One Server-Sent Events frame: "data: <json>\n\n"
std::string sse_frame(const StreamEvent& event);

} // namespace agentbridge
