#include "gateway.hpp"
#include "util.hpp"
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace agentbridge {

static constexpr const char* kJsonType = "application/json";
static constexpr const char* kSessionsPrefix = "/sessions/";

static void send_json(ResponseWriter& out, int status, const json& body) {
    out.send(status, kJsonType, body.dump(-1, ' ', false, json::error_handler_t::replace));
}

static void send_detail(ResponseWriter& out, int status, const json& detail) {
    send_json(out, status, json{{"detail", detail}});
}

static bool optional_string(const json& j, const char* key, std::string& out) {
    if (!j.contains(key) || j[key].is_null()) return true;
    if (!j[key].is_string()) return false;
    out = j[key].get<std::string>();
    return true;
}

bool parse_ask_request(const std::string& body, TurnRequest& request, std::string& error) {
    auto j = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (!j.is_object()) {
        error = "Request body must be a JSON object";
        return false;
    }

    for (const char* key : {"project_name", "question"}) {
        if (!j.contains(key) || !j[key].is_string()) {
            error = std::string("Field required: ") + key;
            return false;
        }
    }
    request.conversation_key = j["project_name"].get<std::string>();
    request.question = j["question"].get<std::string>();

    std::string session_id;
    if (!optional_string(j, "user_id", request.user_id) ||
        !optional_string(j, "message_type", request.message_type) ||
        !optional_string(j, "agent_type", request.agent_type) ||
        !optional_string(j, "session_id", session_id)) {
        error = "user_id, message_type, agent_type and session_id must be strings";
        return false;
    }
    if (!session_id.empty()) request.session_id = session_id;
    return true;
}

std::string sse_frame(const StreamEvent& event) {
    return "data: " + event.to_wire() + "\n\n";
}

Gateway::Gateway(SessionManager& sessions, std::string chat_api_url, AuthContext* auth)
    : sessions_(sessions), chat_api_url_(std::move(chat_api_url)), auth_(auth)
{}

void Gateway::handle(const HttpRequest& request, ResponseWriter& out) {
    std::cerr << "[gateway] " << request.method << " " << request.path << "\n";
    const std::string& path = request.path;

    // CORS preflight; the server attaches the Access-Control-* headers
    if (request.method == "OPTIONS") {
        out.send(204, "text/plain", "");
        return;
    }

    if (path == "/") {
        if (request.method != "GET") { send_detail(out, 405, "Method Not Allowed"); return; }
        send_json(out, 200, json{{"status", "agentbridge running"}});
    } else if (path == "/health") {
        if (request.method != "GET") { send_detail(out, 405, "Method Not Allowed"); return; }
        health(out);
    } else if (path == "/sessions") {
        if (request.method != "GET") { send_detail(out, 405, "Method Not Allowed"); return; }
        list_sessions(out);
    } else if (path.rfind(kSessionsPrefix, 0) == 0 &&
               path.size() > std::char_traits<char>::length(kSessionsPrefix)) {
        if (request.method != "DELETE") { send_detail(out, 405, "Method Not Allowed"); return; }
        delete_session(url_decode(path.substr(std::char_traits<char>::length(kSessionsPrefix))),
                       out);
    } else if (path == "/ask_question") {
        if (request.method != "POST") { send_detail(out, 405, "Method Not Allowed"); return; }
        ask_question(request, out);
    } else if (path == "/ask_question_streaming") {
        if (request.method != "POST") { send_detail(out, 405, "Method Not Allowed"); return; }
        ask_question_streaming(request, out);
    } else if (auth_ && path.rfind("/auth/", 0) == 0) {
        auth_route(request, out);
    } else {
        send_detail(out, 404, "Not Found");
    }
}

void Gateway::health(ResponseWriter& out) const {
    const Backend& backend = sessions_.backend();
    send_json(out, 200, json{
        {"status", "healthy"},
        {"timestamp", timestamp_now()},
        {"chat_api_url", chat_api_url_},
        {"backend", backend.backend_name()},
        {"cli_path", backend.settings().cli_path},
        {"profile_strategy", sessions_.resolver().strategy_name()},
        {"active_sessions", sessions_.session_count()}
    });
}

void Gateway::list_sessions(ResponseWriter& out) const {
    json map = json::object();
    auto sessions = sessions_.list_sessions();
    for (const auto& session : sessions) {
        map[session.conversation_key] = session.session_id;
    }
    send_json(out, 200, json{{"sessions", map}, {"count", sessions.size()}});
}

void Gateway::delete_session(const std::string& key, ResponseWriter& out) {
    if (sessions_.remove_session(key)) {
        send_json(out, 200, json{{"success", true},
                                 {"message", "Session cleared for " + key}});
    } else {
        send_json(out, 200, json{{"success", false},
                                 {"message", "No session found for " + key}});
    }
}

void Gateway::auth_route(const HttpRequest& request, ResponseWriter& out) {
    const std::string& path = request.path;
    if (path == "/auth/state") {
        if (request.method != "GET") { send_detail(out, 405, "Method Not Allowed"); return; }
        bool held = auth_->bearer_token().has_value();
        send_json(out, 200, json{{"authenticated", held},
                                 {"token_source", held ? "stored" : "none"}});
    } else if (path == "/auth/token") {
        if (request.method != "POST") { send_detail(out, 405, "Method Not Allowed"); return; }
        auto j = json::parse(request.body, nullptr, /*allow_exceptions=*/false);
        if (!j.is_object() || !j.contains("access_token") || !j["access_token"].is_string() ||
            trim(j["access_token"].get<std::string>()).empty()) {
            send_detail(out, 422, "Field required: access_token");
            return;
        }
        auth_->set_token(trim(j["access_token"].get<std::string>()));
        std::cerr << "[gateway] Chat API token stored\n";
        send_json(out, 200, json{{"success", true}, {"message", "Auth token stored"}});
    } else if (path == "/auth/logout") {
        if (request.method != "POST") { send_detail(out, 405, "Method Not Allowed"); return; }
        auth_->clear();
        std::cerr << "[gateway] Chat API token cleared\n";
        send_json(out, 200, json{{"success", true}, {"message", "Auth token cleared"}});
    } else {
        send_detail(out, 404, "Not Found");
    }
}

void Gateway::ask_question(const HttpRequest& request, ResponseWriter& out) {
    TurnRequest turn;
    std::string error;
    if (!parse_ask_request(request.body, turn, error)) {
        send_detail(out, 422, error);
        return;
    }

    try {
        TurnResult result = sessions_.ask(turn);
        send_json(out, 200, json{
            {"id", nullptr},
            {"message", result.text},
            {"project_id", turn.conversation_key},
            {"user_id", turn.user_id},
            {"session_id", result.session_id},
            {"is_new_session", result.is_new},
            {"timestamp", timestamp_now()}
        });
    } catch (const std::exception& e) {
        std::cerr << "[gateway] Turn failed for " << turn.conversation_key
                  << ": " << e.what() << "\n";
        send_detail(out, 500, json{
            {"error", std::string("Failed to process question: ") + e.what()}});
    }
}

void Gateway::ask_question_streaming(const HttpRequest& request, ResponseWriter& out) {
    TurnRequest turn;
    std::string error;
    if (!parse_ask_request(request.body, turn, error)) {
        send_detail(out, 422, error);
        return;
    }

    if (!out.begin_stream(200, "text/event-stream")) return;

    TurnResult result = sessions_.ask_streaming(turn, [&out](const StreamEvent& event) {
        return out.write(sse_frame(event));
    });
    std::cerr << "[gateway] Streamed " << result.text.size() << " chars for "
              << turn.conversation_key << (result.committed ? "" : " (not stored)") << "\n";
}

} // namespace agentbridge
