#include <catch2/catch.hpp>
#include "mock_http_client.hpp"
#include "chat_sink.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace agentbridge;
using json = nlohmann::json;

namespace {

std::string header_value(const std::vector<Header>& headers, const std::string& name) {
    for (const auto& h : headers) {
        if (h.first == name) return h.second;
    }
    return {};
}

class ThrowingHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string&, const std::string&,
                      const std::vector<Header>&, long) override {
        throw std::runtime_error("connection reset");
    }
};

} // namespace

TEST_CASE("HttpChatSink: posts message payload to add_message", "[chat]") {
    MockHttpClient http;
    AuthContext auth;
    HttpChatSink sink(http, "http://chat.local:5001", auth, 12);

    REQUIRE(sink.push("proj", "alice", "Explain recursion", "@xo"));
    REQUIRE(http.call_count == 1);
    REQUIRE(http.last_url == "http://chat.local:5001/chat/add_message");
    REQUIRE(http.last_timeout == 12);

    auto body = json::parse(http.last_body);
    REQUIRE(body["project_id"] == "proj");
    REQUIRE(body["user_id"] == "alice");
    REQUIRE(body["message"] == "Explain recursion");
    REQUIRE(body["type"] == "@xo");
    REQUIRE(header_value(http.last_headers, "Content-Type") == "application/json");
}

TEST_CASE("HttpChatSink: trailing slashes trimmed from base url", "[chat]") {
    MockHttpClient http;
    AuthContext auth;
    HttpChatSink sink(http, "http://chat.local//", auth);
    REQUIRE(sink.endpoint() == "http://chat.local/chat/add_message");
}

TEST_CASE("HttpChatSink: bearer header follows the auth context", "[chat]") {
    MockHttpClient http;
    AuthContext auth;
    HttpChatSink sink(http, "http://chat.local", auth);

    sink.push("proj", "u", "q", "@xo");
    REQUIRE(header_value(http.last_headers, "Authorization").empty());

    auth.set_token("tok123");
    sink.push("proj", "u", "q", "@xo");
    REQUIRE(header_value(http.last_headers, "Authorization") == "Bearer tok123");

    auth.clear();
    sink.push("proj", "u", "q", "@xo");
    REQUIRE(header_value(http.last_headers, "Authorization").empty());
}

TEST_CASE("HttpChatSink: failures return false", "[chat]") {
    MockHttpClient http;
    AuthContext auth;
    HttpChatSink sink(http, "http://chat.local", auth);

    http.next_response = {0, ""};
    REQUIRE_FALSE(sink.push("proj", "u", "q", "@xo"));

    http.next_response = {500, "boom"};
    REQUIRE_FALSE(sink.push("proj", "u", "q", "@xo"));

    http.next_response = {201, "{}"};
    REQUIRE(sink.push("proj", "u", "q", "@xo"));
}

TEST_CASE("HttpChatSink: transport exception does not escape", "[chat]") {
    ThrowingHttpClient http;
    AuthContext auth("tok");
    HttpChatSink sink(http, "http://chat.local", auth);
    REQUIRE_FALSE(sink.push("proj", "u", "q", "agent"));
}

TEST_CASE("AuthContext: empty token means no credential", "[chat]") {
    AuthContext auth("");
    REQUIRE_FALSE(auth.bearer_token().has_value());
    auth.set_token("abc");
    REQUIRE(auth.bearer_token() == std::optional<std::string>("abc"));
}
