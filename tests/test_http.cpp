#include <catch2/catch.hpp>
#include "http.hpp"
#include "http_server.hpp"
#include <atomic>
#include <mutex>
#include <string>

using namespace agentbridge;

namespace {

// Local endpoint that remembers the last request it saw
struct RecordingServer {
    std::mutex mutex;
    HttpRequest last;
    int status = 201;
    HttpServer server{"127.0.0.1:0", 4096, [this](const HttpRequest& req, ResponseWriter& out) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            last = req;
        }
        out.send(status, "application/json", R"({"ok":true})");
    }};

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(server.port()) + path;
    }
};

} // namespace

TEST_CASE("CurlHttpClient: posts body and headers, returns status and body", "[http]") {
    CurlGlobal curl;
    RecordingServer endpoint;
    std::string error;
    REQUIRE(endpoint.server.start(error));

    CurlOptions options;
    options.user_agent = "agentbridge-test";
    CurlHttpClient client(options);
    auto response = client.post(endpoint.url("/chat/add_message"), R"({"message":"hi"})",
                                {{"Content-Type", "application/json"},
                                 {"Authorization", "Bearer tok"}},
                                5);
    endpoint.server.stop();

    REQUIRE(response.error.empty());
    REQUIRE(response.status_code == 201);
    REQUIRE(response.body == R"({"ok":true})");

    std::lock_guard<std::mutex> lock(endpoint.mutex);
    REQUIRE(endpoint.last.method == "POST");
    REQUIRE(endpoint.last.path == "/chat/add_message");
    REQUIRE(endpoint.last.body == R"({"message":"hi"})");
    REQUIRE(endpoint.last.headers["authorization"] == "Bearer tok");
    REQUIRE(endpoint.last.headers["user-agent"] == "agentbridge-test");
}

TEST_CASE("CurlHttpClient: refused connection is status 0 with an error", "[http]") {
    CurlGlobal curl;
    uint16_t closed_port = 0;
    {
        HttpServer server("127.0.0.1:0", 16, [](const HttpRequest&, ResponseWriter&) {});
        std::string error;
        REQUIRE(server.start(error));
        closed_port = server.port();
        server.stop();
    }

    CurlHttpClient client;
    auto response = client.post("http://127.0.0.1:" + std::to_string(closed_port) + "/x",
                                "{}", {}, 5);
    REQUIRE(response.status_code == 0);
    REQUIRE_FALSE(response.error.empty());
    REQUIRE(response.body.empty());
}

TEST_CASE("CurlHttpClient: a raised cancel flag aborts the transfer", "[http]") {
    CurlGlobal curl;
    RecordingServer endpoint;
    std::string error;
    REQUIRE(endpoint.server.start(error));

    std::atomic<bool> cancel{true};
    CurlOptions options;
    options.cancel = &cancel;
    CurlHttpClient client(options);
    auto response = client.post(endpoint.url("/x"), "{}", {}, 5);
    endpoint.server.stop();

    REQUIRE(response.status_code == 0);
    REQUIRE_FALSE(response.error.empty());
}
