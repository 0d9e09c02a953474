#include <catch2/catch.hpp>
#include "backends/claude.hpp"

using namespace agentbridge;

static TurnPlan new_turn(const std::string& prompt) {
    TurnPlan plan;
    plan.is_new = true;
    plan.session_id = "11111111-2222-4333-8444-555555555555";
    plan.prompt = prompt;
    return plan;
}

static TurnPlan resume_turn(const std::string& prompt) {
    TurnPlan plan;
    plan.is_new = false;
    plan.session_id = "11111111-2222-4333-8444-555555555555";
    plan.resume_id = plan.session_id;
    plan.prompt = prompt;
    return plan;
}

static std::vector<StreamEvent> decode_all(LineDecoder& decoder,
                                           const std::vector<std::string>& lines) {
    std::vector<StreamEvent> out;
    for (const auto& line : lines) {
        auto events = decoder.decode(line);
        out.insert(out.end(), events.begin(), events.end());
    }
    return out;
}

// ── build_command ────────────────────────────────────────────────

TEST_CASE("ClaudeBackend: new buffered turn", "[claude]") {
    ClaudeBackend backend(BackendSettings{});
    auto cmd = backend.build_command(new_turn("hello"), OutputMode::Buffered);
    REQUIRE(cmd == std::vector<std::string>{
        "claude", "--session-id", "11111111-2222-4333-8444-555555555555",
        "--print", "--output-format", "json", "-p", "hello"});
}

TEST_CASE("ClaudeBackend: resumed streaming turn", "[claude]") {
    ClaudeBackend backend(BackendSettings{});
    auto cmd = backend.build_command(resume_turn("again"), OutputMode::Streaming);
    REQUIRE(cmd == std::vector<std::string>{
        "claude", "--resume", "11111111-2222-4333-8444-555555555555",
        "--print", "--verbose", "--output-format", "stream-json", "-p", "again"});
}

TEST_CASE("ClaudeBackend: sandbox settings become flags", "[claude]") {
    BackendSettings s;
    s.cli_path = "/opt/claude";
    s.working_dir = "/srv/project";
    s.allowed_dirs = {"/srv/a", "/srv/b"};
    s.permission_mode = "acceptEdits";
    ClaudeBackend backend(s);

    auto cmd = backend.build_command(new_turn("go"), OutputMode::Buffered);
    REQUIRE(cmd == std::vector<std::string>{
        "/opt/claude", "--session-id", "11111111-2222-4333-8444-555555555555",
        "--print", "--output-format", "json",
        "--add-dir", "/srv/a", "--add-dir", "/srv/b",
        "--permission-mode", "acceptEdits", "-p", "go"});
}

TEST_CASE("ClaudeBackend: prompt is a single argument", "[claude]") {
    ClaudeBackend backend(BackendSettings{});
    auto cmd = backend.build_command(new_turn("/review it's \"quoted\"; rm -rf /"),
                                     OutputMode::Buffered);
    REQUIRE(cmd.back() == "/review it's \"quoted\"; rm -rf /");
}

TEST_CASE("ClaudeBackend: identity", "[claude]") {
    ClaudeBackend backend(BackendSettings{});
    REQUIRE(backend.backend_name() == "claude");
    REQUIRE(backend.skill_sigil() == '/');
    REQUIRE_FALSE(backend.requires_native_resume_id());
}

// ── parse_output ─────────────────────────────────────────────────

TEST_CASE("ClaudeBackend: buffered output extracts result", "[claude]") {
    ClaudeBackend backend(BackendSettings{});
    auto r = backend.parse_output(
        R"({"type":"result","subtype":"success","result":"Recursion is self-reference."})");
    REQUIRE(r.text == "Recursion is self-reference.");
    REQUIRE_FALSE(r.native_id.has_value());
}

TEST_CASE("ClaudeBackend: non-JSON output returned verbatim, trimmed", "[claude]") {
    ClaudeBackend backend(BackendSettings{});
    REQUIRE(backend.parse_output("  plain answer\n").text == "plain answer");
}

TEST_CASE("ClaudeBackend: JSON without result returned verbatim", "[claude]") {
    ClaudeBackend backend(BackendSettings{});
    REQUIRE(backend.parse_output(R"({"foo":1})").text == R"({"foo":1})");
}

// ── ClaudeDecoder ────────────────────────────────────────────────

TEST_CASE("ClaudeDecoder: assistant text blocks become tokens", "[claude]") {
    ClaudeDecoder decoder;
    auto events = decoder.decode(
        R"({"type":"assistant","message":{"content":[)"
        R"({"type":"text","text":"Recursion "},{"type":"tool_use","name":"x"},)"
        R"({"type":"text","text":""},{"type":"text","text":"is self-reference."}]}})");
    REQUIRE(events == std::vector<StreamEvent>{
        StreamEvent::token("Recursion "), StreamEvent::token("is self-reference.")});
}

TEST_CASE("ClaudeDecoder: text deltas become tokens", "[claude]") {
    ClaudeDecoder decoder;
    auto events = decode_all(decoder, {
        R"({"type":"content_block_delta","delta":{"type":"text_delta","text":"Recursion "}})",
        R"({"type":"content_block_delta","delta":{"type":"input_json_delta","partial_json":"{"}})",
        R"({"type":"content_block_delta","delta":{"type":"text_delta","text":"is self-reference."}})",
    });
    REQUIRE(events == std::vector<StreamEvent>{
        StreamEvent::token("Recursion "), StreamEvent::token("is self-reference.")});
}

TEST_CASE("ClaudeDecoder: result suppressed after earlier tokens", "[claude]") {
    ClaudeDecoder decoder;
    auto events = decode_all(decoder, {
        R"({"type":"content_block_delta","delta":{"type":"text_delta","text":"Hi"}})",
        R"({"type":"result","result":"Hi"})",
    });
    REQUIRE(events == std::vector<StreamEvent>{StreamEvent::token("Hi")});
}

TEST_CASE("ClaudeDecoder: result emitted when it is the only answer", "[claude]") {
    ClaudeDecoder decoder;
    auto events = decode_all(decoder, {
        R"({"type":"system","subtype":"init"})",
        R"({"type":"result","result":"Only answer"})",
    });
    REQUIRE(events == std::vector<StreamEvent>{StreamEvent::token("Only answer")});
}

TEST_CASE("ClaudeDecoder: empty result emits nothing", "[claude]") {
    ClaudeDecoder decoder;
    REQUIRE(decoder.decode(R"({"type":"result","result":""})").empty());
}

TEST_CASE("ClaudeDecoder: non-JSON line surfaces as text", "[claude]") {
    ClaudeDecoder decoder;
    REQUIRE(decoder.decode("Warning: something odd") ==
            std::vector<StreamEvent>{StreamEvent::token("Warning: something odd")});
}

TEST_CASE("ClaudeDecoder: error string and nested message", "[claude]") {
    ClaudeDecoder decoder;
    REQUIRE(decoder.decode(R"({"type":"error","error":"rate limited"})") ==
            std::vector<StreamEvent>{StreamEvent::error("rate limited")});
    REQUIRE(decoder.decode(R"({"type":"error","error":{"message":"overloaded"}})") ==
            std::vector<StreamEvent>{StreamEvent::error("overloaded")});
    REQUIRE(decoder.decode(R"({"type":"error"})") ==
            std::vector<StreamEvent>{StreamEvent::error("Unknown error")});
}

TEST_CASE("ClaudeDecoder: malformed substructure yields no events", "[claude]") {
    ClaudeDecoder decoder;
    REQUIRE(decoder.decode(R"({"type":"assistant","message":"oops"})").empty());
    REQUIRE(decoder.decode(R"({"type":"assistant","message":{"content":{"a":1}}})").empty());
    REQUIRE(decoder.decode(R"({"type":"content_block_delta","delta":[1,2]})").empty());
    REQUIRE(decoder.decode(R"({"type":"assistant","message":{"content":[7,null]}})").empty());
    REQUIRE(decoder.decode("   ").empty());
}
