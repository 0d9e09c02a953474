#pragma once
#include <string>
#include <functional>
#include <nlohmann/json.hpp>

namespace agentbridge {

// Canonical streamed-turn event. Every backend vocabulary is decoded into
// this union; a streamed turn always ends with exactly one Done.

enum class EventKind { Token, Error, Done };

inline const char* event_kind_to_string(EventKind kind) {
    switch (kind) {
        case EventKind::Token: return "token";
        case EventKind::Error: return "error";
        case EventKind::Done: return "done";
    }
    return "done";
}

struct StreamEvent {
    EventKind kind = EventKind::Done;
    std::string text; // token text or error message; empty for Done

    static StreamEvent token(std::string t) { return {EventKind::Token, std::move(t)}; }
    static StreamEvent error(std::string m) { return {EventKind::Error, std::move(m)}; }
    static StreamEvent done() { return {EventKind::Done, {}}; }

    bool operator==(const StreamEvent& other) const {
        return kind == other.kind && text == other.text;
    }
    bool operator!=(const StreamEvent& other) const { return !(*this == other); }

    // {"type":"token","token":...} / {"type":"error","error":...} / {"type":"done"}
    nlohmann::json to_json() const {
        nlohmann::json j;
        j["type"] = event_kind_to_string(kind);
        if (kind == EventKind::Token) j["token"] = text;
        else if (kind == EventKind::Error) j["error"] = text;
        return j;
    }

    std::string to_wire() const { return to_json().dump(); }
};

// Receives each event of a streamed turn in order. Return false to cancel the
// turn; the backend process is then killed.
using StreamCallback = std::function<bool(const StreamEvent& event)>;

} // namespace agentbridge
