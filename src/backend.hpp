#pragma once
#include "config.hpp"
#include "event.hpp"
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <nlohmann/json.hpp>

namespace agentbridge {

enum class OutputMode { Buffered, Streaming };

// Everything the command builder needs for one turn, already resolved.
struct TurnPlan {
    bool is_new = true;
    std::string session_id; // our id; assigned to the backend on a new turn
    std::string resume_id;  // resume turn: native id, or session id when none
    std::string prompt;     // after profile resolution
};

// Parsed stdout of a buffered turn
struct BufferedResult {
    std::string text;
    std::optional<std::string> native_id; // e.g. Codex thread id
};

// Converts one backend stdout line into canonical events.
// One decoder instance per turn; it may keep per-turn state.
class LineDecoder {
public:
    virtual ~LineDecoder() = default;

    // Never throws: malformed or unexpected input yields no events.
    virtual std::vector<StreamEvent> decode(const std::string& line) = 0;

    // Native resume id announced during this turn, if any
    virtual std::optional<std::string> native_id() const { return std::nullopt; }
};

// Abstract base class for agent CLI backends
class Backend {
public:
    explicit Backend(BackendSettings settings) : settings_(std::move(settings)) {}
    virtual ~Backend() = default;

    virtual std::string backend_name() const = 0;

    // Prefix for in-band skill invocation ("/review ...", "$review ...")
    virtual char skill_sigil() const = 0;

    // True when resume must address a backend-assigned id, never our session id
    virtual bool requires_native_resume_id() const { return false; }

    // Pure function of the plan and mode: no hidden state
    virtual std::vector<std::string> build_command(const TurnPlan& plan,
                                                   OutputMode mode) const = 0;

    virtual std::unique_ptr<LineDecoder> create_decoder() const = 0;

    // Parse the full stdout of a buffered turn. Falls back to the raw
    // trimmed text when the output is not in the expected format.
    virtual BufferedResult parse_output(const std::string& output) const = 0;

    const BackendSettings& settings() const { return settings_; }

protected:
    BackendSettings settings_;
};

// Decode one stdout line as JSON. Anything that is not a JSON object comes
// back as {"type":"text","content":<line>} so raw output is never lost.
nlohmann::json parse_event_line(const std::string& line);

// Non-throwing accessors for loosely shaped event payloads
std::string json_string(const nlohmann::json& obj, const char* key);
const nlohmann::json* json_object(const nlohmann::json& obj, const char* key);
const nlohmann::json* json_array(const nlohmann::json& obj, const char* key);

// Factory: create backend by name (see BackendRegistrar)
std::unique_ptr<Backend> create_backend(const std::string& name,
                                        const BackendSettings& settings);

} // namespace agentbridge
