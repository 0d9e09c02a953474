#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace agentbridge {

// Upper bound for any turn deadline (one week); keeps millisecond math in int
constexpr uint32_t kMaxTimeoutSeconds = 7 * 24 * 3600;

// Per-backend invocation settings. Sandbox fields come from configuration
// only, never from a turn request.
struct BackendSettings {
    std::string cli_path;
    std::string profile_strategy = "skill"; // "skill" or "instructions"
    std::string profiles_dir;               // instructions strategy only
    std::string default_profile = "default";

    std::string working_dir;                // also the child's cwd
    std::vector<std::string> allowed_dirs;
    std::string permission_mode;

    bool sandboxed() const {
        return !working_dir.empty() || !allowed_dirs.empty() || !permission_mode.empty();
    }
};

struct ChatApiConfig {
    std::string base_url = "http://localhost:5001";
    std::string token;              // optional static bearer token
    uint32_t timeout_seconds = 30;
};

struct GatewayConfig {
    std::string listen = "0.0.0.0:5002";
    uint32_t max_body = 1048576;
};

struct Config {
    std::string backend = "claude";
    uint32_t timeout_seconds = 300;  // buffered deadline and per-line stream deadline

    std::unordered_map<std::string, BackendSettings> backends;
    ChatApiConfig chat_api;
    GatewayConfig gateway;

    // Load from ~/.agentbridge/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a config document; unknown or mistyped keys are ignored
    static Config from_json(const nlohmann::json& j);

    // Apply environment variable overrides
    void apply_env();

    // Settings for a backend, with its default CLI path if unconfigured
    BackendSettings backend_settings(const std::string& name) const;
};

// Path of the config file (~ expanded)
std::string config_path();

} // namespace agentbridge
