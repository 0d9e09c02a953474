#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace agentbridge {

static nlohmann::json backend_defaults(const std::string& cli_path) {
    return {
        {"cli_path", cli_path},
        {"profile_strategy", "skill"},
        {"profiles_dir", ""},
        {"default_profile", "default"},
        {"working_dir", ""},
        {"allowed_dirs", nlohmann::json::array()},
        {"permission_mode", ""}
    };
}

nlohmann::json Config::defaults_json() {
    return {
        {"backend", "claude"},
        {"timeout_seconds", 300},
        {"backends", {
            {"claude", backend_defaults("claude")},
            {"codex", backend_defaults("codex")}
        }},
        {"chat_api", {
            {"base_url", "http://localhost:5001"},
            {"token", ""},
            {"timeout_seconds", 30}
        }},
        {"gateway", {
            {"listen", "0.0.0.0:5002"},
            {"max_body", 1048576}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

std::string config_path() {
    return expand_home("~/.agentbridge/config.json");
}

static BackendSettings parse_backend(const nlohmann::json& obj) {
    BackendSettings s;
    if (obj.contains("cli_path") && obj["cli_path"].is_string())
        s.cli_path = obj["cli_path"].get<std::string>();
    if (obj.contains("profile_strategy") && obj["profile_strategy"].is_string())
        s.profile_strategy = obj["profile_strategy"].get<std::string>();
    if (obj.contains("profiles_dir") && obj["profiles_dir"].is_string())
        s.profiles_dir = expand_home(obj["profiles_dir"].get<std::string>());
    if (obj.contains("default_profile") && obj["default_profile"].is_string())
        s.default_profile = obj["default_profile"].get<std::string>();
    if (obj.contains("working_dir") && obj["working_dir"].is_string())
        s.working_dir = expand_home(obj["working_dir"].get<std::string>());
    if (obj.contains("allowed_dirs") && obj["allowed_dirs"].is_array()) {
        for (const auto& d : obj["allowed_dirs"]) {
            if (d.is_string()) s.allowed_dirs.push_back(expand_home(d.get<std::string>()));
        }
    }
    if (obj.contains("permission_mode") && obj["permission_mode"].is_string())
        s.permission_mode = obj["permission_mode"].get<std::string>();
    return s;
}

static uint32_t clamp_timeout(uint64_t seconds) {
    if (seconds == 0) return 1;
    if (seconds > kMaxTimeoutSeconds) {
        std::cerr << "[config] Timeout " << seconds << "s capped at "
                  << kMaxTimeoutSeconds << "s\n";
        return kMaxTimeoutSeconds;
    }
    return static_cast<uint32_t>(seconds);
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("backend") && j["backend"].is_string())
        cfg.backend = j["backend"].get<std::string>();
    if (j.contains("timeout_seconds") && j["timeout_seconds"].is_number_unsigned())
        cfg.timeout_seconds = clamp_timeout(j["timeout_seconds"].get<uint64_t>());

    if (j.contains("backends") && j["backends"].is_object()) {
        for (auto& [name, obj] : j["backends"].items()) {
            if (!obj.is_object()) continue;
            cfg.backends[name] = parse_backend(obj);
        }
    }

    if (j.contains("chat_api") && j["chat_api"].is_object()) {
        auto& c = j["chat_api"];
        if (c.contains("base_url") && c["base_url"].is_string())
            cfg.chat_api.base_url = c["base_url"].get<std::string>();
        if (c.contains("token") && c["token"].is_string())
            cfg.chat_api.token = c["token"].get<std::string>();
        if (c.contains("timeout_seconds") && c["timeout_seconds"].is_number_unsigned())
            cfg.chat_api.timeout_seconds = clamp_timeout(c["timeout_seconds"].get<uint64_t>());
    }

    if (j.contains("gateway") && j["gateway"].is_object()) {
        auto& g = j["gateway"];
        if (g.contains("listen") && g["listen"].is_string())
            cfg.gateway.listen = g["listen"].get<std::string>();
        if (g.contains("max_body") && g["max_body"].is_number_unsigned())
            cfg.gateway.max_body = g["max_body"].get<uint32_t>();
    }

    return cfg;
}

static bool parse_seconds(const char* v, uint32_t& out) {
    try {
        long long n = std::stoll(v);
        if (n <= 0) return false;
        out = clamp_timeout(static_cast<uint64_t>(n));
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

void Config::apply_env() {
    if (const char* v = std::getenv("AGENT_BACKEND"))
        backend = v;
    if (const char* v = std::getenv("CLAUDE_CLI_PATH"))
        backends["claude"].cli_path = v;
    if (const char* v = std::getenv("CODEX_CLI_PATH"))
        backends["codex"].cli_path = v;

    if (const char* v = std::getenv("CLAUDE_TIMEOUT")) {
        if (!parse_seconds(v, timeout_seconds))
            std::cerr << "[config] Ignoring invalid CLAUDE_TIMEOUT: " << v << "\n";
    }
    if (const char* v = std::getenv("AGENT_TIMEOUT")) {
        if (!parse_seconds(v, timeout_seconds))
            std::cerr << "[config] Ignoring invalid AGENT_TIMEOUT: " << v << "\n";
    }

    if (const char* v = std::getenv("AGENT_PROFILES_DIR")) {
        backends[backend].profiles_dir = expand_home(v);
        backends[backend].profile_strategy = "instructions";
    }
    if (const char* v = std::getenv("AGENT_DEFAULT_PROFILE"))
        backends[backend].default_profile = v;

    if (const char* v = std::getenv("CHAT_API_BASE_URL"))
        chat_api.base_url = v;
    if (const char* v = std::getenv("CHAT_API_TOKEN"))
        chat_api.token = trim(v);

    // HOST/PORT override the gateway listen address piecewise
    const char* host = std::getenv("HOST");
    const char* port = std::getenv("PORT");
    if (host || port) {
        auto colon = gateway.listen.rfind(':');
        std::string cur_host = colon == std::string::npos ? gateway.listen
                                                          : gateway.listen.substr(0, colon);
        std::string cur_port = colon == std::string::npos ? "5002"
                                                          : gateway.listen.substr(colon + 1);
        gateway.listen = std::string(host ? host : cur_host) + ":" + (port ? port : cur_port);
    }
}

Config Config::load() {
    std::string path = config_path();
    nlohmann::json j;

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: " << path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config, using defaults: " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << path << "\n";
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

BackendSettings Config::backend_settings(const std::string& name) const {
    BackendSettings s;
    auto it = backends.find(name);
    if (it != backends.end()) s = it->second;
    if (s.cli_path.empty()) s.cli_path = name;
    if (s.profiles_dir.empty())
        s.profiles_dir = expand_home("~/.agentbridge/profiles/" + name);
    return s;
}

} // namespace agentbridge
