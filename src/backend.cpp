#include "backend.hpp"
#include "plugin.hpp"

namespace agentbridge {

nlohmann::json parse_event_line(const std::string& line) {
    auto parsed = nlohmann::json::parse(line, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_object()) return parsed;
    return {{"type", "text"}, {"content", line}};
}

std::string json_string(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return {};
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

const nlohmann::json* json_object(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return nullptr;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_object()) return nullptr;
    return &*it;
}

const nlohmann::json* json_array(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return nullptr;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_array()) return nullptr;
    return &*it;
}

std::unique_ptr<Backend> create_backend(const std::string& name,
                                        const BackendSettings& settings) {
    return PluginRegistry::instance().create_backend(name, settings);
}

} // namespace agentbridge
