#include "plugin.hpp"
#include <stdexcept>
#include <algorithm>

namespace agentbridge {

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

void PluginRegistry::register_backend(const std::string& name, BackendFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    backends_[name] = std::move(factory);
}

std::unique_ptr<Backend> PluginRegistry::create_backend(const std::string& name,
                                                        const BackendSettings& settings) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = backends_.find(name);
    if (it == backends_.end()) {
        throw std::invalid_argument("Unknown backend: " + name);
    }
    return it->second(settings);
}

std::vector<std::string> PluginRegistry::backend_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(backends_.size());
    for (const auto& [name, _] : backends_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool PluginRegistry::has_backend(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backends_.count(name) > 0;
}

} // namespace agentbridge
