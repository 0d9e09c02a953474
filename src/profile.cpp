#include "profile.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace agentbridge {

std::string normalize_profile_name(const std::string& agent_type) {
    return replace_all(to_lower(trim(agent_type)), "_", "-");
}

// ── SkillPrefixResolver ─────────────────────────────────────────

std::string SkillPrefixResolver::resolve(const std::string& question,
                                         const std::string& agent_type) const {
    std::string skill = normalize_profile_name(agent_type);
    if (skill.empty()) return question;
    return std::string(1, sigil_) + skill + " " + question;
}

// ── InstructionFileResolver ─────────────────────────────────────

InstructionFileResolver::InstructionFileResolver(std::string profiles_dir,
                                                 std::string default_profile)
    : profiles_dir_(std::move(profiles_dir))
    , default_profile_(normalize_profile_name(default_profile))
{}

void InstructionFileResolver::ensure_dir() const {
    std::error_code ec;
    if (std::filesystem::is_directory(profiles_dir_, ec)) return;
    std::filesystem::create_directories(profiles_dir_, ec);
    if (ec) {
        std::cerr << "[profiles] Cannot create " << profiles_dir_
                  << ": " << ec.message() << "\n";
    }
}

static bool is_safe_profile_name(const std::string& name) {
    return !name.empty() && name.find('/') == std::string::npos &&
           name.find('\\') == std::string::npos && name.find("..") == std::string::npos;
}

std::optional<std::string> InstructionFileResolver::load_profile(const std::string& name) const {
    if (!is_safe_profile_name(name)) return std::nullopt;
    ensure_dir();

    for (const char* ext : {".md", ".txt"}) {
        std::filesystem::path path = std::filesystem::path(profiles_dir_) / (name + ext);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) continue;

        std::ifstream file(path);
        if (!file.is_open()) {
            std::cerr << "[profiles] Failed to open " << path.string() << ", skipping\n";
            continue;
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        if (file.bad()) {
            std::cerr << "[profiles] Failed to read " << path.string() << ", skipping\n";
            continue;
        }

        std::string text = trim(ss.str());
        if (text.empty()) continue;
        return text;
    }
    return std::nullopt;
}

std::string InstructionFileResolver::resolve(const std::string& question,
                                             const std::string& agent_type) const {
    std::string requested = normalize_profile_name(agent_type);

    std::optional<std::string> instructions;
    if (!requested.empty()) {
        instructions = load_profile(requested);
    }
    if (!instructions && !default_profile_.empty() && default_profile_ != requested) {
        instructions = load_profile(default_profile_);
    }
    if (!instructions) return question;

    return *instructions + kUserRequestSeparator + question;
}

// ── Factory ─────────────────────────────────────────────────────

std::unique_ptr<ProfileResolver> create_profile_resolver(const BackendSettings& settings,
                                                         char skill_sigil) {
    if (settings.profile_strategy.empty() || settings.profile_strategy == "skill") {
        return std::make_unique<SkillPrefixResolver>(skill_sigil);
    }
    if (settings.profile_strategy == "instructions") {
        return std::make_unique<InstructionFileResolver>(settings.profiles_dir,
                                                         settings.default_profile);
    }
    throw ConfigurationError("Unknown profile strategy: " + settings.profile_strategy);
}

} // namespace agentbridge
