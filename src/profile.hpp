#pragma once
#include <string>
#include <memory>
#include <optional>

namespace agentbridge {

struct BackendSettings;

// Normalize a caller-supplied agent type into a profile name:
// trim, lowercase, '_' -> '-'. Empty result means "no profile".
std::string normalize_profile_name(const std::string& agent_type);

// Turns (question, agent_type) into the prompt handed to the backend.
class ProfileResolver {
public:
    virtual ~ProfileResolver() = default;
    virtual std::string resolve(const std::string& question,
                                const std::string& agent_type) const = 0;
    virtual std::string strategy_name() const = 0;
};

// In-band skill invocation: "<sigil><profile> <question>"
class SkillPrefixResolver : public ProfileResolver {
public:
    explicit SkillPrefixResolver(char sigil) : sigil_(sigil) {}

    std::string resolve(const std::string& question,
                        const std::string& agent_type) const override;
    std::string strategy_name() const override { return "skill"; }

private:
    char sigil_;
};

// Instruction documents, one file per profile (<name>.md or <name>.txt).
// Files are re-read on every call so edits apply to the next turn.
class InstructionFileResolver : public ProfileResolver {
public:
    InstructionFileResolver(std::string profiles_dir, std::string default_profile);

    std::string resolve(const std::string& question,
                        const std::string& agent_type) const override;
    std::string strategy_name() const override { return "instructions"; }

    // Load one profile document. nullopt if missing, unreadable or empty.
    std::optional<std::string> load_profile(const std::string& name) const;

    const std::string& profiles_dir() const { return profiles_dir_; }

private:
    void ensure_dir() const;

    std::string profiles_dir_;
    std::string default_profile_;
};

// Separator between an instruction document and the live request
constexpr const char* kUserRequestSeparator = "\n\nUser request:\n";

// Build the resolver selected by settings.profile_strategy.
// Throws ConfigurationError for an unknown strategy.
std::unique_ptr<ProfileResolver> create_profile_resolver(const BackendSettings& settings,
                                                         char skill_sigil);

} // namespace agentbridge
