#pragma once
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace agentbridge {

// A caller-visible conversation and the identities needed to continue it.
struct LogicalSession {
    std::string conversation_key;
    std::string session_id;                      // assigned by us, stable
    std::optional<std::string> native_resume_id; // assigned by the backend

    // Identity to address on resume: native id when known, else session id
    const std::string& resume_id() const {
        return native_resume_id ? *native_resume_id : session_id;
    }
};

// Conversation key -> LogicalSession. Entries are only written after a turn
// completes successfully. Thread-safe.
class SessionRegistry {
public:
    // Holds the per-key turn lock; turns on the same key run one at a time.
    // The key's slot is dropped when the last guard or waiter lets go.
    class TurnGuard {
    public:
        TurnGuard(SessionRegistry& registry, std::string key,
                  std::shared_ptr<std::mutex> mutex)
            : registry_(&registry), key_(std::move(key))
            , mutex_(std::move(mutex)), lock_(*mutex_) {}
        ~TurnGuard();

        TurnGuard(TurnGuard&& other) noexcept
            : registry_(other.registry_), key_(std::move(other.key_))
            , mutex_(std::move(other.mutex_)), lock_(std::move(other.lock_)) {
            other.registry_ = nullptr;
        }
        TurnGuard(const TurnGuard&) = delete;
        TurnGuard& operator=(const TurnGuard&) = delete;
        TurnGuard& operator=(TurnGuard&&) = delete;

    private:
        SessionRegistry* registry_;
        std::string key_;
        std::shared_ptr<std::mutex> mutex_;
        std::unique_lock<std::mutex> lock_;
    };

    std::optional<LogicalSession> resolve(const std::string& key) const;

    // Insert or update. An absent native_id keeps a previously learned one
    // as long as the session id is unchanged.
    void commit(const std::string& key,
                const std::string& session_id,
                const std::optional<std::string>& native_id = std::nullopt);

    // Returns true if an entry was removed. Removing an absent key is not an error.
    bool remove(const std::string& key);

    // Snapshot, sorted by conversation key
    std::vector<LogicalSession> list() const;

    size_t size() const;

    // Block until no other turn holds this key
    TurnGuard lock(const std::string& key);

    // Keys with a turn running or waiting
    size_t active_turn_keys() const;

private:
    void release_turn_lock(const std::string& key, std::shared_ptr<std::mutex> mutex);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, LogicalSession> sessions_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> turn_locks_;
};

} // namespace agentbridge
