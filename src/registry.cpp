#include "registry.hpp"
#include <algorithm>

namespace agentbridge {

std::optional<LogicalSession> SessionRegistry::resolve(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(key);
    if (it == sessions_.end()) return std::nullopt;
    return it->second;
}

void SessionRegistry::commit(const std::string& key,
                             const std::string& session_id,
                             const std::optional<std::string>& native_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(key);
    if (it != sessions_.end() && it->second.session_id == session_id) {
        if (native_id) it->second.native_resume_id = native_id;
        return;
    }

    LogicalSession session;
    session.conversation_key = key;
    session.session_id = session_id;
    session.native_resume_id = native_id;
    sessions_[key] = std::move(session);
}

bool SessionRegistry::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.erase(key) > 0;
}

std::vector<LogicalSession> SessionRegistry::list() const {
    std::vector<LogicalSession> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out.reserve(sessions_.size());
        for (const auto& [_, session] : sessions_) {
            out.push_back(session);
        }
    }
    std::sort(out.begin(), out.end(),
              [](const LogicalSession& a, const LogicalSession& b) {
                  return a.conversation_key < b.conversation_key;
              });
    return out;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

SessionRegistry::TurnGuard SessionRegistry::lock(const std::string& key) {
    std::shared_ptr<std::mutex> turn_mutex;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = turn_locks_[key];
        if (!slot) slot = std::make_shared<std::mutex>();
        turn_mutex = slot;
    }
    // Acquired outside mutex_ so other keys stay unblocked
    return TurnGuard(*this, key, std::move(turn_mutex));
}

size_t SessionRegistry::active_turn_keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return turn_locks_.size();
}

void SessionRegistry::release_turn_lock(const std::string& key,
                                        std::shared_ptr<std::mutex> mutex) {
    std::lock_guard<std::mutex> lock(mutex_);
    mutex.reset();
    // Copies are only handed out under mutex_, so a lone map reference is final
    auto it = turn_locks_.find(key);
    if (it != turn_locks_.end() && it->second.use_count() == 1) {
        turn_locks_.erase(it);
    }
}

SessionRegistry::TurnGuard::~TurnGuard() {
    if (!registry_) return;
    lock_.unlock();
    registry_->release_turn_lock(key_, std::move(mutex_));
}

} // namespace agentbridge
