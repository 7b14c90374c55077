#include "context/SessionRegistry.hpp"
#include <spdlog/spdlog.h>

namespace receipt_assistant {

SessionHandle SessionRegistry::open(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) return it->second;

    auto session = std::make_shared<Session>(session_id);
    sessions_.emplace(session_id, session);
    spdlog::info("💬 Session {} created ({} active)", session_id, sessions_.size());
    return session;
}

SessionHandle SessionRegistry::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

bool SessionRegistry::evict(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool removed = sessions_.erase(session_id) > 0;
    if (removed) spdlog::info("Session {} evicted", session_id);
    return removed;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace receipt_assistant
