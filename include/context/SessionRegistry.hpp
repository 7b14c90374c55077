#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include "context/ConversationHistory.hpp"

namespace receipt_assistant {

struct Session {
    explicit Session(std::string session_id) : id(std::move(session_id)) {}

    const std::string id;
    std::mutex mutex;               // serializes turns within this session
    ConversationHistory history;
};

using SessionHandle = std::shared_ptr<Session>;

// session_id -> Session. Sessions are created on first use and removed
// only by an explicit evict().
class SessionRegistry {
public:
    SessionHandle open(const std::string& session_id);
    SessionHandle find(const std::string& session_id) const;
    bool evict(const std::string& session_id);
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, SessionHandle> sessions_;
};

} // namespace receipt_assistant
