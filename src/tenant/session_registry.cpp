#include "tenant/session_registry.hpp"

#include <mutex>

namespace sqlsandbox {

SessionRegistry::SessionRegistry()
    : sessions_(std::make_shared<const SessionMap>()) {}

std::shared_ptr<TenantSession> SessionRegistry::find(const std::string& session_id) const {
    // RCU read: grab snapshot under shared lock
    std::shared_ptr<const SessionMap> snapshot;
    {
        std::shared_lock lock(mutex_);
        snapshot = sessions_;
    }

    // Lookup without holding lock
    const auto it = snapshot->find(session_id);
    return (it != snapshot->end()) ? it->second : nullptr;
}

bool SessionRegistry::add(std::shared_ptr<TenantSession> session) {
    std::unique_lock lock(mutex_);
    if (sessions_->contains(session->session_id())) {
        return false;
    }
    // Copy-on-write: make mutable copy, insert, swap
    auto new_map = std::make_shared<SessionMap>(*sessions_);
    const std::string id = session->session_id();
    (*new_map)[id] = std::move(session);
    sessions_ = std::move(new_map);
    return true;
}

std::shared_ptr<TenantSession> SessionRegistry::remove(const std::string& session_id) {
    std::unique_lock lock(mutex_);
    const auto it = sessions_->find(session_id);
    if (it == sessions_->end()) {
        return nullptr;
    }
    auto removed = it->second;
    auto new_map = std::make_shared<SessionMap>(*sessions_);
    new_map->erase(session_id);
    sessions_ = std::move(new_map);
    return removed;
}

size_t SessionRegistry::size() const {
    std::shared_lock lock(mutex_);
    return sessions_->size();
}

std::vector<std::string> SessionRegistry::list_sessions() const {
    std::shared_ptr<const SessionMap> snapshot;
    {
        std::shared_lock lock(mutex_);
        snapshot = sessions_;
    }
    std::vector<std::string> result;
    result.reserve(snapshot->size());
    for (const auto& [id, _] : *snapshot) {
        result.push_back(id);
    }
    return result;
}

} // namespace sqlsandbox
