#pragma once

#include "tenant/tenant_session.hpp"
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sqlsandbox {

/**
 * @brief Store of live sessions keyed by session id
 *
 * Lookups never block on provisioning: only the map swap happens under the
 * exclusive lock.
 */
class SessionRegistry {
public:
    SessionRegistry();

    [[nodiscard]] std::shared_ptr<TenantSession> find(const std::string& session_id) const;

    /**
     * @brief Insert a session
     * @return false if the id is already taken (registry unchanged)
     */
    bool add(std::shared_ptr<TenantSession> session);

    /**
     * @brief Remove a session
     * @return The removed session, or nullptr if absent
     */
    std::shared_ptr<TenantSession> remove(const std::string& session_id);

    [[nodiscard]] size_t size() const;
    [[nodiscard]] std::vector<std::string> list_sessions() const;

private:
    using SessionMap = std::unordered_map<std::string, std::shared_ptr<TenantSession>>;

    // RCU: readers get shared_ptr snapshot, writers swap entire map
    std::shared_ptr<const SessionMap> sessions_;
    mutable std::shared_mutex mutex_;
};

} // namespace sqlsandbox
