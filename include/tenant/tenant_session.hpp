#pragma once

#include "core/types.hpp"
#include "db/idb_connection.hpp"
#include "tenant/tenant_namespace.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sqlsandbox {

/**
 * @brief One candidate's isolated sandbox: a private engine database plus
 * the mapping of its problem's logical tables to physical identifiers
 *
 * All members except the id, the problem id and the mutex are guarded by
 * mutex(); callers hold it for the duration of any query, provisioning or
 * teardown. The problem id may be read without the lock.
 */
class TenantSession {
public:
    TenantSession(std::string session_id, int64_t problem_id,
                  std::unique_ptr<IDbConnection> connection);
    ~TenantSession();

    TenantSession(const TenantSession&) = delete;
    TenantSession& operator=(const TenantSession&) = delete;

    [[nodiscard]] const std::string& session_id() const { return session_id_; }
    [[nodiscard]] int64_t problem_id() const { return problem_id_.load(std::memory_order_acquire); }
    [[nodiscard]] std::chrono::system_clock::time_point created_at() const { return created_at_; }

    [[nodiscard]] IDbConnection& connection() { return *connection_; }
    [[nodiscard]] const TenantNamespace& tenant_namespace() const { return namespace_; }
    [[nodiscard]] const std::vector<TableSchema>& schema() const { return schema_; }
    [[nodiscard]] const ProvisionReport& report() const { return report_; }

    /**
     * @brief Physical tables currently present in the session's database
     */
    [[nodiscard]] const std::vector<std::string>& physical_tables() const {
        return namespace_.physical_names();
    }

    [[nodiscard]] bool is_provisioned() const { return !namespace_.empty(); }
    [[nodiscard]] bool is_released() const { return released_; }

    [[nodiscard]] std::timed_mutex& mutex() { return mutex_; }

    /**
     * @brief Adopt a freshly provisioned schema
     */
    void install(int64_t problem_id, std::vector<TableSchema> schema,
                 TenantNamespace ns, ProvisionReport report);

    /**
     * @brief Drop all physical tables and close the engine context (idempotent)
     */
    void release();

private:
    std::string session_id_;
    std::atomic<int64_t> problem_id_;
    std::chrono::system_clock::time_point created_at_;

    std::unique_ptr<IDbConnection> connection_;
    TenantNamespace namespace_;
    std::vector<TableSchema> schema_;
    ProvisionReport report_;
    bool released_ = false;

    std::timed_mutex mutex_;
};

} // namespace sqlsandbox
