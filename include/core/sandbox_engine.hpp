#pragma once

#include "audit/event_sink.hpp"
#include "catalog/icatalog.hpp"
#include "core/error.hpp"
#include "core/pipeline.hpp"
#include "core/types.hpp"
#include "db/iconnection_factory.hpp"
#include "executor/bounded_executor.hpp"
#include "tenant/schema_provisioner.hpp"
#include "tenant/session_registry.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sqlsandbox {

/**
 * @brief Collaborators of SandboxEngine
 */
struct SandboxComponents {
    std::shared_ptr<const ICatalog> catalog;                // Required
    std::shared_ptr<IConnectionFactory> connection_factory; // Required
    std::shared_ptr<IEventSink> event_sink;                 // Optional (nullptr = no events)
    std::string connection_string = ":memory:";
};

struct SandboxOptions {
    BoundedExecutor::Config executor;
    std::chrono::milliseconds busy_wait{0};     // 0 = fail overlapping requests with BUSY at once
    size_t max_sessions = 0;                    // 0 = unlimited
};

/**
 * @brief Facade over the session lifecycle: provision, run, teardown
 *
 * Every session owns one private engine database. Requests against one
 * session are serialized by the session's mutex; requests against different
 * sessions never wait on each other. All operations are thread-safe and
 * report failures as values, never as exceptions.
 */
class SandboxEngine {
public:
    SandboxEngine(SandboxComponents components, SandboxOptions options);
    explicit SandboxEngine(SandboxComponents components)
        : SandboxEngine(std::move(components), SandboxOptions{}) {}
    ~SandboxEngine();

    SandboxEngine(const SandboxEngine&) = delete;
    SandboxEngine& operator=(const SandboxEngine&) = delete;

    /**
     * @brief Create a session for problem_id under a fresh id
     * @return Session id, or PROVISION_ERROR
     */
    [[nodiscard]] Result<std::string> provision(int64_t problem_id);

    /**
     * @brief Create session_id for problem_id, or re-provision it in place
     *
     * Re-provisioning drops the session's previous tables first. A failed
     * re-provisioning tears the session down.
     * @return session_id, or PROVISION_ERROR / BUSY
     */
    [[nodiscard]] Result<std::string> provision(const std::string& session_id, int64_t problem_id);

    /**
     * @brief Run one candidate query
     */
    [[nodiscard]] QueryOutcome run(const std::string& session_id, const std::string& sql);

    /**
     * @brief Release the session's tables and engine context
     *
     * Waits for an in-flight query to finish.
     * @return false if the session was unknown
     */
    bool teardown(const std::string& session_id);

    /**
     * @brief Tear down every live session
     */
    void teardown_all();

    /**
     * @brief Logical tables and declared column types, in catalog order
     */
    [[nodiscard]] Result<std::vector<TableSchema>> describe_schema(const std::string& session_id);

    /**
     * @brief Loaded/skipped row counts from the session's last provisioning
     */
    [[nodiscard]] Result<ProvisionReport> provision_report(const std::string& session_id);

    [[nodiscard]] size_t session_count() const { return registry_.size(); }
    [[nodiscard]] std::vector<std::string> list_sessions() const { return registry_.list_sessions(); }

    [[nodiscard]] const SandboxOptions& options() const { return options_; }

private:
    [[nodiscard]] bool acquire(std::unique_lock<std::timed_mutex>& lock) const;

    [[nodiscard]] Result<ProvisionedSchema> provision_into(
        TenantSession& session, int64_t problem_id) const;

    void emit(SessionEvent event);

    [[nodiscard]] static std::string not_found_message(const std::string& session_id);
    [[nodiscard]] static std::string busy_message();

    SandboxComponents c_;
    SandboxOptions options_;

    SchemaProvisioner provisioner_;
    QueryPipeline pipeline_;
    SessionRegistry registry_;

    // Serializes creation so max_sessions cannot be overshot
    std::mutex create_mutex_;

    std::atomic<uint64_t> event_sequence_{0};
};

} // namespace sqlsandbox
