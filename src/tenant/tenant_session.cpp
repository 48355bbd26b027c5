#include "tenant/tenant_session.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlsandbox {

TenantSession::TenantSession(std::string session_id, int64_t problem_id,
                             std::unique_ptr<IDbConnection> connection)
    : session_id_(std::move(session_id)),
      problem_id_(problem_id),
      created_at_(utils::now()),
      connection_(std::move(connection)) {}

TenantSession::~TenantSession() {
    release();
}

void TenantSession::install(int64_t problem_id, std::vector<TableSchema> schema,
                            TenantNamespace ns, ProvisionReport report) {
    problem_id_.store(problem_id, std::memory_order_release);
    schema_ = std::move(schema);
    namespace_ = std::move(ns);
    report_ = std::move(report);
}

void TenantSession::release() {
    if (released_) return;
    released_ = true;

    if (connection_ && connection_->is_connected()) {
        connection_->set_read_only(false);
        for (const auto& physical : namespace_.physical_names()) {
            const auto result = connection_->execute_command(
                std::format("DROP TABLE IF EXISTS \"{}\"", physical));
            if (!result.success) {
                utils::log::warn(std::format("Session {}: failed to drop {}: {}",
                    session_id_, physical, result.error_message));
            }
        }
        connection_->close();
    }

    namespace_ = TenantNamespace{};
    schema_.clear();
}

} // namespace sqlsandbox
