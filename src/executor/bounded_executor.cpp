#include "executor/bounded_executor.hpp"
#include "core/query_rewriter.hpp"
#include "core/utils.hpp"
#include <format>

namespace sqlsandbox {

BoundedExecutor::BoundedExecutor(const Config& config)
    : config_(config) {}

DbResultSet BoundedExecutor::execute(IDbConnection& conn, const std::string& sql) const {
    try {
        if (!conn.is_connected()) {
            return DbResultSet::error(ErrorKind::INTERNAL, "Session connection is closed");
        }

        std::string bounded = QueryRewriter::enforce_limit(sql, config_.row_cap);
        if (bounded.empty()) {
            bounded = sql;
        }

        if (!conn.set_query_timeout(config_.timeout_ms)) {
            return DbResultSet::error(ErrorKind::INTERNAL, "Failed to set query timeout");
        }

        auto result = conn.execute(bounded, config_.row_cap);

        // Enforce the cap even if the engine returned more than asked for
        if (result.success && config_.row_cap > 0 && result.rows.size() > config_.row_cap) {
            result.rows.resize(config_.row_cap);
            result.truncated = true;
        }
        return result;

    } catch (const std::exception& e) {
        return DbResultSet::error(ErrorKind::INTERNAL, std::format("Engine error: {}", e.what()));
    }
}

} // namespace sqlsandbox
