#pragma once

#include "core/types.hpp"
#include "core/utils.hpp"
#include "db/idb_connection.hpp"
#include "parser/sql_tokenizer.hpp"
#include "parser/statement_scanner.hpp"

#include <optional>
#include <string>

namespace sqlsandbox {

class TenantSession;

/**
 * @brief Query context - carries state for one candidate query through the
 * pipeline stages
 *
 * The session is locked by the caller for the lifetime of the context.
 */
struct QueryContext {
    QueryContext(TenantSession& s, std::string query)
        : session(s), sql(std::move(query)) {}

    // Input
    TenantSession& session;
    std::string sql;

    // Stage results
    std::optional<TokenStream> tokens;
    StatementScan scan;
    std::string rewritten_sql;
    DbResultSet db_result;

    // Output
    QueryOutcome outcome;

    utils::Timer timer;

    void fail(ErrorKind kind, std::string message) {
        outcome = QueryOutcome::failure(kind, std::move(message));
    }
};

} // namespace sqlsandbox
