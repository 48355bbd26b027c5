#pragma once

#include "core/pipeline_stage.hpp"
#include "core/pipeline_stages.hpp"
#include "core/types.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sqlsandbox {

class TenantSession;

/**
 * @brief Candidate query pipeline
 *
 * Flow:
 * 1. Parse (tokenize + scan)
 * 2. Validate (denylist, table scope)
 * 3. Rewrite (logical -> physical identifiers)
 * 4. Execute (row cap, timeout)
 * 5. Normalize (JSON-safe values, logical column names)
 *
 * The caller must hold the session's mutex. Never throws.
 */
class QueryPipeline {
public:
    explicit QueryPipeline(const BoundedExecutor::Config& executor_config);

    QueryPipeline(const QueryPipeline&) = delete;
    QueryPipeline& operator=(const QueryPipeline&) = delete;

    [[nodiscard]] QueryOutcome run(TenantSession& session, const std::string& sql) const;

    [[nodiscard]] std::vector<std::string_view> stage_names() const;

    [[nodiscard]] const BoundedExecutor::Config& executor_config() const {
        return c_.executor.config();
    }

    /**
     * @brief Rewrite a failure message for the candidate
     *
     * Physical identifiers become logical names; INTERNAL details are
     * replaced by a generic message; TIMEOUT gets a hint.
     */
    [[nodiscard]] static std::string candidate_message(
        ErrorKind kind, const std::string& message, const TenantSession& session);

private:
    void build_stage_chain();

    PipelineComponents c_;
    std::vector<std::unique_ptr<IPipelineStage>> stages_;
};

} // namespace sqlsandbox
