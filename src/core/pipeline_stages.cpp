#include "core/pipeline_stages.hpp"
#include "core/query_rewriter.hpp"
#include "executor/result_normalizer.hpp"
#include "security/query_validator.hpp"
#include "tenant/tenant_session.hpp"

#include <format>

namespace sqlsandbox {

// ============================================================================
// ParseStage
// ============================================================================
IPipelineStage::Result ParseStage::process(QueryContext& ctx) {
    ctx.tokens.emplace(SqlTokenizer::tokenize(ctx.sql));
    ctx.scan = StatementScanner::scan(*ctx.tokens);

    if (ctx.scan.statement_count == 0) {
        ctx.fail(ErrorKind::ENGINE_ERROR, "Query is empty");
        return Result::BLOCK;
    }
    return Result::CONTINUE;
}

// ============================================================================
// ValidateStage
// ============================================================================
IPipelineStage::Result ValidateStage::process(QueryContext& ctx) {
    const auto& ns = ctx.session.tenant_namespace();
    const auto result = QueryValidator::validate(*ctx.tokens, ctx.scan, ns.allowed_tables());
    if (!result.allowed) {
        utils::log::info(std::format("Session {} query rejected ({}): {}",
            ctx.session.session_id(), error_kind_to_string(result.error_kind), result.message));
        ctx.fail(result.error_kind, result.message);
        return Result::BLOCK;
    }
    return Result::CONTINUE;
}

// ============================================================================
// RewriteStage
// ============================================================================
IPipelineStage::Result RewriteStage::process(QueryContext& ctx) {
    ctx.rewritten_sql = QueryRewriter::rewrite(*ctx.tokens, ctx.scan,
                                               ctx.session.tenant_namespace());
    return Result::CONTINUE;
}

// ============================================================================
// ExecuteStage
// ============================================================================
IPipelineStage::Result ExecuteStage::process(QueryContext& ctx) {
    ctx.db_result = c_.executor.execute(ctx.session.connection(), ctx.rewritten_sql);
    if (!ctx.db_result.success) {
        ctx.fail(ctx.db_result.error_kind, ctx.db_result.error_message);
        return Result::BLOCK;
    }
    return Result::CONTINUE;
}

// ============================================================================
// NormalizeStage
// ============================================================================
IPipelineStage::Result NormalizeStage::process(QueryContext& ctx) {
    ctx.outcome = ResultNormalizer::normalize(std::move(ctx.db_result),
                                              ctx.session.tenant_namespace());
    return Result::CONTINUE;
}

} // namespace sqlsandbox
