#include "core/pipeline.hpp"
#include "core/utils.hpp"
#include "tenant/tenant_session.hpp"

#include <format>

namespace sqlsandbox {

namespace {

constexpr std::string_view kInternalMessage =
    "An internal error occurred while running the query. Please try again.";

constexpr std::string_view kTimeoutHint =
    "Consider simplifying the query: add filters, avoid large cross joins, "
    "or bound recursive CTEs.";

} // anonymous namespace

QueryPipeline::QueryPipeline(const BoundedExecutor::Config& executor_config)
    : c_{BoundedExecutor(executor_config)} {
    build_stage_chain();
}

void QueryPipeline::build_stage_chain() {
    stages_.push_back(std::make_unique<ParseStage>());
    stages_.push_back(std::make_unique<ValidateStage>());
    stages_.push_back(std::make_unique<RewriteStage>());
    stages_.push_back(std::make_unique<ExecuteStage>(c_));
    stages_.push_back(std::make_unique<NormalizeStage>());
}

std::vector<std::string_view> QueryPipeline::stage_names() const {
    std::vector<std::string_view> names;
    names.reserve(stages_.size());
    for (const auto& stage : stages_) {
        names.push_back(stage->name());
    }
    return names;
}

std::string QueryPipeline::candidate_message(
    ErrorKind kind, const std::string& message, const TenantSession& session) {

    switch (kind) {
        case ErrorKind::INTERNAL:
            return std::string(kInternalMessage);
        case ErrorKind::TIMEOUT:
            return std::format("{} {}",
                session.tenant_namespace().to_logical_text(message), kTimeoutHint);
        default:
            return session.tenant_namespace().to_logical_text(message);
    }
}

QueryOutcome QueryPipeline::run(TenantSession& session, const std::string& sql) const {
    QueryContext ctx(session, sql);

    try {
        for (const auto& stage : stages_) {
            if (stage->process(ctx) == IPipelineStage::Result::BLOCK) {
                break;
            }
        }
    } catch (const std::exception& e) {
        ctx.fail(ErrorKind::INTERNAL, std::format("Unhandled exception in pipeline: {}", e.what()));
    }

    if (!ctx.outcome.success) {
        if (ctx.outcome.error_kind == ErrorKind::INTERNAL) {
            utils::log::error(std::format("Session {} internal error: {} (sql: {})",
                session.session_id(), ctx.outcome.error_message, sql));
        } else if (ctx.outcome.error_kind == ErrorKind::TIMEOUT) {
            utils::log::warn(std::format("Session {} query timed out after {}ms",
                session.session_id(), c_.executor.config().timeout_ms));
        }
        ctx.outcome.error_message = candidate_message(
            ctx.outcome.error_kind, ctx.outcome.error_message, session);
        ctx.outcome.columns.clear();
        ctx.outcome.rows.clear();
        ctx.outcome.truncated = false;
    }

    ctx.outcome.elapsed = ctx.timer.elapsed_us();
    return std::move(ctx.outcome);
}

} // namespace sqlsandbox
