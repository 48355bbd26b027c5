#pragma once

#include "core/pipeline_stage.hpp"
#include "executor/bounded_executor.hpp"

namespace sqlsandbox {

/**
 * @brief Shared components the stages read from
 */
struct PipelineComponents {
    BoundedExecutor executor;
};

/**
 * @brief Base class providing access to pipeline components
 */
class ComponentStage : public IPipelineStage {
public:
    explicit ComponentStage(const PipelineComponents& c) : c_(c) {}
protected:
    const PipelineComponents& c_;
};

// ============================================================================
// Stages (in execution order)
// ============================================================================

/// Tokenize and scan once; later stages share the result
class ParseStage final : public IPipelineStage {
public:
    [[nodiscard]] Result process(QueryContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "parse"; }
};

/// Denylist + table scope
class ValidateStage final : public IPipelineStage {
public:
    [[nodiscard]] Result process(QueryContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "validate"; }
};

/// Logical -> physical identifiers
class RewriteStage final : public IPipelineStage {
public:
    [[nodiscard]] Result process(QueryContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "rewrite"; }
};

class ExecuteStage final : public ComponentStage {
public:
    using ComponentStage::ComponentStage;
    [[nodiscard]] Result process(QueryContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "execute"; }
};

class NormalizeStage final : public IPipelineStage {
public:
    [[nodiscard]] Result process(QueryContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "normalize"; }
};

} // namespace sqlsandbox
