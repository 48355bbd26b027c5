#pragma once

#include "core/query_context.hpp"
#include <string_view>

namespace sqlsandbox {

/**
 * @brief Abstract pipeline stage interface
 *
 * Each stage in the query pipeline implements this interface.
 * Stages are composed into a chain and executed sequentially.
 *
 * Result semantics:
 * - CONTINUE: Stage passed, proceed to next stage
 * - BLOCK:    Stage rejected the query; ctx.outcome holds the failure
 */
class IPipelineStage {
public:
    virtual ~IPipelineStage() = default;

    enum class Result { CONTINUE, BLOCK };

    /**
     * @brief Process query through this stage
     * @param ctx Mutable query context
     * @return Stage result determining pipeline flow
     */
    [[nodiscard]] virtual Result process(QueryContext& ctx) = 0;

    /**
     * @brief Human-readable stage name for logging
     */
    [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace sqlsandbox
