#pragma once

#include "core/types.hpp"

#include <string>
#include <vector>

namespace sqlsandbox {

/**
 * @brief JSON serialization of engine results for the grading layer
 */
class OutcomeJson {
public:
    /**
     * @brief {"success","columns","rows":[{col:value}],"elapsed_ms","truncated","error","error_kind"}
     *
     * Row objects follow column order; duplicate column names are emitted
     * as given.
     */
    [[nodiscard]] static std::string outcome_to_json(const QueryOutcome& outcome);

    /**
     * @brief {"table":[{"name":...,"type":...}], ...} in catalog order
     */
    [[nodiscard]] static std::string schema_to_json(const std::vector<TableSchema>& schema);

    [[nodiscard]] static std::string report_to_json(const ProvisionReport& report);

    [[nodiscard]] static std::string value_to_json(const Value& value);
};

} // namespace sqlsandbox
