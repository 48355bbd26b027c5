#include "core/outcome_json.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <format>

namespace sqlsandbox {

std::string OutcomeJson::value_to_json(const Value& value) {
    switch (value.kind) {
        case Value::Kind::BOOLEAN:
            return utils::booltostr(value.bool_value);
        case Value::Kind::INTEGER:
            return std::format("{}", value.int_value);
        case Value::Kind::REAL:
            if (!std::isfinite(value.real_value)) return "null";
            return std::format("{}", value.real_value);
        case Value::Kind::TEXT:
        case Value::Kind::BLOB:
            return std::format("\"{}\"", utils::escape_json(value.text));
        case Value::Kind::NULL_VALUE:
        default:
            return "null";
    }
}

std::string OutcomeJson::outcome_to_json(const QueryOutcome& outcome) {
    std::string out;
    out += std::format("{{\"success\":{},", utils::booltostr(outcome.success));

    out += "\"columns\":[";
    for (size_t i = 0; i < outcome.columns.size(); ++i) {
        if (i > 0) out += ',';
        out += std::format("\"{}\"", utils::escape_json(outcome.columns[i]));
    }
    out += "],";

    out += "\"rows\":[";
    for (size_t r = 0; r < outcome.rows.size(); ++r) {
        if (r > 0) out += ',';
        const auto& row = outcome.rows[r];
        out += '{';
        for (size_t c = 0; c < row.size() && c < outcome.columns.size(); ++c) {
            if (c > 0) out += ',';
            out += std::format("\"{}\":{}", utils::escape_json(outcome.columns[c]),
                               value_to_json(row[c]));
        }
        out += '}';
    }
    out += "],";

    const double elapsed_ms = static_cast<double>(outcome.elapsed.count()) / 1000.0;
    out += std::format("\"elapsed_ms\":{:.3f},\"truncated\":{},", elapsed_ms,
                       utils::booltostr(outcome.truncated));

    if (outcome.success) {
        out += "\"error\":null,\"error_kind\":null}";
    } else {
        out += std::format("\"error\":\"{}\",\"error_kind\":\"{}\"}}",
                           utils::escape_json(outcome.error_message),
                           error_kind_to_string(outcome.error_kind));
    }
    return out;
}

std::string OutcomeJson::schema_to_json(const std::vector<TableSchema>& schema) {
    std::string out = "{";
    for (size_t t = 0; t < schema.size(); ++t) {
        if (t > 0) out += ',';
        const auto& table = schema[t];
        out += std::format("\"{}\":[", utils::escape_json(table.name));
        for (size_t c = 0; c < table.columns.size(); ++c) {
            if (c > 0) out += ',';
            out += std::format("{{\"name\":\"{}\",\"type\":\"{}\"}}",
                               utils::escape_json(table.columns[c].name),
                               declared_type_to_string(table.columns[c].type));
        }
        out += ']';
    }
    out += '}';
    return out;
}

std::string OutcomeJson::report_to_json(const ProvisionReport& report) {
    std::string out = std::format("{{\"problem_id\":{},\"tables\":[", report.problem_id);
    for (size_t i = 0; i < report.tables.size(); ++i) {
        if (i > 0) out += ',';
        const auto& t = report.tables[i];
        out += std::format("{{\"table\":\"{}\",\"rows_loaded\":{},\"rows_skipped\":{}}}",
                           utils::escape_json(t.logical_name), t.rows_loaded, t.rows_skipped);
    }
    out += std::format("],\"total_loaded\":{},\"total_skipped\":{}}}",
                       report.total_loaded(), report.total_skipped());
    return out;
}

} // namespace sqlsandbox
