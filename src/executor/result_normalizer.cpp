#include "executor/result_normalizer.hpp"
#include "core/base64.hpp"

#include <chrono>
#include <cmath>
#include <format>

namespace sqlsandbox {

namespace {

constexpr int64_t kMinSeconds = -62135596800;  // 0001-01-01T00:00:00Z
constexpr int64_t kMaxSeconds = 253402300799;  // 9999-12-31T23:59:59Z
constexpr double kUnixEpochJulianDay = 2440587.5;
constexpr double kSecondsPerDay = 86400.0;

} // anonymous namespace

std::optional<std::string> ResultNormalizer::format_unix_seconds(int64_t seconds, bool date_only) {
    if (seconds < kMinSeconds || seconds > kMaxSeconds) return std::nullopt;

    using namespace std::chrono;
    const sys_seconds tp{std::chrono::seconds{seconds}};
    const auto day_point = floor<days>(tp);
    const year_month_day ymd{day_point};

    const auto date = std::format("{:04}-{:02}-{:02}",
        static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
        static_cast<unsigned>(ymd.day()));
    if (date_only) return date;

    const hh_mm_ss hms{tp - day_point};
    return std::format("{}T{:02}:{:02}:{:02}", date,
        hms.hours().count(), hms.minutes().count(), hms.seconds().count());
}

Value ResultNormalizer::normalize_value(Value value, const ColumnTypeInfo& type) {
    switch (value.kind) {
        case Value::Kind::BLOB:
            return Value::text_value(base64::encode(value.text));

        case Value::Kind::REAL: {
            if (!std::isfinite(value.real_value)) return Value::null();
            if (type.is_temporal()) {
                const double unix_seconds = (value.real_value - kUnixEpochJulianDay) * kSecondsPerDay;
                if (std::isfinite(unix_seconds) &&
                    unix_seconds >= static_cast<double>(kMinSeconds) && unix_seconds <= static_cast<double>(kMaxSeconds)) {
                    auto iso = format_unix_seconds(static_cast<int64_t>(std::floor(unix_seconds)),
                        type.generic_type == GenericColumnType::DATE);
                    if (iso) return Value::text_value(std::move(*iso));
                }
            }
            return value;
        }

        case Value::Kind::INTEGER:
            if (type.is_temporal()) {
                auto iso = format_unix_seconds(value.int_value,
                    type.generic_type == GenericColumnType::DATE);
                if (iso) return Value::text_value(std::move(*iso));
            }
            if (type.generic_type == GenericColumnType::BOOLEAN &&
                (value.int_value == 0 || value.int_value == 1)) {
                return Value::boolean(value.int_value == 1);
            }
            return value;

        case Value::Kind::NULL_VALUE:
        case Value::Kind::BOOLEAN:
        case Value::Kind::TEXT:
        default:
            return value;
    }
}

QueryOutcome ResultNormalizer::normalize(DbResultSet result, const TenantNamespace& ns) {
    QueryOutcome outcome;
    outcome.success = true;
    outcome.truncated = result.truncated;

    outcome.columns.reserve(result.column_names.size());
    for (const auto& name : result.column_names) {
        outcome.columns.push_back(ns.to_logical_column(name));
    }

    const ColumnTypeInfo unknown;
    outcome.rows.reserve(result.rows.size());
    for (auto& row : result.rows) {
        Row normalized;
        normalized.reserve(row.size());
        for (size_t i = 0; i < row.size(); ++i) {
            const auto& type = i < result.column_types.size() ? result.column_types[i] : unknown;
            normalized.push_back(normalize_value(std::move(row[i]), type));
        }
        outcome.rows.push_back(std::move(normalized));
    }
    return outcome;
}

} // namespace sqlsandbox
