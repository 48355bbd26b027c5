#pragma once

#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace sqlsandbox {

enum class SessionEventType : uint8_t {
    SESSION_PROVISIONED,
    QUERY_EXECUTED,
    QUERY_REJECTED,     // Never reached the engine (validator, busy)
    SESSION_TORN_DOWN
};

[[nodiscard]] inline constexpr std::string_view session_event_type_to_string(SessionEventType type) {
    switch (type) {
        case SessionEventType::SESSION_PROVISIONED: return "SESSION_PROVISIONED";
        case SessionEventType::QUERY_EXECUTED:      return "QUERY_EXECUTED";
        case SessionEventType::QUERY_REJECTED:      return "QUERY_REJECTED";
        case SessionEventType::SESSION_TORN_DOWN:   return "SESSION_TORN_DOWN";
        default:                                    return "UNKNOWN";
    }
}

// ============================================================================
// Session Event
// ============================================================================

struct SessionEvent {
    uint64_t sequence = 0;              // Monotonic per engine
    std::chrono::system_clock::time_point timestamp;

    std::string session_id;
    int64_t problem_id = 0;
    SessionEventType type = SessionEventType::QUERY_EXECUTED;

    std::string sql;                    // Candidate SQL as submitted (queries only)
    bool success = false;
    ErrorKind error_kind = ErrorKind::NONE;
    uint64_t row_count = 0;             // Rows returned, or rows loaded when provisioning
    bool truncated = false;
    std::chrono::microseconds elapsed{0};
};

} // namespace sqlsandbox
