#pragma once

#include <cstdint>
#include <string>

namespace sqlsandbox {

// ============================================================================
// Configuration Structures
// ============================================================================

struct ExecutorConfig {
    int64_t row_cap = 5000;
    int64_t timeout_ms = 30000;
};

struct SessionsConfig {
    int64_t busy_wait_ms = 0;       // 0 = reject overlapping queries immediately
    int64_t max_sessions = 0;       // 0 = unlimited
};

struct CatalogConfig {
    std::string path;               // SqliteCatalog database file
};

struct LoggingConfig {
    std::string level = "info";
};

struct HistoryConfig {
    bool enabled = true;
    int64_t max_events_per_session = 1000;
};

struct SandboxConfig {
    ExecutorConfig executor;
    SessionsConfig sessions;
    CatalogConfig catalog;
    LoggingConfig logging;
    HistoryConfig history;
};

} // namespace sqlsandbox
