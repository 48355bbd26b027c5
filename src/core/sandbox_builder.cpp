#include "core/sandbox_builder.hpp"
#include "catalog/sqlite_catalog.hpp"
#include "core/utils.hpp"
#include "db/sqlite/sqlite_connection.hpp"

#include <format>
#include <stdexcept>

namespace sqlsandbox {

SandboxOptions SandboxBuilder::options_from(const SandboxConfig& config) {
    SandboxOptions options;
    options.executor.row_cap = static_cast<uint32_t>(config.executor.row_cap);
    options.executor.timeout_ms = static_cast<uint32_t>(config.executor.timeout_ms);
    options.busy_wait = std::chrono::milliseconds(config.sessions.busy_wait_ms);
    options.max_sessions = static_cast<size_t>(config.sessions.max_sessions);
    return options;
}

std::unique_ptr<SandboxEngine> SandboxBuilder::build() {
    if (const auto level = utils::log::parse_level(config_.logging.level)) {
        utils::log::set_level(*level);
    }

    if (!c_.catalog) {
        if (config_.catalog.path.empty()) {
            throw std::runtime_error("SandboxBuilder: catalog is required (set catalog.path)");
        }
        c_.catalog = std::make_shared<SqliteCatalog>(config_.catalog.path);
    }
    if (!c_.connection_factory) {
        c_.connection_factory = std::make_shared<SqliteConnectionFactory>();
    }
    if (!c_.event_sink && config_.history.enabled) {
        history_ = std::make_shared<SessionHistory>(
            static_cast<size_t>(config_.history.max_events_per_session));
        c_.event_sink = history_;
    }

    const auto options = options_from(config_);
    utils::log::info(std::format(
        "Sandbox engine: row_cap={} timeout_ms={} busy_wait_ms={} max_sessions={} events={}",
        options.executor.row_cap, options.executor.timeout_ms, options.busy_wait.count(),
        options.max_sessions, c_.event_sink ? c_.event_sink->name() : "off"));

    return std::make_unique<SandboxEngine>(std::move(c_), options);
}

} // namespace sqlsandbox
