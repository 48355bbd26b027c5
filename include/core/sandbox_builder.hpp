#pragma once

#include "audit/session_history.hpp"
#include "config/config_types.hpp"
#include "core/sandbox_engine.hpp"

#include <memory>

namespace sqlsandbox {

/**
 * @brief Builder pattern for SandboxEngine construction.
 *
 * Usage:
 *   auto engine = SandboxBuilder()
 *       .with_config(config)
 *       .with_catalog(catalog)          // default: SqliteCatalog(config.catalog.path)
 *       .build();
 *
 * Unset collaborators are filled in from the config: a SqliteConnectionFactory,
 * and a SessionHistory sink when history is enabled.
 */
class SandboxBuilder {
public:
    SandboxBuilder& with_config(const SandboxConfig& config)                        { config_ = config; return *this; }
    SandboxBuilder& with_catalog(std::shared_ptr<const ICatalog> p)                 { c_.catalog = std::move(p); return *this; }
    SandboxBuilder& with_connection_factory(std::shared_ptr<IConnectionFactory> p)  { c_.connection_factory = std::move(p); return *this; }
    SandboxBuilder& with_event_sink(std::shared_ptr<IEventSink> p)                  { c_.event_sink = std::move(p); return *this; }

    /**
     * @brief Build the engine from accumulated components.
     * @throws std::runtime_error if no catalog is given and none is configured.
     */
    [[nodiscard]] std::unique_ptr<SandboxEngine> build();

    /**
     * @brief History sink created by build(), if any
     */
    [[nodiscard]] std::shared_ptr<SessionHistory> history() const { return history_; }

    [[nodiscard]] static SandboxOptions options_from(const SandboxConfig& config);

private:
    SandboxConfig config_;
    SandboxComponents c_;
    std::shared_ptr<SessionHistory> history_;
};

} // namespace sqlsandbox
