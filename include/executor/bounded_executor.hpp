#pragma once

#include "db/idb_connection.hpp"
#include <cstdint>
#include <string>

namespace sqlsandbox {

/**
 * @brief Runs a rewritten query under a row cap and a wall-clock timeout
 *
 * Appends LIMIT row_cap to read queries without a top-level LIMIT, then
 * truncates whatever comes back to row_cap. Never throws: exceptions from
 * the engine layer become INTERNAL results.
 */
class BoundedExecutor {
public:
    struct Config {
        uint32_t row_cap = 5000;
        uint32_t timeout_ms = 30000;
    };

    explicit BoundedExecutor(const Config& config);
    BoundedExecutor() : BoundedExecutor(Config{}) {}

    [[nodiscard]] DbResultSet execute(IDbConnection& conn, const std::string& sql) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace sqlsandbox
