#pragma once

#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace sqlsandbox {

/**
 * @brief Abstract factory for per-session engine connections
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Create a new engine connection
     * @param connection_string Engine-specific location, e.g. ":memory:"
     * @return New connection, or nullptr on failure
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const std::string& connection_string) = 0;
};

} // namespace sqlsandbox
