#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace sqlsandbox {

/**
 * @brief One catalog table: logical name plus its column schema as JSON
 *
 * schema_json is an array of {"name": ..., "type": ...} in column order.
 */
struct CatalogTable {
    std::string table_name;
    std::string schema_json;
};

/**
 * @brief Raised by catalog adapters when the backing store fails
 */
class CatalogError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Read-only source of per-problem datasets
 *
 * Consumed by the SchemaProvisioner at provisioning time only.
 * Implementations must be safe to call from multiple threads.
 */
class ICatalog {
public:
    virtual ~ICatalog() = default;

    /**
     * @brief Tables registered for a problem, in catalog order
     * @throws CatalogError on store failure
     */
    [[nodiscard]] virtual std::vector<CatalogTable> get_tables(int64_t problem_id) const = 0;

    /**
     * @brief Row documents of one table (JSON array or object each), in insertion order
     * @throws CatalogError on store failure
     */
    [[nodiscard]] virtual std::vector<std::string> get_rows(
        int64_t problem_id, const std::string& table_name) const = 0;
};

} // namespace sqlsandbox
