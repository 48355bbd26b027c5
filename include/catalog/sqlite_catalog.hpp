#pragma once

#include "catalog/icatalog.hpp"
#include <string>

namespace sqlsandbox {

/**
 * @brief Catalog backed by the problem authoring database (SQLite file)
 *
 * Expected tables:
 *   problem_tables(problem_id, table_name, schema_json)
 *   table_data(problem_id, table_name, row_json)
 *
 * Opens a fresh read-only connection per call, so concurrent provisioning
 * never shares a handle.
 */
class SqliteCatalog : public ICatalog {
public:
    explicit SqliteCatalog(std::string db_path);

    [[nodiscard]] std::vector<CatalogTable> get_tables(int64_t problem_id) const override;
    [[nodiscard]] std::vector<std::string> get_rows(
        int64_t problem_id, const std::string& table_name) const override;

    [[nodiscard]] const std::string& path() const { return db_path_; }

private:
    std::string db_path_;
};

} // namespace sqlsandbox
