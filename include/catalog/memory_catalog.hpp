#pragma once

#include "catalog/icatalog.hpp"
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

namespace sqlsandbox {

/**
 * @brief In-process catalog for embedding and tests
 *
 * Thread-safe: readers take a shared lock, add_table takes a unique lock.
 */
class MemoryCatalog : public ICatalog {
public:
    MemoryCatalog() = default;

    /**
     * @brief Register (or replace) a table for a problem
     */
    void add_table(int64_t problem_id, std::string table_name,
                   std::string schema_json, std::vector<std::string> rows);

    [[nodiscard]] std::vector<CatalogTable> get_tables(int64_t problem_id) const override;
    [[nodiscard]] std::vector<std::string> get_rows(
        int64_t problem_id, const std::string& table_name) const override;

private:
    struct Entry {
        CatalogTable table;
        std::vector<std::string> rows;
    };

    std::map<int64_t, std::vector<Entry>> problems_;
    mutable std::shared_mutex mutex_;
};

} // namespace sqlsandbox
