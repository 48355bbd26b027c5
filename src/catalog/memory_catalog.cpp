#include "catalog/memory_catalog.hpp"

#include <mutex>

namespace sqlsandbox {

void MemoryCatalog::add_table(int64_t problem_id, std::string table_name,
                              std::string schema_json, std::vector<std::string> rows) {
    std::unique_lock lock(mutex_);
    auto& entries = problems_[problem_id];
    for (auto& entry : entries) {
        if (entry.table.table_name == table_name) {
            entry.table.schema_json = std::move(schema_json);
            entry.rows = std::move(rows);
            return;
        }
    }
    entries.push_back({{std::move(table_name), std::move(schema_json)}, std::move(rows)});
}

std::vector<CatalogTable> MemoryCatalog::get_tables(int64_t problem_id) const {
    std::shared_lock lock(mutex_);
    std::vector<CatalogTable> result;
    const auto it = problems_.find(problem_id);
    if (it == problems_.end()) return result;
    result.reserve(it->second.size());
    for (const auto& entry : it->second) {
        result.push_back(entry.table);
    }
    return result;
}

std::vector<std::string> MemoryCatalog::get_rows(
    int64_t problem_id, const std::string& table_name) const {
    std::shared_lock lock(mutex_);
    const auto it = problems_.find(problem_id);
    if (it == problems_.end()) return {};
    for (const auto& entry : it->second) {
        if (entry.table.table_name == table_name) return entry.rows;
    }
    return {};
}

} // namespace sqlsandbox
