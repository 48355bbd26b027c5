#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace sqlsandbox {

/**
 * @brief Logical <-> physical table name mapping for one session
 *
 * Logical names are matched case-insensitively. Physical names are
 * "<lowercased logical>_<problem_id>".
 */
class TenantNamespace {
public:
    TenantNamespace() = default;

    [[nodiscard]] static std::string physical_name(const std::string& logical, int64_t problem_id);

    void add(const std::string& logical, const std::string& physical);

    [[nodiscard]] std::optional<std::string> physical_for(const std::string& logical) const;
    [[nodiscard]] bool contains(const std::string& logical) const;

    /**
     * @brief Logical names as declared by the catalog, catalog order
     */
    [[nodiscard]] const std::vector<std::string>& logical_names() const { return logical_names_; }
    [[nodiscard]] const std::vector<std::string>& physical_names() const { return physical_names_; }

    /**
     * @brief Lowercased logical names, as consumed by QueryValidator
     */
    [[nodiscard]] const std::unordered_set<std::string>& allowed_tables() const { return allowed_lower_; }

    /**
     * @brief Replace whole-word physical names in engine text with logical names
     */
    [[nodiscard]] std::string to_logical_text(const std::string& text) const;

    /**
     * @brief Map a result column name back to logical names
     *
     * A name that is a single identifier came from an AS alias or a column,
     * never from a rewritten table reference, and is returned unchanged.
     * Expression names such as "count(customers_3.id)" are mapped like
     * to_logical_text().
     */
    [[nodiscard]] std::string to_logical_column(const std::string& name) const;

    [[nodiscard]] bool empty() const { return logical_names_.empty(); }

private:
    std::vector<std::string> logical_names_;
    std::vector<std::string> physical_names_;
    std::unordered_set<std::string> allowed_lower_;
    std::unordered_map<std::string, std::string> logical_to_physical_;  // lowercase logical key
    std::unordered_map<std::string, std::string> physical_to_logical_;  // lowercase physical key
};

} // namespace sqlsandbox
