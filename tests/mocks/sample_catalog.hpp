#pragma once

#include "catalog/memory_catalog.hpp"

#include <format>
#include <memory>
#include <string>
#include <vector>

namespace sqlsandbox::testing {

/**
 * @brief Catalog with the datasets most tests share
 *
 * - problem 3: customers (3 rows), orders (4 rows)
 * - problem 7: employees (2 rows), customers (1 row, different data)
 * - problem 11: numbers (n = 1..20)
 */
inline std::shared_ptr<MemoryCatalog> make_sample_catalog() {
    auto catalog = std::make_shared<MemoryCatalog>();

    catalog->add_table(3, "customers",
        R"([{"name":"customer_id","type":"INTEGER"},{"name":"name","type":"TEXT"},)"
        R"({"name":"signup_date","type":"DATE"}])",
        {
            R"([1, "Alice", "2023-01-15"])",
            R"([2, "Bob", "2023-02-20"])",
            R"({"customer_id": 3, "name": "Carol", "signup_date": null})",
        });

    catalog->add_table(3, "orders",
        R"([{"name":"order_id","type":"INTEGER"},{"name":"customer_id","type":"INTEGER"},)"
        R"({"name":"amount","type":"REAL"}])",
        {
            R"([100, 1, 25.5])",
            R"([101, 1, 10])",
            R"([102, 2, 99.99])",
            R"([103, 3, 5])",
        });

    catalog->add_table(7, "employees",
        R"([{"name":"employee_id","type":"INTEGER"},{"name":"name","type":"TEXT"},)"
        R"({"name":"salary","type":"REAL"}])",
        {
            R"([1, "Dana", 85000])",
            R"([2, "Eve", 92000.5])",
        });

    catalog->add_table(7, "customers",
        R"([{"name":"customer_id","type":"INTEGER"},{"name":"name","type":"TEXT"}])",
        {
            R"([1, "Zed"])",
        });

    std::vector<std::string> numbers;
    for (int n = 1; n <= 20; ++n) {
        numbers.push_back(std::format("[{}]", n));
    }
    catalog->add_table(11, "numbers", R"([{"name":"n","type":"INTEGER"}])", std::move(numbers));

    return catalog;
}

} // namespace sqlsandbox::testing
