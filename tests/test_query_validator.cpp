#include <catch2/catch_test_macros.hpp>
#include "security/query_validator.hpp"

using namespace sqlsandbox;

namespace {

const std::vector<std::string> kProblem3Tables = {"customers", "orders"};

ValidationResult check(const std::string& sql) {
    return QueryValidator::validate(sql, kProblem3Tables);
}

} // anonymous namespace

// ============================================================================
// Denylist
// ============================================================================

TEST_CASE("QueryValidator: plain SELECT is allowed", "[validator]") {
    const auto result = check("SELECT name FROM customers WHERE customer_id = 1");
    CHECK(result.allowed);
    CHECK(result.error_kind == ErrorKind::NONE);
}

TEST_CASE("QueryValidator: every denylisted keyword is rejected", "[validator]") {
    const std::vector<std::pair<std::string, std::string>> cases = {
        {"DROP TABLE customers", "DROP"},
        {"DELETE FROM customers", "DELETE"},
        {"UPDATE customers SET name = 'x'", "UPDATE"},
        {"INSERT INTO orders VALUES (1, 1, 1)", "INSERT"},
        {"ALTER TABLE customers ADD COLUMN x", "ALTER"},
        {"CREATE TABLE t (x)", "CREATE"},
        {"TRUNCATE TABLE orders", "TRUNCATE"},
        {"REPLACE INTO orders VALUES (1, 1, 1)", "REPLACE"},
        {"ATTACH DATABASE 'x.db' AS x", "ATTACH"},
        {"DETACH DATABASE x", "DETACH"},
        {"PRAGMA table_info(customers)", "PRAGMA"},
        {"VACUUM", "VACUUM"},
    };

    for (const auto& [sql, keyword] : cases) {
        INFO(sql);
        const auto result = check(sql);
        CHECK_FALSE(result.allowed);
        CHECK(result.error_kind == ErrorKind::MUTATION_ATTEMPT);
        CHECK(result.message == "Blocked keyword detected: " + keyword +
                                ". Only read-only SELECT queries are allowed.");
    }
}

TEST_CASE("QueryValidator: keyword match is case-insensitive", "[validator]") {
    const auto result = check("select 1; DeLeTe from customers");
    CHECK(result.error_kind == ErrorKind::MUTATION_ATTEMPT);
    CHECK(result.message.find("DELETE") != std::string::npos);
}

TEST_CASE("QueryValidator: keyword in any clause position is rejected", "[validator]") {
    CHECK(check("SELECT * FROM customers WHERE name = 'a' OR drop = 1").error_kind
          == ErrorKind::MUTATION_ATTEMPT);
    CHECK(check("SELECT replace(name, 'a', 'b') FROM customers").error_kind
          == ErrorKind::MUTATION_ATTEMPT);
}

TEST_CASE("QueryValidator: keywords inside literals and comments are ignored", "[validator]") {
    CHECK(check("SELECT * FROM customers WHERE name = 'drop table customers'").allowed);
    CHECK(check("SELECT * FROM customers -- delete later").allowed);
    CHECK(check("SELECT * FROM customers /* UPDATE */").allowed);
    CHECK(check(R"(SELECT "delete" FROM customers)").allowed);
}

TEST_CASE("QueryValidator: whole-token matching only", "[validator]") {
    CHECK(check("SELECT update_log, created_at, dropped FROM customers").allowed);
}

// ============================================================================
// Table scope
// ============================================================================

TEST_CASE("QueryValidator: unknown table is out of scope", "[validator]") {
    const auto result = check("SELECT * FROM employees");
    CHECK_FALSE(result.allowed);
    CHECK(result.error_kind == ErrorKind::OUT_OF_SCOPE_TABLE);
    CHECK(result.message ==
          "Table 'employees' is not available for this problem. Available tables: customers, orders");
}

TEST_CASE("QueryValidator: out-of-scope table in a join or subquery", "[validator]") {
    CHECK(check("SELECT * FROM customers c JOIN employees e ON c.customer_id = e.id").error_kind
          == ErrorKind::OUT_OF_SCOPE_TABLE);
    CHECK(check("SELECT * FROM customers WHERE customer_id IN (SELECT id FROM payments)").error_kind
          == ErrorKind::OUT_OF_SCOPE_TABLE);
}

TEST_CASE("QueryValidator: table names are case-insensitive", "[validator]") {
    CHECK(check("SELECT * FROM CUSTOMERS JOIN \"Orders\" USING (customer_id)").allowed);
}

TEST_CASE("QueryValidator: CTE names are in scope", "[validator]") {
    CHECK(check("WITH totals AS (SELECT customer_id, sum(amount) AS s FROM orders GROUP BY 1) "
                "SELECT * FROM totals").allowed);
}

TEST_CASE("QueryValidator: schema qualifiers", "[validator]") {
    CHECK(check("SELECT * FROM main.customers").allowed);

    const auto result = check("SELECT * FROM temp.customers");
    CHECK(result.error_kind == ErrorKind::OUT_OF_SCOPE_TABLE);
    CHECK(result.message.starts_with("Table 'temp.customers' is not available"));
}

TEST_CASE("QueryValidator: engine catalog tables are out of scope", "[validator]") {
    CHECK(check("SELECT name FROM sqlite_master").error_kind == ErrorKind::OUT_OF_SCOPE_TABLE);
    CHECK(check("SELECT name FROM sqlite_schema").error_kind == ErrorKind::OUT_OF_SCOPE_TABLE);
}

TEST_CASE("QueryValidator: physical names are out of scope", "[validator]") {
    CHECK(check("SELECT * FROM customers_7").error_kind == ErrorKind::OUT_OF_SCOPE_TABLE);
}

TEST_CASE("QueryValidator: table-valued functions are out of scope", "[validator]") {
    const auto result = check("SELECT * FROM pragma_table_info('customers')");
    CHECK(result.error_kind == ErrorKind::OUT_OF_SCOPE_TABLE);
    CHECK(result.message.starts_with("Table-valued function 'pragma_table_info'"));
}

TEST_CASE("QueryValidator: queries without tables are allowed", "[validator]") {
    CHECK(check("SELECT 1 + 1").allowed);
    CHECK(check("SELECT date('2024-01-01', '+1 day')").allowed);
}

TEST_CASE("QueryValidator: denylist is checked before scope", "[validator]") {
    CHECK(check("DROP TABLE employees").error_kind == ErrorKind::MUTATION_ATTEMPT);
}

TEST_CASE("QueryValidator: variable token does not hide the rest of the query", "[validator]") {
    // SQLite lexes $a(') as one variable token, so the quote opens no string
    const auto result = check(
        "SELECT $a(') , replace(name,'a','b') AS n FROM customers_3 --'");
    CHECK_FALSE(result.allowed);
    CHECK(result.error_kind == ErrorKind::MUTATION_ATTEMPT);
    CHECK(result.message.find("REPLACE") != std::string::npos);

    const auto scoped = check("SELECT $a(') , name FROM customers_3 --'");
    CHECK_FALSE(scoped.allowed);
}

TEST_CASE("QueryValidator: bind parameters are rejected", "[validator]") {
    for (const std::string sql : {
             "SELECT name FROM customers WHERE customer_id = ?",
             "SELECT name FROM customers WHERE customer_id = :id",
             "SELECT @v",
             "SELECT $x::y",
             "SELECT #1"}) {
        const auto result = check(sql);
        CHECK_FALSE(result.allowed);
        CHECK(result.error_kind == ErrorKind::ENGINE_ERROR);
    }
}

TEST_CASE("QueryValidator: table after IN is a table reference", "[validator]") {
    CHECK(check("SELECT name FROM customers WHERE customer_id IN orders").allowed);

    const auto result = check("SELECT name FROM customers WHERE customer_id IN orders_3");
    CHECK_FALSE(result.allowed);
    CHECK(result.error_kind == ErrorKind::OUT_OF_SCOPE_TABLE);
    CHECK(result.message.find("orders_3") != std::string::npos);

    CHECK(check("SELECT name FROM customers WHERE customer_id NOT IN main.orders").allowed);
    CHECK(check("SELECT name FROM customers WHERE customer_id IN (1, 2)").allowed);
}
