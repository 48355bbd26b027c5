#include <catch2/catch_test_macros.hpp>
#include "core/query_rewriter.hpp"

using namespace sqlsandbox;

namespace {

TenantNamespace problem3() {
    TenantNamespace ns;
    ns.add("customers", "customers_3");
    ns.add("orders", "orders_3");
    return ns;
}

} // anonymous namespace

// ============================================================================
// Identifier rewriting
// ============================================================================

TEST_CASE("QueryRewriter: table references become physical names", "[rewriter]") {
    CHECK(QueryRewriter::rewrite("SELECT name FROM customers WHERE customer_id = 1", problem3())
          == "SELECT name FROM customers_3 WHERE customer_id = 1");
}

TEST_CASE("QueryRewriter: joins", "[rewriter]") {
    CHECK(QueryRewriter::rewrite(
              "SELECT * FROM customers JOIN orders ON customers.customer_id = orders.customer_id",
              problem3())
          == "SELECT * FROM customers_3 JOIN orders_3 ON customers_3.customer_id = orders_3.customer_id");
}

TEST_CASE("QueryRewriter: alias qualifiers are untouched", "[rewriter]") {
    CHECK(QueryRewriter::rewrite("SELECT c.name FROM customers c", problem3())
          == "SELECT c.name FROM customers_3 c");
}

TEST_CASE("QueryRewriter: quoting style is preserved", "[rewriter]") {
    CHECK(QueryRewriter::rewrite(R"(SELECT * FROM "Customers")", problem3())
          == R"(SELECT * FROM "customers_3")");
    CHECK(QueryRewriter::rewrite("SELECT * FROM [orders]", problem3())
          == "SELECT * FROM [orders_3]");
    CHECK(QueryRewriter::rewrite("SELECT * FROM `orders`", problem3())
          == "SELECT * FROM `orders_3`");
}

TEST_CASE("QueryRewriter: case-insensitive match", "[rewriter]") {
    CHECK(QueryRewriter::rewrite("SELECT * FROM CUSTOMERS", problem3())
          == "SELECT * FROM customers_3");
}

TEST_CASE("QueryRewriter: literals and comments are untouched", "[rewriter]") {
    CHECK(QueryRewriter::rewrite("SELECT 'customers' FROM customers -- from orders", problem3())
          == "SELECT 'customers' FROM customers_3 -- from orders");
}

TEST_CASE("QueryRewriter: CTE shadowing a logical name", "[rewriter]") {
    CHECK(QueryRewriter::rewrite(
              "WITH orders AS (SELECT * FROM customers) SELECT * FROM orders", problem3())
          == "WITH orders AS (SELECT * FROM customers_3) SELECT * FROM orders");
}

TEST_CASE("QueryRewriter: schema-qualified reference keeps its qualifier", "[rewriter]") {
    CHECK(QueryRewriter::rewrite("SELECT * FROM main.orders", problem3())
          == "SELECT * FROM main.orders_3");
}

TEST_CASE("QueryRewriter: table after IN is rewritten", "[rewriter]") {
    CHECK(QueryRewriter::rewrite(
              "SELECT name FROM customers WHERE customer_id IN orders", problem3())
          == "SELECT name FROM customers_3 WHERE customer_id IN orders_3");
    CHECK(QueryRewriter::rewrite(
              "SELECT name FROM customers WHERE customer_id IN (SELECT customer_id FROM orders)",
              problem3())
          == "SELECT name FROM customers_3 WHERE customer_id IN (SELECT customer_id FROM orders_3)");
}

TEST_CASE("QueryRewriter: unknown tables are left alone", "[rewriter]") {
    CHECK(QueryRewriter::rewrite("SELECT * FROM employees", problem3())
          == "SELECT * FROM employees");
}

// ============================================================================
// Enforce Limit
// ============================================================================

TEST_CASE("QueryRewriter: enforce_limit adds LIMIT to query without one", "[rewriter]") {
    CHECK(QueryRewriter::enforce_limit("SELECT * FROM customers", 1000)
          == "SELECT * FROM customers LIMIT 1000");
}

TEST_CASE("QueryRewriter: enforce_limit skips query with existing LIMIT", "[rewriter]") {
    CHECK(QueryRewriter::enforce_limit("SELECT * FROM customers LIMIT 50", 1000).empty());
    CHECK(QueryRewriter::enforce_limit("SELECT * FROM customers LIMIT 50000", 1000).empty());
}

TEST_CASE("QueryRewriter: enforce_limit handles semicolons", "[rewriter]") {
    CHECK(QueryRewriter::enforce_limit("SELECT * FROM customers;", 10)
          == "SELECT * FROM customers LIMIT 10;");
}

TEST_CASE("QueryRewriter: enforce_limit handles trailing comments", "[rewriter]") {
    CHECK(QueryRewriter::enforce_limit("SELECT * FROM customers -- all of them", 10)
          == "SELECT * FROM customers LIMIT 10 -- all of them");
}

TEST_CASE("QueryRewriter: enforce_limit ignores nested LIMIT", "[rewriter]") {
    CHECK(QueryRewriter::enforce_limit("SELECT * FROM (SELECT * FROM orders LIMIT 5)", 10)
          == "SELECT * FROM (SELECT * FROM orders LIMIT 5) LIMIT 10");
}

TEST_CASE("QueryRewriter: enforce_limit applies to CTE queries", "[rewriter]") {
    CHECK(QueryRewriter::enforce_limit("WITH x AS (SELECT 1) SELECT * FROM x", 10)
          == "WITH x AS (SELECT 1) SELECT * FROM x LIMIT 10");
}

TEST_CASE("QueryRewriter: enforce_limit leaves non-read and multi-statement input", "[rewriter]") {
    CHECK(QueryRewriter::enforce_limit("DELETE FROM customers", 10).empty());
    CHECK(QueryRewriter::enforce_limit("SELECT 1; SELECT 2", 10).empty());
    CHECK(QueryRewriter::enforce_limit("", 10).empty());
}
