#include <catch2/catch_test_macros.hpp>
#include "tenant/schema_provisioner.hpp"
#include "catalog/memory_catalog.hpp"
#include "db/sqlite/sqlite_connection.hpp"
#include "mocks/sample_catalog.hpp"

#include <algorithm>

using namespace sqlsandbox;

namespace {

std::unique_ptr<IDbConnection> open_memory_db() {
    SqliteConnectionFactory factory;
    auto conn = factory.create(":memory:");
    REQUIRE(conn != nullptr);
    return conn;
}

// Reads the engine's own catalog; only possible with the read-only guard off
std::vector<std::string> engine_tables(IDbConnection& conn) {
    conn.set_read_only(false);
    const auto result = conn.execute("SELECT name FROM sqlite_master WHERE type = 'table' ORDER BY name", 0);
    conn.set_read_only(true);
    REQUIRE(result.success);
    std::vector<std::string> names;
    for (const auto& row : result.rows) names.push_back(row[0].text);
    return names;
}

} // anonymous namespace

// ============================================================================
// Schema parsing
// ============================================================================

TEST_CASE("SchemaProvisioner: parse a valid schema", "[provisioner]") {
    const auto result = SchemaProvisioner::parse_table_schema("customers",
        R"([{"name":"id","type":"INTEGER"},{"name":"email","type":"varchar"},)"
        R"({"name":"joined","type":"date"},{"name":"score","type":"Double"}])");
    REQUIRE(result.is_ok());

    const auto& schema = result.value();
    CHECK(schema.name == "customers");
    REQUIRE(schema.columns.size() == 4);
    CHECK(schema.columns[0].type == DeclaredType::INTEGER);
    CHECK(schema.columns[1].type == DeclaredType::TEXT);
    CHECK(schema.columns[2].type == DeclaredType::DATE);
    CHECK(schema.columns[3].type == DeclaredType::REAL);
}

TEST_CASE("SchemaProvisioner: malformed schemas are provision errors", "[provisioner]") {
    const std::vector<std::string> bad = {
        "not json",
        "[]",
        R"({"name":"id","type":"INTEGER"})",
        R"([{"name":"id"}])",
        R"([{"name":"id","type":"UUID"}])",
        R"([{"name":"id","type":"INTEGER"},{"name":"ID","type":"TEXT"}])",
        R"([{"name":"bad name","type":"TEXT"}])",
    };
    for (const auto& doc : bad) {
        INFO(doc);
        const auto result = SchemaProvisioner::parse_table_schema("t", doc);
        CHECK(result.is_error());
        CHECK(result.error_kind() == ErrorKind::PROVISION_ERROR);
    }
}

TEST_CASE("SchemaProvisioner: invalid table names are rejected", "[provisioner]") {
    const auto result = SchemaProvisioner::parse_table_schema("orders; drop",
        R"([{"name":"id","type":"INTEGER"}])");
    CHECK(result.is_error());
    CHECK(result.error_message() == "Invalid table name 'orders; drop'");
}

TEST_CASE("SchemaProvisioner: identifier and date validation", "[provisioner]") {
    CHECK(SchemaProvisioner::is_valid_identifier("order_items"));
    CHECK(SchemaProvisioner::is_valid_identifier("_x1"));
    CHECK_FALSE(SchemaProvisioner::is_valid_identifier("1abc"));
    CHECK_FALSE(SchemaProvisioner::is_valid_identifier("a-b"));
    CHECK_FALSE(SchemaProvisioner::is_valid_identifier(""));

    CHECK(SchemaProvisioner::is_valid_date("2024-02-29"));
    CHECK_FALSE(SchemaProvisioner::is_valid_date("2023-02-29"));
    CHECK_FALSE(SchemaProvisioner::is_valid_date("2024-13-01"));
    CHECK_FALSE(SchemaProvisioner::is_valid_date("2024-1-01"));
    CHECK_FALSE(SchemaProvisioner::is_valid_date("yesterday"));
}

// ============================================================================
// Row coercion
// ============================================================================

TEST_CASE("SchemaProvisioner: coerce values to declared types", "[provisioner]") {
    const auto v = [](const std::string& json) { return JsonValue::parse(json); };

    SECTION("INTEGER") {
        CHECK(SchemaProvisioner::coerce_value(v("42"), DeclaredType::INTEGER) == Value::integer(42));
        CHECK(SchemaProvisioner::coerce_value(v("\" 7 \""), DeclaredType::INTEGER) == Value::integer(7));
        CHECK(SchemaProvisioner::coerce_value(v("true"), DeclaredType::INTEGER) == Value::integer(1));
        CHECK_FALSE(SchemaProvisioner::coerce_value(v("3.5"), DeclaredType::INTEGER).has_value());
        CHECK_FALSE(SchemaProvisioner::coerce_value(v("\"abc\""), DeclaredType::INTEGER).has_value());
    }

    SECTION("REAL") {
        CHECK(SchemaProvisioner::coerce_value(v("2.5"), DeclaredType::REAL) == Value::real(2.5));
        CHECK(SchemaProvisioner::coerce_value(v("\"1.25\""), DeclaredType::REAL) == Value::real(1.25));
        CHECK_FALSE(SchemaProvisioner::coerce_value(v("\"n/a\""), DeclaredType::REAL).has_value());
    }

    SECTION("TEXT") {
        CHECK(SchemaProvisioner::coerce_value(v("\"hi\""), DeclaredType::TEXT) == Value::text_value("hi"));
        CHECK(SchemaProvisioner::coerce_value(v("7"), DeclaredType::TEXT) == Value::text_value("7"));
        CHECK(SchemaProvisioner::coerce_value(v("false"), DeclaredType::TEXT) == Value::text_value("false"));
    }

    SECTION("DATE") {
        CHECK(SchemaProvisioner::coerce_value(v("\"2024-01-15\""), DeclaredType::DATE)
              == Value::text_value("2024-01-15"));
        CHECK_FALSE(SchemaProvisioner::coerce_value(v("\"2024-02-30\""), DeclaredType::DATE).has_value());
        CHECK_FALSE(SchemaProvisioner::coerce_value(v("20240115"), DeclaredType::DATE).has_value());
    }

    SECTION("null fits every type") {
        for (const auto type : {DeclaredType::INTEGER, DeclaredType::REAL,
                                DeclaredType::TEXT, DeclaredType::DATE}) {
            CHECK(SchemaProvisioner::coerce_value(v("null"), type) == Value::null());
        }
    }
}

TEST_CASE("SchemaProvisioner: coerce rows from arrays and objects", "[provisioner]") {
    const auto schema = SchemaProvisioner::parse_table_schema("t",
        R"([{"name":"id","type":"INTEGER"},{"name":"name","type":"TEXT"}])").value();

    const auto from_array = SchemaProvisioner::coerce_row(R"([1, "a"])", schema);
    REQUIRE(from_array.is_ok());
    CHECK(from_array.value() == Row{Value::integer(1), Value::text_value("a")});

    const auto from_object = SchemaProvisioner::coerce_row(R"({"NAME": "b", "id": 2})", schema);
    REQUIRE(from_object.is_ok());
    CHECK(from_object.value() == Row{Value::integer(2), Value::text_value("b")});

    const auto missing_key = SchemaProvisioner::coerce_row(R"({"id": 3})", schema);
    REQUIRE(missing_key.is_ok());
    CHECK(missing_key.value()[1].is_null());

    CHECK(SchemaProvisioner::coerce_row(R"([1])", schema).is_error());
    CHECK(SchemaProvisioner::coerce_row(R"(["x", "a"])", schema).is_error());
    CHECK(SchemaProvisioner::coerce_row(R"("scalar")", schema).is_error());
    CHECK(SchemaProvisioner::coerce_row(R"([1, )", schema).is_error());
}

// ============================================================================
// DDL
// ============================================================================

TEST_CASE("SchemaProvisioner: generated DDL", "[provisioner]") {
    const auto schema = SchemaProvisioner::parse_table_schema("customers",
        R"([{"name":"id","type":"INTEGER"},{"name":"joined","type":"DATE"}])").value();

    CHECK(SchemaProvisioner::create_table_sql(schema, "customers_3") ==
          R"(CREATE TABLE "customers_3" ("id" INTEGER, "joined" DATE CHECK ("joined" IS NULL OR date("joined") IS "joined")))");
    CHECK(SchemaProvisioner::insert_sql(schema, "customers_3") ==
          R"(INSERT INTO "customers_3" ("id", "joined") VALUES (?, ?))");
}

// ============================================================================
// Provisioning against the engine
// ============================================================================

TEST_CASE("SchemaProvisioner: provisions every catalog table", "[provisioner]") {
    SchemaProvisioner provisioner(testing::make_sample_catalog());
    auto conn = open_memory_db();

    const auto result = provisioner.provision(3, *conn, {});
    REQUIRE(result.is_ok());

    const auto& out = result.value();
    REQUIRE(out.tables.size() == 2);
    CHECK(out.tables[0].name == "customers");
    CHECK(out.tables[1].name == "orders");
    CHECK(out.ns.physical_names() == std::vector<std::string>{"customers_3", "orders_3"});

    CHECK(out.report.problem_id == 3);
    REQUIRE(out.report.tables.size() == 2);
    CHECK(out.report.tables[0].rows_loaded == 3);
    CHECK(out.report.tables[1].rows_loaded == 4);
    CHECK(out.report.total_skipped() == 0);

    CHECK(engine_tables(*conn) == std::vector<std::string>{"customers_3", "orders_3"});

    const auto rows = conn->execute("SELECT name FROM customers_3 ORDER BY customer_id", 0);
    REQUIRE(rows.success);
    REQUIRE(rows.rows.size() == 3);
    CHECK(rows.rows[0][0].text == "Alice");
}

TEST_CASE("SchemaProvisioner: connection is read-only afterwards", "[provisioner]") {
    SchemaProvisioner provisioner(testing::make_sample_catalog());
    auto conn = open_memory_db();
    REQUIRE(provisioner.provision(3, *conn, {}).is_ok());

    const auto result = conn->execute_command("DROP TABLE customers_3");
    CHECK_FALSE(result.success);
    CHECK(result.error_kind == ErrorKind::MUTATION_ATTEMPT);
}

TEST_CASE("SchemaProvisioner: rows that do not fit are skipped and counted", "[provisioner]") {
    auto catalog = std::make_shared<MemoryCatalog>();
    catalog->add_table(5, "events",
        R"([{"name":"id","type":"INTEGER"},{"name":"happened","type":"DATE"}])",
        {
            R"([1, "2024-01-01"])",
            R"(["not a number", "2024-01-02"])",
            R"([3, "2024-02-31"])",
            R"([4])",
            R"({broken json)",
            R"([6, null])",
        });

    SchemaProvisioner provisioner(catalog);
    auto conn = open_memory_db();
    const auto result = provisioner.provision(5, *conn, {});
    REQUIRE(result.is_ok());

    const auto& stats = result.value().report.tables.at(0);
    CHECK(stats.rows_loaded == 2);
    CHECK(stats.rows_skipped == 4);
}

TEST_CASE("SchemaProvisioner: unknown problem is a provision error", "[provisioner]") {
    SchemaProvisioner provisioner(testing::make_sample_catalog());
    auto conn = open_memory_db();

    const auto result = provisioner.provision(99, *conn, {});
    CHECK(result.is_error());
    CHECK(result.error_kind() == ErrorKind::PROVISION_ERROR);
    CHECK(result.error_message() == "No tables found for problem 99");
}

TEST_CASE("SchemaProvisioner: malformed schema leaves the engine untouched", "[provisioner]") {
    auto catalog = std::make_shared<MemoryCatalog>();
    catalog->add_table(6, "good", R"([{"name":"id","type":"INTEGER"}])", {"[1]"});
    catalog->add_table(6, "bad", R"([{"name":"id","type":"BLOBBY"}])", {"[1]"});

    SchemaProvisioner provisioner(catalog);
    auto conn = open_memory_db();

    const auto result = provisioner.provision(6, *conn, {});
    CHECK(result.is_error());
    CHECK(engine_tables(*conn).empty());
}

TEST_CASE("SchemaProvisioner: re-provisioning drops stale tables", "[provisioner]") {
    SchemaProvisioner provisioner(testing::make_sample_catalog());
    auto conn = open_memory_db();

    const auto first = provisioner.provision(3, *conn, {});
    REQUIRE(first.is_ok());

    const auto second = provisioner.provision(7, *conn, first.value().ns.physical_names());
    REQUIRE(second.is_ok());
    CHECK(engine_tables(*conn) == std::vector<std::string>{"customers_7", "employees_7"});
}

TEST_CASE("SchemaProvisioner: provisioning twice is idempotent", "[provisioner]") {
    SchemaProvisioner provisioner(testing::make_sample_catalog());
    auto conn = open_memory_db();

    const auto first = provisioner.provision(3, *conn, {});
    REQUIRE(first.is_ok());
    const auto second = provisioner.provision(3, *conn, first.value().ns.physical_names());
    REQUIRE(second.is_ok());

    CHECK(first.value().tables == second.value().tables);
    CHECK(first.value().report.total_loaded() == second.value().report.total_loaded());

    const auto count = conn->execute("SELECT count(*) FROM orders_3", 0);
    REQUIRE(count.success);
    CHECK(count.rows[0][0] == Value::integer(4));
}
