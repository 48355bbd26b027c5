#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace sqlsandbox;

TEST_CASE("ConfigLoader: empty document yields defaults", "[config]") {
    const auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.executor.row_cap == 5000);
    CHECK(cfg.executor.timeout_ms == 30000);
    CHECK(cfg.sessions.busy_wait_ms == 0);
    CHECK(cfg.sessions.max_sessions == 0);
    CHECK(cfg.catalog.path.empty());
    CHECK(cfg.logging.level == "info");
    CHECK(cfg.history.enabled);
    CHECK(cfg.history.max_events_per_session == 1000);
}

TEST_CASE("ConfigLoader: every section is read", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[executor]
row_cap = 200
timeout_ms = 1500

[sessions]
busy_wait_ms = 250
max_sessions = 64

[catalog]
path = "/var/lib/sandbox/catalog.db"

[logging]
level = "warn"

[history]
enabled = false
max_events_per_session = 10
)");
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.executor.row_cap == 200);
    CHECK(cfg.executor.timeout_ms == 1500);
    CHECK(cfg.sessions.busy_wait_ms == 250);
    CHECK(cfg.sessions.max_sessions == 64);
    CHECK(cfg.catalog.path == "/var/lib/sandbox/catalog.db");
    CHECK(cfg.logging.level == "warn");
    CHECK_FALSE(cfg.history.enabled);
    CHECK(cfg.history.max_events_per_session == 10);
}

TEST_CASE("ConfigLoader: validation reports every problem at once", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[executor]
row_cap = 0
timeout_ms = -5

[logging]
level = "verbose"
)");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.starts_with("Config validation failed:"));
    CHECK(result.error_message.find("executor.row_cap must be > 0, got 0") != std::string::npos);
    CHECK(result.error_message.find("executor.timeout_ms must be > 0, got -5") != std::string::npos);
    CHECK(result.error_message.find("logging.level must be info, warn or error, got 'verbose'")
          != std::string::npos);
}

TEST_CASE("ConfigLoader: validate_config", "[config]") {
    SandboxConfig cfg;
    CHECK(ConfigLoader::validate_config(cfg).empty());

    SECTION("negative session limits") {
        cfg.sessions.busy_wait_ms = -1;
        cfg.sessions.max_sessions = -1;
        CHECK(ConfigLoader::validate_config(cfg).size() == 2);
    }
    SECTION("history bound only matters when enabled") {
        cfg.history.max_events_per_session = 0;
        CHECK(ConfigLoader::validate_config(cfg).size() == 1);
        cfg.history.enabled = false;
        CHECK(ConfigLoader::validate_config(cfg).empty());
    }
    SECTION("row cap above 32 bits") {
        cfg.executor.row_cap = 5'000'000'000;
        CHECK(ConfigLoader::validate_config(cfg).size() == 1);
    }
}

TEST_CASE("ConfigLoader: environment variables are expanded", "[config]") {
    ::setenv("SQLSANDBOX_TEST_CATALOG", "/tmp/from-env.db", 1);
    ::unsetenv("SQLSANDBOX_TEST_UNSET");

    const auto result = ConfigLoader::load_from_string(R"(
[catalog]
path = "${SQLSANDBOX_TEST_CATALOG}"

[logging]
level = "err${SQLSANDBOX_TEST_UNSET}or"
)");
    REQUIRE(result.success);
    CHECK(result.config.catalog.path == "/tmp/from-env.db");
    CHECK(result.config.logging.level == "error");
}

TEST_CASE("ConfigLoader: unclosed substitution fails", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[catalog]
path = "${NOT_CLOSED"
)");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to parse config:"));
}

TEST_CASE("ConfigLoader: malformed TOML fails", "[config]") {
    const auto result = ConfigLoader::load_from_string("[executor\nrow_cap = ");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to parse config:"));
}

TEST_CASE("ConfigLoader: load from file", "[config]") {
    const auto path = std::filesystem::temp_directory_path() / "sqlsandbox_test_config.toml";
    {
        std::ofstream out(path);
        out << "[executor]\nrow_cap = 42\n";
    }

    const auto result = ConfigLoader::load_from_file(path.string());
    std::filesystem::remove(path);
    REQUIRE(result.success);
    CHECK(result.config.executor.row_cap == 42);

    const auto missing = ConfigLoader::load_from_file("/nonexistent/sqlsandbox.toml");
    REQUIRE_FALSE(missing.success);
    CHECK(missing.error_message.starts_with("Failed to load config:"));
}
