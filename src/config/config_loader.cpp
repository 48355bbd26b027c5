#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <cstdint>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace sqlsandbox {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

} // anonymous namespace

// ============================================================================
// Section Extraction
// ============================================================================

ExecutorConfig ConfigLoader::extract_executor(const toml::table& root) {
    ExecutorConfig cfg;
    const auto* executor = root["executor"].as_table();
    if (!executor) return cfg;
    const auto& e = *executor;

    cfg.row_cap = e["row_cap"].value_or(cfg.row_cap);
    cfg.timeout_ms = e["timeout_ms"].value_or(cfg.timeout_ms);
    return cfg;
}

SessionsConfig ConfigLoader::extract_sessions(const toml::table& root) {
    SessionsConfig cfg;
    const auto* sessions = root["sessions"].as_table();
    if (!sessions) return cfg;
    const auto& s = *sessions;

    cfg.busy_wait_ms = s["busy_wait_ms"].value_or(cfg.busy_wait_ms);
    cfg.max_sessions = s["max_sessions"].value_or(cfg.max_sessions);
    return cfg;
}

CatalogConfig ConfigLoader::extract_catalog(const toml::table& root) {
    CatalogConfig cfg;
    const auto* catalog = root["catalog"].as_table();
    if (!catalog) return cfg;

    cfg.path = (*catalog)["path"].value_or(""s);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

HistoryConfig ConfigLoader::extract_history(const toml::table& root) {
    HistoryConfig cfg;
    const auto* history = root["history"].as_table();
    if (!history) return cfg;
    const auto& h = *history;

    cfg.enabled = h["enabled"].value_or(cfg.enabled);
    cfg.max_events_per_session = h["max_events_per_session"].value_or(cfg.max_events_per_session);
    return cfg;
}

// ---- Shared extraction + validation ----------------------------------------

SandboxConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    SandboxConfig config;
    config.executor = extract_executor(root);
    config.sessions = extract_sessions(root);
    config.catalog = extract_catalog(root);
    config.logging = extract_logging(root);
    config.history = extract_history(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(SandboxConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const SandboxConfig& config) {
    std::vector<std::string> errors;

    if (config.executor.row_cap <= 0 || config.executor.row_cap > UINT32_MAX) {
        errors.push_back(std::format("executor.row_cap must be > 0, got {}", config.executor.row_cap));
    }
    if (config.executor.timeout_ms <= 0 || config.executor.timeout_ms > UINT32_MAX) {
        errors.push_back(std::format("executor.timeout_ms must be > 0, got {}", config.executor.timeout_ms));
    }

    if (config.sessions.busy_wait_ms < 0) {
        errors.push_back(std::format("sessions.busy_wait_ms must be >= 0, got {}",
                                     config.sessions.busy_wait_ms));
    }
    if (config.sessions.max_sessions < 0) {
        errors.push_back(std::format("sessions.max_sessions must be >= 0, got {}",
                                     config.sessions.max_sessions));
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be info, warn or error, got '{}'",
                                     config.logging.level));
    }

    if (config.history.enabled && config.history.max_events_per_session <= 0) {
        errors.push_back("history.max_events_per_session must be > 0 when history is enabled");
    }

    return errors;
}

} // namespace sqlsandbox
