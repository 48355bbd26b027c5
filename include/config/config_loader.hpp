#pragma once

#include "config/config_types.hpp"

#include <string>
#include <vector>

#include <toml.hpp>

namespace sqlsandbox {

/**
 * @brief TOML config loader
 *
 * String values may reference environment variables as ${VAR_NAME};
 * unset variables expand to the empty string.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        SandboxConfig config;

        static LoadResult ok(SandboxConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load configuration from TOML file
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load configuration from TOML string
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Every validation problem, empty if the config is usable
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const SandboxConfig& config);

private:
    static ExecutorConfig extract_executor(const toml::table& root);
    static SessionsConfig extract_sessions(const toml::table& root);
    static CatalogConfig extract_catalog(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static HistoryConfig extract_history(const toml::table& root);

    static SandboxConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(SandboxConfig config);
};

} // namespace sqlsandbox
