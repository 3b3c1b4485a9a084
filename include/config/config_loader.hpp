#pragma once

#include "connection/parameters.hpp"

#include <optional>
#include <string>
#include <vector>

namespace kvconn {

// ============================================================================
// Config types (mirror the TOML layout)
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// Applied to connections that do not set the value themselves
struct DefaultsConfig {
    std::optional<double> timeout;
    std::optional<double> read_write_timeout;
};

struct ConnectionConfig {
    std::string name;
    ConnectionParameters parameters;
};

struct GroupConfig {
    std::string name;
    std::vector<ConnectionParameters> nodes;
};

struct ClientConfig {
    LoggingConfig logging;
    DefaultsConfig defaults;
    std::vector<ConnectionConfig> connections;
    std::vector<GroupConfig> groups;
};

// ============================================================================
// ConfigLoader - Extract typed config from TOML
// ============================================================================

/**
 * @brief Loads connection definitions from TOML
 *
 *   [logging]
 *   level = "info"
 *
 *   [defaults]
 *   timeout = 2.5
 *
 *   [[connections]]
 *   name = "cache"
 *   uri = "tcp://127.0.0.1:6379/2"
 *   password = "${CACHE_PASSWORD}"
 *
 *   [[groups]]
 *   name = "sessions"
 *   nodes = ["tcp://10.0.0.1:6379", { host = "10.0.0.2", port = 6380 }]
 *
 * A connection (or group node given as a table) takes its parameters from
 * `uri`, then from the remaining keys, which override the URI. String values
 * have ${VAR} expanded from the environment before use.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        ClientConfig config;

        static LoadResult ok(ClientConfig cfg) {
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
     * @brief Load config from a TOML file
     * @param config_path Path to the .toml file
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from a TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Expand ${VAR_NAME} patterns with environment variables
     *
     * Unset variables expand to an empty string.
     * @throws std::runtime_error on an unclosed ${
     */
    [[nodiscard]] static std::string expand_env_vars(const std::string& input);
};

} // namespace kvconn
