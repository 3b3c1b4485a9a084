#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <cmath>
#include <cstdlib>
#include <format>
#include <stdexcept>
#include <unordered_set>

namespace kvconn {

namespace {

constexpr std::string_view kUriKey = "uri";
constexpr std::string_view kNameKey = "name";
constexpr std::string_view kNodesKey = "nodes";

// Raised while extracting; turned into LoadResult::error at the top level.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ---- Env expansion ---------------------------------------------------------

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

// ---- Extraction helpers ----------------------------------------------------

// Scalar node rendered the way ConnectionParameters::set() expects it
std::string scalar_to_string(const toml::node& node, const std::string& where) {
    if (const auto* s = node.as_string()) return s->get();
    if (const auto* i = node.as_integer()) return std::to_string(i->get());
    if (const auto* f = node.as_floating_point()) return std::format("{}", f->get());
    if (const auto* b = node.as_boolean()) return utils::booltostr(b->get());
    throw ConfigError(std::format("{}: expected a string, number or boolean", where));
}

std::optional<double> optional_positive_double(const toml::table& tbl, std::string_view key,
                                               const std::string& where) {
    const auto* node = tbl.get(key);
    if (!node) return std::nullopt;

    std::optional<double> value;
    if (const auto* f = node->as_floating_point()) value = f->get();
    if (const auto* i = node->as_integer()) value = static_cast<double>(i->get());
    if (!value) {
        throw ConfigError(std::format("{}.{}: expected a number", where, key));
    }
    if (!std::isfinite(*value)) {
        throw ConfigError(std::format("{}.{}: must be a finite number", where, key));
    }
    if (*value < 0.0) {
        throw ConfigError(std::format("{}.{}: must not be negative", where, key));
    }
    if (*value > params::MAX_TIMEOUT) {
        throw ConfigError(std::format("{}.{}: must not exceed {} seconds", where, key, params::MAX_TIMEOUT));
    }
    return value;
}

void apply_defaults(ConnectionParameters& parameters, const toml::table& tbl, const DefaultsConfig& defaults) {
    if (defaults.timeout && !tbl.contains(params::TIMEOUT) && parameters.timeout == params::DEFAULT_TIMEOUT) {
        parameters.timeout = *defaults.timeout;
    }
    if (defaults.read_write_timeout && !parameters.read_write_timeout && *defaults.read_write_timeout > 0.0) {
        parameters.read_write_timeout = *defaults.read_write_timeout;
    }
}

// uri first, then every other key (except skip_key) on top of it
ConnectionParameters extract_parameters(const toml::table& tbl, const std::string& where,
                                        std::string_view skip_key, const DefaultsConfig& defaults) {
    ConnectionParameters parameters;
    try {
        if (const auto* uri = tbl.get(kUriKey)) {
            const auto* s = uri->as_string();
            if (!s) {
                throw ConfigError(std::format("{}.uri: expected a string", where));
            }
            parameters = ConnectionParameters::parse(s->get());
        }

        // Scheme before the other keys, mirroring ConnectionParameters::from_map
        if (const auto* scheme = tbl.get(params::SCHEME)) {
            parameters.set(params::SCHEME, scalar_to_string(*scheme, where + ".scheme"));
        }
        for (auto&& [key, node] : tbl) {
            const std::string_view name = key.str();
            if (name == kUriKey || name == skip_key || name == params::SCHEME) continue;
            parameters.set(name, scalar_to_string(node, std::format("{}.{}", where, name)));
        }
    } catch (const ParameterError& e) {
        throw ConfigError(std::format("{}: {}", where, e.what()));
    }

    apply_defaults(parameters, tbl, defaults);
    return parameters;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig config;
    const auto* logging = root["logging"].as_table();
    if (!logging) return config;

    if (const auto level = (*logging)["level"].value<std::string>()) {
        if (!utils::log::parse_level(*level)) {
            throw ConfigError(std::format(
                "logging.level: unknown level '{}' (expected debug, info, warn or error)", *level));
        }
        config.level = *level;
    }
    return config;
}

DefaultsConfig extract_defaults(const toml::table& root) {
    DefaultsConfig config;
    const auto* defaults = root["defaults"].as_table();
    if (!defaults) return config;

    config.timeout = optional_positive_double(*defaults, params::TIMEOUT, "defaults");
    if (config.timeout && *config.timeout == 0.0) {
        throw ConfigError("defaults.timeout: must be greater than zero");
    }
    config.read_write_timeout = optional_positive_double(*defaults, params::READ_WRITE_TIMEOUT, "defaults");
    return config;
}

std::string extract_name(const toml::table& tbl, const std::string& where,
                         std::unordered_set<std::string>& seen) {
    const auto name = tbl[kNameKey].value<std::string>();
    if (!name || name->empty()) {
        throw ConfigError(std::format("{}.name: missing or empty", where));
    }
    if (!seen.insert(*name).second) {
        throw ConfigError(std::format("{}.name: duplicate name '{}'", where, *name));
    }
    return *name;
}

std::vector<ConnectionConfig> extract_connections(const toml::table& root, const DefaultsConfig& defaults,
                                                  std::unordered_set<std::string>& seen) {
    std::vector<ConnectionConfig> result;
    const auto* arr = root["connections"].as_array();
    if (!arr) return result;

    result.reserve(arr->size());
    for (size_t i = 0; i < arr->size(); ++i) {
        const std::string where = std::format("connections[{}]", i);
        const auto* tbl = (*arr)[i].as_table();
        if (!tbl) {
            throw ConfigError(std::format("{}: expected a table", where));
        }
        ConnectionConfig conn;
        conn.name = extract_name(*tbl, where, seen);
        conn.parameters = extract_parameters(*tbl, where, kNameKey, defaults);
        result.push_back(std::move(conn));
    }
    return result;
}

std::vector<GroupConfig> extract_groups(const toml::table& root, const DefaultsConfig& defaults,
                                        std::unordered_set<std::string>& seen) {
    std::vector<GroupConfig> result;
    const auto* arr = root["groups"].as_array();
    if (!arr) return result;

    result.reserve(arr->size());
    for (size_t i = 0; i < arr->size(); ++i) {
        const std::string where = std::format("groups[{}]", i);
        const auto* tbl = (*arr)[i].as_table();
        if (!tbl) {
            throw ConfigError(std::format("{}: expected a table", where));
        }

        GroupConfig group;
        group.name = extract_name(*tbl, where, seen);

        const auto* nodes = (*tbl)[kNodesKey].as_array();
        if (!nodes || nodes->empty()) {
            throw ConfigError(std::format("{}.nodes: at least one node is required", where));
        }

        for (size_t n = 0; n < nodes->size(); ++n) {
            const std::string node_where = std::format("{}.nodes[{}]", where, n);
            const auto& node = (*nodes)[n];
            if (const auto* uri = node.as_string()) {
                try {
                    auto parameters = ConnectionParameters::parse(uri->get());
                    apply_defaults(parameters, toml::table{}, defaults);
                    group.nodes.push_back(std::move(parameters));
                } catch (const ParameterError& e) {
                    throw ConfigError(std::format("{}: {}", node_where, e.what()));
                }
            } else if (const auto* node_tbl = node.as_table()) {
                group.nodes.push_back(extract_parameters(*node_tbl, node_where, {}, defaults));
            } else {
                throw ConfigError(std::format("{}: expected a URI string or a table", node_where));
            }
        }
        result.push_back(std::move(group));
    }
    return result;
}

ClientConfig extract_config(toml::table& root) {
    expand_env_vars_recursive(root);

    ClientConfig config;
    config.logging = extract_logging(root);
    config.defaults = extract_defaults(root);

    std::unordered_set<std::string> seen;
    config.connections = extract_connections(root, config.defaults, seen);
    config.groups = extract_groups(root, config.defaults, seen);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader
// ============================================================================

std::string ConfigLoader::expand_env_vars(const std::string& input) {
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

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto root = toml::parse_file(config_path);
        return LoadResult::ok(extract_config(root));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to parse {}: {}", config_path, e.description()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Invalid config {}: {}", config_path, e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto root = toml::parse(toml_content);
        return LoadResult::ok(extract_config(root));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error: {}", e.description()));
    } catch (const std::exception& e) {
        return LoadResult::error(e.what());
    }
}

} // namespace kvconn
