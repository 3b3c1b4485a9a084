#pragma once

#include "core/error.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace kvconn {

namespace params {
    inline constexpr std::string_view SCHEME = "scheme";
    inline constexpr std::string_view HOST = "host";
    inline constexpr std::string_view PORT = "port";
    inline constexpr std::string_view PATH = "path";
    inline constexpr std::string_view PASSWORD = "password";
    inline constexpr std::string_view DATABASE = "database";
    inline constexpr std::string_view TIMEOUT = "timeout";
    inline constexpr std::string_view READ_WRITE_TIMEOUT = "read_write_timeout";
    inline constexpr std::string_view ALIAS = "alias";

    inline constexpr std::string_view DEFAULT_SCHEME = "tcp";
    inline constexpr std::string_view DEFAULT_HOST = "127.0.0.1";
    inline constexpr uint16_t DEFAULT_PORT = 6379;
    inline constexpr double DEFAULT_TIMEOUT = 5.0;

    // Upper bound for timeout and read_write_timeout (one day); keeps the
    // value representable as int milliseconds for poll()
    inline constexpr double MAX_TIMEOUT = 86400.0;
}

/// Key/value form of connection parameters ("array" form), ordered for stable output.
using ParameterMap = std::map<std::string, std::string>;

/**
 * @brief Normalized description of a single endpoint
 *
 * Accepted URI shapes:
 *   tcp://[[user]:password@]host[:port][/database][?key=value&...]
 *   http://host:7379
 *   unix:/path/to/redis.sock[?key=value&...]   (also unix:///path)
 *
 * Query-string keys override values taken from the URI body. Keys that are
 * not typed fields below are kept verbatim in `extras` and forwarded to the
 * connection untouched.
 */
struct ConnectionParameters {
    std::string scheme{params::DEFAULT_SCHEME};
    std::string host{params::DEFAULT_HOST};
    uint16_t port = params::DEFAULT_PORT;
    std::string path;                           // unix socket path

    std::optional<std::string> password;        // credential
    std::optional<int64_t> database;            // target database index

    double timeout = params::DEFAULT_TIMEOUT;   // connect timeout, seconds
    std::optional<double> read_write_timeout;   // seconds, unset = blocking
    std::optional<std::string> alias;

    ParameterMap extras;

    /**
     * @brief Normalize a URI into parameters
     * @throws ParameterError on malformed input
     */
    [[nodiscard]] static ConnectionParameters parse(std::string_view uri);

    /**
     * @brief Non-throwing variant of parse()
     */
    [[nodiscard]] static Result<ConnectionParameters> try_parse(std::string_view uri);

    /**
     * @brief Normalize a key/value map into parameters
     * @throws ParameterError on invalid values
     */
    [[nodiscard]] static ConnectionParameters from_map(const ParameterMap& values);

    /**
     * @brief Assign one parameter by name, validating typed fields
     *
     * An empty password or database clears the field.
     * @throws ParameterError on invalid values
     */
    void set(std::string_view key, std::string_view value);

    /** @brief Look up any parameter (typed or extra) as a string */
    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    [[nodiscard]] bool has(std::string_view key) const { return get(key).has_value(); }

    [[nodiscard]] bool is_unix_socket() const { return scheme == "unix"; }

    /** @brief "host:port" for network schemes, the socket path for unix */
    [[nodiscard]] std::string address() const;

    /** @brief URI that parse() maps back to an equal object */
    [[nodiscard]] std::string to_string() const;

    /** @brief Same as to_string() with the password masked, for logs */
    [[nodiscard]] std::string redacted() const;

    bool operator==(const ConnectionParameters&) const = default;

private:
    [[nodiscard]] std::string format_uri(bool mask_password) const;
};

} // namespace kvconn
