#include "connection/parameters.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <format>
#include <limits>

namespace kvconn {

namespace {

constexpr std::string_view kUnixPrefix = "unix:";
constexpr std::string_view kSchemeSeparator = "://";

bool starts_with_ci(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && utils::to_lower(s.substr(0, prefix.size())) == prefix;
}

std::string decode_or_throw(std::string_view raw, std::string_view what, bool plus_as_space = true) {
    auto decoded = utils::url_decode(raw, plus_as_space);
    if (!decoded) {
        throw ParameterError(std::format("Invalid percent-encoding in {}: '{}'", what, raw));
    }
    return std::move(*decoded);
}

void apply_query(ConnectionParameters& result, std::string_view query) {
    size_t start = 0;
    while (start <= query.size()) {
        const size_t amp = query.find('&', start);
        const auto pair = query.substr(start, amp == std::string_view::npos ? std::string_view::npos : amp - start);
        if (!pair.empty()) {
            const size_t eq = pair.find('=');
            const auto raw_key = pair.substr(0, eq);
            const auto raw_value = eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1);
            if (raw_key.empty()) {
                throw ParameterError(std::format("Empty key in query string: '{}'", pair));
            }
            result.set(decode_or_throw(raw_key, "query key"), decode_or_throw(raw_value, "query value"));
        }
        if (amp == std::string_view::npos) break;
        start = amp + 1;
    }
}

// Splits "host[:port]" (with optional [ipv6] brackets) into the parameters.
void apply_authority(ConnectionParameters& result, std::string_view authority) {
    const size_t at = authority.rfind('@');
    if (at != std::string_view::npos) {
        const auto userinfo = authority.substr(0, at);
        const size_t colon = userinfo.find(':');
        if (colon == std::string_view::npos) {
            result.set(params::PASSWORD, decode_or_throw(userinfo, "password", false));
        } else {
            const auto user = userinfo.substr(0, colon);
            if (!user.empty()) {
                result.extras["username"] = decode_or_throw(user, "username", false);
            }
            result.set(params::PASSWORD, decode_or_throw(userinfo.substr(colon + 1), "password", false));
        }
        authority = authority.substr(at + 1);
    }

    std::string_view host = authority;
    std::string_view port;
    if (!authority.empty() && authority.front() == '[') {
        const size_t close = authority.find(']');
        if (close == std::string_view::npos) {
            throw ParameterError(std::format("Unclosed IPv6 bracket in '{}'", authority));
        }
        host = authority.substr(1, close - 1);
        const auto rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                throw ParameterError(std::format("Unexpected characters after IPv6 host: '{}'", rest));
            }
            port = rest.substr(1);
        }
    } else if (const size_t colon = authority.rfind(':'); colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
    }

    if (!host.empty()) {
        result.set(params::HOST, host);
    }
    if (!port.empty()) {
        result.set(params::PORT, port);
    }
}

// Seconds value for timeout/read_write_timeout; nullopt if not a finite number within range
std::optional<double> parse_seconds(std::string_view value) {
    const auto parsed = utils::try_parse_double(value);
    if (!parsed || !std::isfinite(*parsed) || *parsed > params::MAX_TIMEOUT) {
        return std::nullopt;
    }
    return parsed;
}

std::string format_double(double value) {
    return std::format("{}", value);
}

} // anonymous namespace

// ============================================================================
// Normalization
// ============================================================================

ConnectionParameters ConnectionParameters::parse(std::string_view uri) {
    const std::string trimmed = utils::trim(std::string(uri));
    if (trimmed.empty()) {
        throw ParameterError("Connection URI is empty");
    }
    std::string_view rest = trimmed;

    ConnectionParameters result;

    std::string_view query;
    if (const size_t q = rest.find('?'); q != std::string_view::npos) {
        query = rest.substr(q + 1);
        rest = rest.substr(0, q);
    }

    if (starts_with_ci(rest, kUnixPrefix)) {
        result.scheme = "unix";
        auto socket_path = rest.substr(kUnixPrefix.size());
        if (socket_path.starts_with("//")) {
            socket_path.remove_prefix(2);
        }
        if (socket_path.empty()) {
            throw ParameterError(std::format("Missing socket path in '{}'", trimmed));
        }
        result.path = decode_or_throw(socket_path, "path", false);
    } else {
        const size_t sep = rest.find(kSchemeSeparator);
        if (sep == std::string_view::npos || sep == 0) {
            throw ParameterError(std::format("Missing scheme in connection URI '{}'", trimmed));
        }
        result.set(params::SCHEME, rest.substr(0, sep));
        rest = rest.substr(sep + kSchemeSeparator.size());

        std::string_view authority = rest;
        std::string_view db_part;
        if (const size_t slash = rest.find('/'); slash != std::string_view::npos) {
            authority = rest.substr(0, slash);
            db_part = rest.substr(slash + 1);
        }
        apply_authority(result, authority);
        if (!db_part.empty()) {
            result.set(params::DATABASE, db_part);
        }
    }

    apply_query(result, query);
    return result;
}

Result<ConnectionParameters> ConnectionParameters::try_parse(std::string_view uri) {
    try {
        return Result<ConnectionParameters>::ok(parse(uri));
    } catch (const ParameterError& e) {
        return Result<ConnectionParameters>::error(e.category(), e.what());
    }
}

ConnectionParameters ConnectionParameters::from_map(const ParameterMap& values) {
    ConnectionParameters result;

    // Scheme first so scheme-dependent keys see the final value
    if (const auto it = values.find(std::string(params::SCHEME)); it != values.end()) {
        result.set(params::SCHEME, it->second);
    }
    for (const auto& [key, value] : values) {
        if (key == params::SCHEME) continue;
        result.set(key, value);
    }
    return result;
}

void ConnectionParameters::set(std::string_view key, std::string_view value) {
    if (key.empty()) {
        throw ParameterError("Parameter name is empty");
    }
    const std::string name = utils::to_lower(key);

    if (name == params::SCHEME) {
        if (value.empty()) {
            throw ParameterError("Parameter 'scheme' is empty");
        }
        scheme = utils::to_lower(value);
    } else if (name == params::HOST) {
        if (value.empty()) {
            throw ParameterError("Parameter 'host' is empty");
        }
        host = std::string(value);
    } else if (name == params::PORT) {
        const auto parsed = utils::try_parse_int<uint32_t>(value);
        if (!parsed || *parsed == 0 || *parsed > std::numeric_limits<uint16_t>::max()) {
            throw ParameterError(std::format("Invalid port '{}': expected 1-65535", value));
        }
        port = static_cast<uint16_t>(*parsed);
    } else if (name == params::PATH) {
        path = std::string(value);
    } else if (name == params::PASSWORD) {
        password = value.empty() ? std::nullopt : std::optional<std::string>(value);
    } else if (name == params::DATABASE) {
        if (value.empty()) {
            database.reset();
            return;
        }
        const auto parsed = utils::try_parse_int<int64_t>(value);
        if (!parsed || *parsed < 0) {
            throw ParameterError(std::format("Invalid database index '{}'", value));
        }
        database = *parsed;
    } else if (name == params::TIMEOUT) {
        const auto parsed = parse_seconds(value);
        if (!parsed || *parsed <= 0.0) {
            throw ParameterError(std::format(
                "Invalid timeout '{}': expected a positive number of seconds up to {}", value, params::MAX_TIMEOUT));
        }
        timeout = *parsed;
    } else if (name == params::READ_WRITE_TIMEOUT) {
        const auto parsed = parse_seconds(value);
        if (!parsed) {
            throw ParameterError(std::format(
                "Invalid read_write_timeout '{}': expected a number of seconds up to {}", value, params::MAX_TIMEOUT));
        }
        read_write_timeout = *parsed > 0.0 ? std::optional<double>(*parsed) : std::nullopt;
    } else if (name == params::ALIAS) {
        alias = value.empty() ? std::nullopt : std::optional<std::string>(value);
    } else {
        extras[std::string(key)] = std::string(value);
    }
}

std::optional<std::string> ConnectionParameters::get(std::string_view key) const {
    const std::string name = utils::to_lower(key);

    if (name == params::SCHEME) return scheme;
    if (name == params::HOST) return host;
    if (name == params::PORT) return std::to_string(port);
    if (name == params::PATH) return path.empty() ? std::nullopt : std::optional<std::string>(path);
    if (name == params::PASSWORD) return password;
    if (name == params::DATABASE) {
        return database ? std::optional<std::string>(std::to_string(*database)) : std::nullopt;
    }
    if (name == params::TIMEOUT) return format_double(timeout);
    if (name == params::READ_WRITE_TIMEOUT) {
        return read_write_timeout ? std::optional<std::string>(format_double(*read_write_timeout))
                                  : std::nullopt;
    }
    if (name == params::ALIAS) return alias;

    if (const auto it = extras.find(std::string(key)); it != extras.end()) {
        return it->second;
    }
    return std::nullopt;
}

// ============================================================================
// Formatting
// ============================================================================

std::string ConnectionParameters::address() const {
    if (is_unix_socket()) {
        return path;
    }
    if (host.find(':') != std::string::npos) {
        return std::format("[{}]:{}", host, port);
    }
    return std::format("{}:{}", host, port);
}

std::string ConnectionParameters::to_string() const {
    return format_uri(false);
}

std::string ConnectionParameters::redacted() const {
    return format_uri(true);
}

std::string ConnectionParameters::format_uri(bool mask_password) const {
    std::string uri;
    if (is_unix_socket()) {
        uri = std::format("unix:{}", path);
    } else {
        uri = std::format("{}://{}", scheme, address());
        if (database) {
            uri += std::format("/{}", *database);
        }
    }

    std::string query;
    const auto append = [&query](std::string_view key, std::string_view value) {
        query += query.empty() ? '?' : '&';
        query += utils::url_encode(key);
        query += '=';
        query += utils::url_encode(value);
    };

    if (is_unix_socket() && database) {
        append(params::DATABASE, std::to_string(*database));
    }
    if (password) {
        append(params::PASSWORD, mask_password ? "***" : *password);
    }
    if (timeout != params::DEFAULT_TIMEOUT) {
        append(params::TIMEOUT, format_double(timeout));
    }
    if (read_write_timeout) {
        append(params::READ_WRITE_TIMEOUT, format_double(*read_write_timeout));
    }
    if (alias) {
        append(params::ALIAS, *alias);
    }
    for (const auto& [key, value] : extras) {
        append(key, value);
    }

    return uri + query;
}

} // namespace kvconn
