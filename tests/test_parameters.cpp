#include <catch2/catch_test_macros.hpp>
#include "connection/parameters.hpp"
#include "core/error.hpp"

using namespace kvconn;

TEST_CASE("ConnectionParameters: defaults", "[parameters]") {
    ConnectionParameters params;
    CHECK(params.scheme == "tcp");
    CHECK(params.host == "127.0.0.1");
    CHECK(params.port == 6379);
    CHECK(params.timeout == 5.0);
    CHECK_FALSE(params.password.has_value());
    CHECK_FALSE(params.database.has_value());
    CHECK(params.address() == "127.0.0.1:6379");
}

TEST_CASE("ConnectionParameters: parse tcp URI with query options", "[parameters]") {
    auto params = ConnectionParameters::parse("tcp://10.0.0.5:6380?password=secret&database=3&timeout=0.5");
    CHECK(params.scheme == "tcp");
    CHECK(params.host == "10.0.0.5");
    CHECK(params.port == 6380);
    REQUIRE(params.password.has_value());
    CHECK(*params.password == "secret");
    REQUIRE(params.database.has_value());
    CHECK(*params.database == 3);
    CHECK(params.timeout == 0.5);
    CHECK(params.extras.empty());
}

TEST_CASE("ConnectionParameters: database in path and password in userinfo", "[parameters]") {
    auto params = ConnectionParameters::parse("tcp://:s3cr%40t@cache.local/7");
    CHECK(params.host == "cache.local");
    CHECK(params.port == 6379);
    CHECK(params.password == std::optional<std::string>("s3cr@t"));
    CHECK(params.database == std::optional<int64_t>(7));
    CHECK_FALSE(params.extras.contains("username"));
}

TEST_CASE("ConnectionParameters: query string overrides URI body", "[parameters]") {
    auto params = ConnectionParameters::parse("tcp://host:1/2?database=5&port=7000");
    CHECK(params.port == 7000);
    CHECK(params.database == std::optional<int64_t>(5));
}

TEST_CASE("ConnectionParameters: unix socket forms", "[parameters]") {
    auto short_form = ConnectionParameters::parse("unix:/tmp/redis.sock?database=1");
    CHECK(short_form.scheme == "unix");
    CHECK(short_form.path == "/tmp/redis.sock");
    CHECK(short_form.database == std::optional<int64_t>(1));
    CHECK(short_form.address() == "/tmp/redis.sock");

    auto long_form = ConnectionParameters::parse("unix:///var/run/redis.sock");
    CHECK(long_form.path == "/var/run/redis.sock");
}

TEST_CASE("ConnectionParameters: IPv6 host", "[parameters]") {
    auto params = ConnectionParameters::parse("tcp://[::1]:6390");
    CHECK(params.host == "::1");
    CHECK(params.port == 6390);
    CHECK(params.address() == "[::1]:6390");
}

TEST_CASE("ConnectionParameters: unknown keys are kept verbatim", "[parameters]") {
    auto params = ConnectionParameters::parse("http://webdis:7379?user=admin&pass=x&Persistent=1");
    CHECK(params.scheme == "http");
    CHECK(params.extras.at("user") == "admin");
    CHECK(params.extras.at("pass") == "x");
    CHECK(params.extras.at("Persistent") == "1");
    CHECK(params.get("Persistent") == std::optional<std::string>("1"));
    CHECK(params.has("user"));
    CHECK_FALSE(params.has("password"));
}

TEST_CASE("ConnectionParameters: scheme is lower-cased", "[parameters]") {
    auto params = ConnectionParameters::parse("TCP://localhost");
    CHECK(params.scheme == "tcp");
}

TEST_CASE("ConnectionParameters: empty password or database clears the field", "[parameters]") {
    auto params = ConnectionParameters::parse("tcp://localhost?password=&database=");
    CHECK_FALSE(params.password.has_value());
    CHECK_FALSE(params.database.has_value());
}

TEST_CASE("ConnectionParameters: malformed input throws ParameterError", "[parameters]") {
    CHECK_THROWS_AS(ConnectionParameters::parse(""), ParameterError);
    CHECK_THROWS_AS(ConnectionParameters::parse("localhost:6379"), ParameterError);
    CHECK_THROWS_AS(ConnectionParameters::parse("tcp://host:notaport"), ParameterError);
    CHECK_THROWS_AS(ConnectionParameters::parse("tcp://host:70000"), ParameterError);
    CHECK_THROWS_AS(ConnectionParameters::parse("tcp://host:0"), ParameterError);
    CHECK_THROWS_AS(ConnectionParameters::parse("tcp://host/-1"), ParameterError);
    CHECK_THROWS_AS(ConnectionParameters::parse("tcp://host/abc"), ParameterError);
    CHECK_THROWS_AS(ConnectionParameters::parse("tcp://host?timeout=0"), ParameterError);
    CHECK_THROWS_AS(ConnectionParameters::parse("tcp://host?=value"), ParameterError);
    CHECK_THROWS_AS(ConnectionParameters::parse("tcp://host?password=%zz"), ParameterError);
    CHECK_THROWS_AS(ConnectionParameters::parse("tcp://[::1"), ParameterError);
    CHECK_THROWS_AS(ConnectionParameters::parse("unix:"), ParameterError);
}

TEST_CASE("ConnectionParameters: timeouts must be finite and bounded", "[parameters]") {
    CHECK_THROWS_AS(ConnectionParameters::parse("tcp://host?timeout=nan"), ParameterError);
    CHECK_THROWS_AS(ConnectionParameters::parse("tcp://host?timeout=inf"), ParameterError);
    CHECK_THROWS_AS(ConnectionParameters::parse("tcp://host?timeout=1e12"), ParameterError);
    CHECK_THROWS_AS(ConnectionParameters::parse("tcp://host?read_write_timeout=inf"), ParameterError);
    CHECK_THROWS_AS(ConnectionParameters::parse("tcp://host?read_write_timeout=nan"), ParameterError);
    CHECK_THROWS_AS(ConnectionParameters::parse("tcp://host?read_write_timeout=1e12"), ParameterError);

    auto upper = ConnectionParameters::parse("tcp://host?timeout=86400&read_write_timeout=86400");
    CHECK(upper.timeout == params::MAX_TIMEOUT);
    CHECK(upper.read_write_timeout == std::optional<double>(params::MAX_TIMEOUT));

    // Non-positive read_write_timeout still means "blocking"
    auto blocking = ConnectionParameters::parse("tcp://host?read_write_timeout=-1");
    CHECK_FALSE(blocking.read_write_timeout.has_value());
}

TEST_CASE("ConnectionParameters: try_parse reports errors without throwing", "[parameters]") {
    auto bad = ConnectionParameters::try_parse("no-scheme");
    REQUIRE(bad.is_error());
    CHECK(bad.error_category() == ErrorCategory::PARSE_ERROR);
    CHECK(bad.error_message().find("Missing scheme") != std::string::npos);

    auto good = ConnectionParameters::try_parse("tcp://localhost:6380");
    REQUIRE(good.is_ok());
    CHECK(good.value().port == 6380);
}

TEST_CASE("ConnectionParameters: from_map normalizes typed keys", "[parameters]") {
    auto params = ConnectionParameters::from_map({
        {"scheme", "tcp"},
        {"host", "db.internal"},
        {"port", "6390"},
        {"password", "secret"},
        {"database", "4"},
        {"alias", "primary"},
        {"weight", "3"},
    });
    CHECK(params.host == "db.internal");
    CHECK(params.port == 6390);
    CHECK(params.password == std::optional<std::string>("secret"));
    CHECK(params.database == std::optional<int64_t>(4));
    CHECK(params.alias == std::optional<std::string>("primary"));
    CHECK(params.extras.at("weight") == "3");

    CHECK_THROWS_AS(ConnectionParameters::from_map({{"database", "x"}}), ParameterError);
}

TEST_CASE("ConnectionParameters: to_string output parses back to an equal object", "[parameters]") {
    auto original = ConnectionParameters::parse(
        "tcp://10.1.2.3:6400/9?password=p%26w&timeout=1.5&read_write_timeout=2&alias=main&tag=a%20b");
    auto reparsed = ConnectionParameters::parse(original.to_string());
    CHECK(reparsed == original);

    auto unix_params = ConnectionParameters::parse("unix:/tmp/r.sock?database=2&password=x");
    CHECK(ConnectionParameters::parse(unix_params.to_string()) == unix_params);
}

TEST_CASE("ConnectionParameters: redacted masks the password", "[parameters]") {
    auto params = ConnectionParameters::parse("tcp://localhost?password=topsecret");
    CHECK(params.redacted().find("topsecret") == std::string::npos);
    CHECK(params.redacted().find("password=%2A%2A%2A") != std::string::npos);
    CHECK(params.to_string().find("topsecret") != std::string::npos);
}
