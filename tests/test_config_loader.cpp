#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace kvconn;

namespace {

// RAII temporary directory
struct TmpDir {
    std::filesystem::path path;
    TmpDir() : path(std::filesystem::temp_directory_path() / "kvconn_test_config") {
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
    std::string file(const std::string& name, const std::string& content) {
        auto p = path / name;
        std::ofstream f(p);
        f << content;
        return p.string();
    }
};

void expect_error(const std::string& toml, const std::string& fragment) {
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE_FALSE(result.success);
    INFO(result.error_message);
    CHECK(result.error_message.find(fragment) != std::string::npos);
}

} // namespace

TEST_CASE("ConfigLoader: connections and groups", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "debug"

[defaults]
timeout = 2.5
read_write_timeout = 1

[[connections]]
name = "cache"
uri = "tcp://10.0.0.1:6379/2"
password = "secret"

[[connections]]
name = "local"
scheme = "unix"
path = "/var/run/redis.sock"
timeout = 0.5

[[groups]]
name = "sessions"
nodes = ["tcp://10.0.0.5:6379", { host = "10.0.0.6", port = 6380, alias = "b" }]
)");
    REQUIRE(result.success);
    const auto& config = result.config;

    CHECK(config.logging.level == "debug");
    REQUIRE(config.connections.size() == 2);

    const auto& cache = config.connections[0];
    CHECK(cache.name == "cache");
    CHECK(cache.parameters.host == "10.0.0.1");
    CHECK(cache.parameters.database == std::optional<int64_t>(2));
    CHECK(cache.parameters.password == std::optional<std::string>("secret"));
    CHECK(cache.parameters.timeout == 2.5);
    CHECK(cache.parameters.read_write_timeout == std::optional<double>(1.0));

    const auto& local = config.connections[1];
    CHECK(local.parameters.scheme == "unix");
    CHECK(local.parameters.path == "/var/run/redis.sock");
    CHECK(local.parameters.timeout == 0.5);

    REQUIRE(config.groups.size() == 1);
    const auto& group = config.groups[0];
    CHECK(group.name == "sessions");
    REQUIRE(group.nodes.size() == 2);
    CHECK(group.nodes[0].host == "10.0.0.5");
    CHECK(group.nodes[0].timeout == 2.5);
    CHECK(group.nodes[1].port == 6380);
    CHECK(group.nodes[1].alias == std::optional<std::string>("b"));
}

TEST_CASE("ConfigLoader: keys override the uri", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[[connections]]
name = "c"
uri = "tcp://10.0.0.1:6379/2"
database = 4
port = 7000
)");
    REQUIRE(result.success);
    const auto& params = result.config.connections[0].parameters;
    CHECK(params.database == std::optional<int64_t>(4));
    CHECK(params.port == 7000);
}

TEST_CASE("ConfigLoader: env vars are expanded", "[config]") {
    ::setenv("KVCONN_TEST_PASSWORD", "from-env", 1);
    auto result = ConfigLoader::load_from_string(R"(
[[connections]]
name = "c"
uri = "tcp://127.0.0.1"
password = "${KVCONN_TEST_PASSWORD}"
)");
    ::unsetenv("KVCONN_TEST_PASSWORD");

    REQUIRE(result.success);
    CHECK(result.config.connections[0].parameters.password == std::optional<std::string>("from-env"));
}

TEST_CASE("ConfigLoader: expand_env_vars", "[config]") {
    ::setenv("KVCONN_TEST_HOST", "db.local", 1);
    CHECK(ConfigLoader::expand_env_vars("tcp://${KVCONN_TEST_HOST}:6379") == "tcp://db.local:6379");
    CHECK(ConfigLoader::expand_env_vars("${KVCONN_TEST_UNSET_VAR}") == "");
    CHECK(ConfigLoader::expand_env_vars("plain") == "plain");
    CHECK_THROWS(ConfigLoader::expand_env_vars("${OPEN"));
    ::unsetenv("KVCONN_TEST_HOST");
}

TEST_CASE("ConfigLoader: validation errors name the offending entry", "[config]") {
    expect_error("[[connections]]\nuri = \"tcp://h\"\n", "connections[0].name");
    expect_error("[[connections]]\nname = \"a\"\n[[groups]]\nname = \"a\"\nnodes = [\"tcp://h\"]\n",
                 "duplicate name 'a'");
    expect_error("[[connections]]\nname = \"a\"\nuri = \"tcp://h:99999\"\n", "connections[0]");
    expect_error("[[connections]]\nname = \"a\"\nuri = 5\n", "connections[0].uri");
    expect_error("[[connections]]\nname = \"a\"\ndatabase = \"x\"\n", "connections[0]");
    expect_error("[[groups]]\nname = \"g\"\nnodes = []\n", "groups[0].nodes");
    expect_error("[[groups]]\nname = \"g\"\nnodes = [42]\n", "groups[0].nodes[0]");
    expect_error("[logging]\nlevel = \"loud\"\n", "logging.level");
    expect_error("[defaults]\ntimeout = 0\n", "defaults.timeout");
    expect_error("[defaults]\nread_write_timeout = -1\n", "defaults.read_write_timeout");
    expect_error("[defaults]\ntimeout = inf\n", "defaults.timeout: must be a finite number");
    expect_error("[defaults]\ntimeout = nan\n", "defaults.timeout: must be a finite number");
    expect_error("[defaults]\ntimeout = 1e12\n", "defaults.timeout: must not exceed");
    expect_error("[defaults]\nread_write_timeout = inf\n", "defaults.read_write_timeout");
    expect_error("[[connections]]\nname = \"a\"\nuri = \"tcp://h?timeout=nan\"\n", "connections[0]");
}

TEST_CASE("ConfigLoader: TOML syntax error", "[config]") {
    auto result = ConfigLoader::load_from_string("[[connections]\nname = ");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("TOML parse error") != std::string::npos);
}

TEST_CASE("ConfigLoader: load_from_file", "[config]") {
    TmpDir tmp;
    auto path = tmp.file("client.toml", R"(
[[connections]]
name = "webdis"
uri = "http://127.0.0.1:7379?user=admin&pass=pw"
)");

    auto result = ConfigLoader::load_from_file(path);
    REQUIRE(result.success);
    REQUIRE(result.config.connections.size() == 1);
    CHECK(result.config.connections[0].parameters.scheme == "http");
    CHECK(result.config.connections[0].parameters.extras.at("user") == "admin");

    auto missing = ConfigLoader::load_from_file((tmp.path / "absent.toml").string());
    CHECK_FALSE(missing.success);
}

TEST_CASE("ConfigLoader: empty document yields an empty config", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    CHECK(result.config.logging.level == "info");
    CHECK(result.config.connections.empty());
    CHECK(result.config.groups.empty());
}
