#include "config/config_loader.hpp"
#include "connection/connection_factory.hpp"
#include "connection/node_group.hpp"
#include "connection/raw_command.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

using namespace kvconn;

namespace {

struct ProbeOptions {
    std::string config_file = "config/kvconn.toml";
    bool connect = false;
};

void print_usage() {
    utils::log::info("Usage: kvconn_probe [config.toml] [--connect]");
}

std::string describe_queue(const IConnection& connection) {
    std::string out;
    for (const auto& command : connection.connect_commands()) {
        if (!out.empty()) out += ", ";
        out += command.id();
    }
    return out.empty() ? "(empty)" : out;
}

bool probe_connection(ConnectionFactory& factory, const ConnectionConfig& config, bool connect) {
    try {
        auto connection = factory.create(config.parameters);
        utils::log::info(std::format("[{}] {} -> {} connect queue: {}",
            config.name, config.parameters.redacted(), connection->id(), describe_queue(*connection)));

        if (connect) {
            const Reply reply = connection->execute_command(RawCommand(commands::PING));
            utils::log::info(std::format("[{}] PING -> {}", config.name, reply.to_string()));
            connection->disconnect();
        }
        return true;
    } catch (const KvError& e) {
        utils::log::error(std::format("[{}] {} ({})",
            config.name, e.what(), error_category_to_string(e.category())));
        return false;
    }
}

bool probe_group(ConnectionFactory& factory, const GroupConfig& config, bool connect) {
    NodeGroup group(config.name);

    std::vector<AggregateEntry> entries;
    entries.reserve(config.nodes.size());
    for (const auto& node : config.nodes) {
        entries.emplace_back(node);
    }

    try {
        factory.aggregate(group, std::move(entries));
        std::string ids;
        for (const auto& id : group.ids()) {
            if (!ids.empty()) ids += ", ";
            ids += id;
        }
        utils::log::info(std::format("[{}] group of {} nodes: {}", config.name, group.size(), ids));

        if (connect) {
            group.connect();
            utils::log::info(std::format("[{}] all nodes connected", config.name));
            group.disconnect();
        }
        return true;
    } catch (const KvError& e) {
        utils::log::error(std::format("[{}] {} ({} nodes attached)", config.name, e.what(), group.size()));
        group.disconnect();
        return false;
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    ProbeOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--connect") {
            options.connect = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return EXIT_SUCCESS;
        } else {
            options.config_file = std::string(arg);
        }
    }

    utils::log::info(std::format("Loading configuration from {}", options.config_file));
    const auto result = ConfigLoader::load_from_file(options.config_file);
    if (!result.success) {
        utils::log::error(result.error_message);
        return EXIT_FAILURE;
    }
    const auto& config = result.config;

    if (const auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }

    ConnectionFactory factory;
    const auto schemes = factory.registry().schemes();
    std::string scheme_list;
    for (const auto& scheme : schemes) {
        if (!scheme_list.empty()) scheme_list += ", ";
        scheme_list += scheme;
    }
    utils::log::info(std::format("Registered schemes: {}", scheme_list));

    size_t failures = 0;
    for (const auto& connection : config.connections) {
        if (!probe_connection(factory, connection, options.connect)) ++failures;
    }
    for (const auto& group : config.groups) {
        if (!probe_group(factory, group, options.connect)) ++failures;
    }

    utils::log::info(std::format("Probed {} connections and {} groups, {} failed",
        config.connections.size(), config.groups.size(), failures));
    return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
