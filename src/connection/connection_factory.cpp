#include "connection/connection_factory.hpp"
#include "connection/raw_command.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <type_traits>

namespace kvconn {

ConnectionFactory::ConnectionFactory()
    : ConnectionFactory(SchemeRegistry::with_defaults()) {}

ConnectionFactory::ConnectionFactory(SchemeRegistry registry)
    : registry_(std::move(registry)) {}

void ConnectionFactory::define(std::string_view scheme, Initializer initializer) {
    registry_.define(scheme, std::move(initializer));
}

void ConnectionFactory::undefine(std::string_view scheme) {
    (void)registry_.undefine(scheme);
}

// ============================================================================
// create
// ============================================================================

std::unique_ptr<IConnection> ConnectionFactory::create(const ConnectionParameters& parameters) {
    const Initializer* found = registry_.find(parameters.scheme);
    if (!found) {
        throw UnknownScheme(parameters.scheme);
    }

    // Copy: a lazy initializer may redefine its own scheme while running
    const Initializer initializer = *found;

    std::unique_ptr<IConnection> connection;
    if (const auto* lazy = std::get_if<LazyInitializer>(&initializer)) {
        connection = (*lazy)(parameters, *this);
    } else {
        connection = std::get<ConnectionConstructor>(initializer)(parameters);
        if (connection) {
            prepare_connection(*connection);
        }
    }

    if (!connection) {
        throw ContractViolation(std::format(
            "Initializer for scheme '{}' did not return a connection", parameters.scheme));
    }

    utils::log::debug(std::format("Created {} connection to {}", parameters.scheme, parameters.redacted()));
    return connection;
}

std::unique_ptr<IConnection> ConnectionFactory::create(std::string_view uri) {
    return create(ConnectionParameters::parse(uri));
}

std::unique_ptr<IConnection> ConnectionFactory::create(const ParameterMap& values) {
    return create(ConnectionParameters::from_map(values));
}

// ============================================================================
// aggregate
// ============================================================================

void ConnectionFactory::aggregate(IAggregateConnection& target, std::vector<AggregateEntry> entries) {
    size_t added = 0;
    try {
        for (auto& entry : entries) {
            auto connection = std::visit([this](auto&& value) -> std::unique_ptr<IConnection> {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, std::unique_ptr<IConnection>>) {
                    if (!value) {
                        throw ContractViolation("Aggregate entry holds a null connection");
                    }
                    return std::move(value);
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return create(std::string_view(value));
                } else {
                    return create(value);
                }
            }, entry);

            target.add(std::move(connection));
            ++added;
        }
    } catch (const KvError& e) {
        utils::log::warn(std::format("Aggregate stopped after {} of {} entries: {}",
                                     added, entries.size(), e.what()));
        throw;
    }
}

// ============================================================================
// Preparation
// ============================================================================

void ConnectionFactory::prepare_connection(IConnection& connection) {
    const auto& parameters = connection.parameters();

    if (parameters.password) {
        connection.add_connect_command(RawCommand::auth(*parameters.password));
    }

    if (parameters.database) {
        connection.add_connect_command(RawCommand::select(*parameters.database));
    }
}

} // namespace kvconn
