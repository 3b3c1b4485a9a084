#pragma once

#include "connection/iaggregate_connection.hpp"
#include "connection/iconnection.hpp"
#include "connection/parameters.hpp"
#include "connection/scheme_registry.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace kvconn {

/// One member of an aggregate: a ready connection or something create() accepts.
using AggregateEntry = std::variant<
    std::unique_ptr<IConnection>,
    ConnectionParameters,
    std::string,
    ParameterMap>;

/**
 * @brief Abstract factory turning connection parameters into connections
 *
 * Lazy initializers receive the factory that invoked them, so they can build
 * the sub-connections of a composite through the same scheme table.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Register or replace the initializer for a scheme
     * @throws InvalidInitializer if the initializer is not callable
     */
    virtual void define(std::string_view scheme, Initializer initializer) = 0;

    /** @brief Register a connection class for a scheme (checked at compile time) */
    template<typename T>
        requires std::derived_from<T, IConnection> && std::constructible_from<T, const ConnectionParameters&>
    void define(std::string_view scheme) {
        define(scheme, make_constructor<T>());
    }

    /** @brief Remove a scheme; no error if it is absent */
    virtual void undefine(std::string_view scheme) = 0;

    /**
     * @brief Build a connection for the parameters' scheme
     * @throws UnknownScheme if no initializer is registered for the scheme
     * @throws ContractViolation if the initializer produced no connection
     */
    [[nodiscard]] virtual std::unique_ptr<IConnection> create(const ConnectionParameters& parameters) = 0;

    /**
     * @brief Normalize a URI, then create()
     * @throws ParameterError on a malformed URI
     */
    [[nodiscard]] virtual std::unique_ptr<IConnection> create(std::string_view uri) = 0;

    /**
     * @brief Normalize a key/value map, then create()
     * @throws ParameterError on invalid values
     */
    [[nodiscard]] virtual std::unique_ptr<IConnection> create(const ParameterMap& values) = 0;

    /**
     * @brief Add every entry to the aggregate, in order
     *
     * Ready connections are added unchanged; everything else goes through
     * create(). Not transactional: when an entry fails, the ones before it
     * stay attached and the error propagates.
     */
    virtual void aggregate(IAggregateConnection& target, std::vector<AggregateEntry> entries) = 0;
};

} // namespace kvconn
