#pragma once

#include "connection/iconnection.hpp"

#include <cstddef>
#include <memory>
#include <string_view>

namespace kvconn {

/**
 * @brief Composite connection owning several single connections
 *
 * Multi-node topologies (sharded clusters, replication groups) implement this
 * and decide for themselves how commands are distributed.
 */
class IAggregateConnection {
public:
    virtual ~IAggregateConnection() = default;

    /**
     * @brief Attach a connection; the aggregate takes ownership
     * @throws ContractViolation if connection is null
     */
    virtual void add(std::unique_ptr<IConnection> connection) = 0;

    /**
     * @brief Detach and destroy a connection
     * @return false if the connection is not part of this aggregate
     */
    virtual bool remove(const IConnection& connection) = 0;

    /** @brief Connection whose id() matches, or nullptr */
    [[nodiscard]] virtual IConnection* connection_by_id(std::string_view id) const = 0;

    [[nodiscard]] virtual size_t size() const = 0;

    virtual void connect() = 0;
    virtual void disconnect() = 0;
    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace kvconn
