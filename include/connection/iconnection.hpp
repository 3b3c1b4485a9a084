#pragma once

#include "connection/parameters.hpp"
#include "connection/raw_command.hpp"
#include "protocol/reply.hpp"

#include <deque>
#include <string>

namespace kvconn {

/**
 * @brief A single endpoint's lazily-connecting session
 *
 * Constructing a connection never touches the network. Commands queued with
 * add_connect_command() are sent, in order, right after the transport is
 * established on the first connect() and before any other command.
 *
 * Implementations are not thread-safe.
 */
class IConnection {
public:
    virtual ~IConnection() = default;

    /**
     * @brief Open the transport and flush the connect-command queue
     * @throws ConnectionError if the transport or a queued command fails
     */
    virtual void connect() = 0;

    /**
     * @brief Close the transport; safe to call when not connected
     */
    virtual void disconnect() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    /** @brief Parameters this connection was built from */
    [[nodiscard]] virtual const ConnectionParameters& parameters() const = 0;

    /** @brief Append a command to the connect-command queue */
    virtual void add_connect_command(RawCommand command) = 0;

    /** @brief Pending connect commands in send order */
    [[nodiscard]] virtual const std::deque<RawCommand>& connect_commands() const = 0;

    /**
     * @brief Send one command and wait for its reply, connecting first if needed
     * @throws ConnectionError on transport or protocol failure
     */
    virtual Reply execute_command(const RawCommand& command) = 0;

    /** @brief Identifier used by aggregates: alias if set, otherwise the address */
    [[nodiscard]] virtual std::string id() const = 0;
};

} // namespace kvconn
