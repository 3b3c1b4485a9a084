#pragma once

#include "connection/iconnection.hpp"

#include <deque>
#include <initializer_list>
#include <string>
#include <string_view>

namespace kvconn {

/**
 * @brief Common state for concrete connections
 *
 * Owns the parameters and the connect-command queue. Subclasses implement
 * the transport (open_transport/close_transport/transport_open) and a
 * request/reply round trip (send_and_receive); connect() ties them together.
 * The queue is kept after flushing, so a reconnect replays it.
 */
class ConnectionBase : public IConnection {
public:
    explicit ConnectionBase(ConnectionParameters parameters);

    void connect() override;
    void disconnect() override;
    [[nodiscard]] bool is_connected() const override;

    [[nodiscard]] const ConnectionParameters& parameters() const override { return parameters_; }

    void add_connect_command(RawCommand command) override;
    [[nodiscard]] const std::deque<RawCommand>& connect_commands() const override {
        return connect_commands_;
    }

    Reply execute_command(const RawCommand& command) override;

    [[nodiscard]] std::string id() const override;

protected:
    virtual void open_transport() = 0;
    virtual void close_transport() = 0;
    [[nodiscard]] virtual bool transport_open() const = 0;
    virtual Reply send_and_receive(const RawCommand& command) = 0;

    /**
     * @brief Throws ConnectionError if the given scheme is not in the accepted list
     */
    void require_scheme(std::initializer_list<std::string_view> accepted) const;

private:
    void flush_connect_commands();

    ConnectionParameters parameters_;
    std::deque<RawCommand> connect_commands_;
};

} // namespace kvconn
