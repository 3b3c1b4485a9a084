#pragma once

#include "connection/connection_base.hpp"
#include "protocol/resp.hpp"

#include <string>

namespace kvconn {

/**
 * @brief Socket connection speaking RESP over TCP or a unix domain socket
 *
 * Handles the "tcp" and "unix" schemes. The socket is opened on connect()
 * (non-blocking connect bounded by the `timeout` parameter) and closed in
 * the destructor. `read_write_timeout`, when set, bounds every send/recv.
 */
class StreamConnection : public ConnectionBase {
public:
    /**
     * @throws ConnectionError (INVALID_ARGUMENT) for a scheme other than tcp/unix
     */
    explicit StreamConnection(ConnectionParameters parameters);

    ~StreamConnection() override;

    StreamConnection(const StreamConnection&) = delete;
    StreamConnection& operator=(const StreamConnection&) = delete;

protected:
    void open_transport() override;
    void close_transport() override;
    [[nodiscard]] bool transport_open() const override { return fd_ >= 0; }
    Reply send_and_receive(const RawCommand& command) override;

private:
    [[nodiscard]] int connect_tcp() const;
    [[nodiscard]] int connect_unix() const;

    // Waits for a non-blocking connect() on fd to finish; fills error on failure.
    [[nodiscard]] bool await_connect(int fd, std::string& error) const;

    void apply_io_timeouts(int fd) const;
    void write_all(std::string_view data);
    [[nodiscard]] Reply read_reply();

    // Closes the socket after a transport error and throws.
    [[noreturn]] void fail(const std::string& message);

    int fd_ = -1;
    RespReader reader_;
};

} // namespace kvconn
