#include "connection/stream_connection.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <cmath>
#include <cstring>
#include <format>

namespace kvconn {

namespace {

constexpr size_t kReadChunk = 16 * 1024;

bool set_nonblocking(int fd, bool enabled) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    const int updated = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return ::fcntl(fd, F_SETFL, updated) == 0;
}

timeval to_timeval(double seconds) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(seconds);
    tv.tv_usec = static_cast<suseconds_t>((seconds - std::floor(seconds)) * 1'000'000);
    return tv;
}

} // anonymous namespace

// ============================================================================
// Lifecycle
// ============================================================================

StreamConnection::StreamConnection(ConnectionParameters parameters)
    : ConnectionBase(std::move(parameters)) {
    require_scheme({"tcp", "unix"});
    if (this->parameters().is_unix_socket() && this->parameters().path.empty()) {
        throw ConnectionError("Missing socket path for unix connection", ErrorCategory::INVALID_ARGUMENT);
    }
}

StreamConnection::~StreamConnection() {
    close_transport();
}

void StreamConnection::open_transport() {
    fd_ = parameters().is_unix_socket() ? connect_unix() : connect_tcp();
    apply_io_timeouts(fd_);
}

void StreamConnection::close_transport() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    reader_.reset();
}

// ============================================================================
// Transport setup
// ============================================================================

int StreamConnection::connect_tcp() const {
    const auto& endpoint = parameters();

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* results = nullptr;

    const std::string port = std::to_string(endpoint.port);
    const int rc = ::getaddrinfo(endpoint.host.c_str(), port.c_str(), &hints, &results);
    if (rc != 0) {
        throw ConnectionError(std::format("Cannot resolve {}: {}", endpoint.host, ::gai_strerror(rc)));
    }

    std::string last_error = "no addresses";
    int fd = -1;
    for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_error = std::strerror(errno);
            continue;
        }

        bool connected = false;
        if (set_nonblocking(fd, true)) {
            if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
                connected = true;
            } else if (errno == EINPROGRESS) {
                connected = await_connect(fd, last_error);
            } else {
                last_error = std::strerror(errno);
            }
        } else {
            last_error = std::strerror(errno);
        }

        if (connected && set_nonblocking(fd, false)) {
            const int one = 1;
            if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) != 0) {
                utils::log::warn(std::format("Cannot set TCP_NODELAY on {}: {}", id(), std::strerror(errno)));
            }
            break;
        }
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(results);

    if (fd < 0) {
        throw ConnectionError(std::format("Cannot connect to {}: {}", endpoint.address(), last_error));
    }
    return fd;
}

int StreamConnection::connect_unix() const {
    const auto& path = parameters().path;

    sockaddr_un addr{};
    if (path.size() >= sizeof(addr.sun_path)) {
        throw ConnectionError(std::format("Unix socket path too long: {}", path),
                              ErrorCategory::INVALID_ARGUMENT);
    }
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw ConnectionError(std::format("socket() failed: {}", std::strerror(errno)));
    }
    if (::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
        const std::string error = std::strerror(errno);
        ::close(fd);
        throw ConnectionError(std::format("Cannot connect to {}: {}", path, error));
    }
    return fd;
}

bool StreamConnection::await_connect(int fd, std::string& error) const {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLOUT;

    const int timeout_ms = static_cast<int>(parameters().timeout * 1000.0);
    int rc;
    do {
        rc = ::poll(&pfd, 1, timeout_ms);
    } while (rc < 0 && errno == EINTR);

    if (rc == 0) {
        error = std::format("timed out after {}s", parameters().timeout);
        return false;
    }
    if (rc < 0) {
        error = std::strerror(errno);
        return false;
    }

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0) {
        error = std::strerror(errno);
        return false;
    }
    if (so_error != 0) {
        error = std::strerror(so_error);
        return false;
    }
    return true;
}

void StreamConnection::apply_io_timeouts(int fd) const {
    const auto& rw = parameters().read_write_timeout;
    if (!rw) {
        return;
    }
    const timeval tv = to_timeval(*rw);
    if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
        ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        utils::log::warn(std::format("Cannot set read/write timeout on {}: {}", id(), std::strerror(errno)));
    }
}

// ============================================================================
// Request / reply
// ============================================================================

Reply StreamConnection::send_and_receive(const RawCommand& command) {
    write_all(RespWriter::encode(command));
    return read_reply();
}

void StreamConnection::write_all(std::string_view data) {
    while (!data.empty()) {
        const ssize_t n = ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                fail(std::format("Write to {} timed out", id()));
            }
            fail(std::format("Write to {} failed: {}", id(), std::strerror(errno)));
        }
        data.remove_prefix(static_cast<size_t>(n));
    }
}

Reply StreamConnection::read_reply() {
    char chunk[kReadChunk];
    while (true) {
        std::optional<Reply> reply;
        try {
            reply = reader_.next();
        } catch (const ConnectionError&) {
            close_transport();
            throw;
        }
        if (reply) {
            return std::move(*reply);
        }

        const ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (n == 0) {
            fail(std::format("Connection to {} closed by server", id()));
        }
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                fail(std::format("Read from {} timed out", id()));
            }
            fail(std::format("Read from {} failed: {}", id(), std::strerror(errno)));
        }
        reader_.feed(std::string_view(chunk, static_cast<size_t>(n)));
    }
}

void StreamConnection::fail(const std::string& message) {
    close_transport();
    throw ConnectionError(message);
}

} // namespace kvconn
