#include "connection/connection_base.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace kvconn {

ConnectionBase::ConnectionBase(ConnectionParameters parameters)
    : parameters_(std::move(parameters)) {}

void ConnectionBase::connect() {
    if (transport_open()) {
        return;
    }

    open_transport();
    utils::log::info(std::format("Connected to {} ({})", id(), parameters_.scheme));

    try {
        flush_connect_commands();
    } catch (const KvError& e) {
        utils::log::error(std::format("Connect commands failed on {}: {}", id(), e.what()));
        close_transport();
        throw;
    }
}

void ConnectionBase::disconnect() {
    if (!transport_open()) {
        return;
    }
    close_transport();
    utils::log::info(std::format("Disconnected from {}", id()));
}

bool ConnectionBase::is_connected() const {
    return transport_open();
}

void ConnectionBase::add_connect_command(RawCommand command) {
    connect_commands_.push_back(std::move(command));
}

Reply ConnectionBase::execute_command(const RawCommand& command) {
    if (!transport_open()) {
        connect();
    }
    return send_and_receive(command);
}

std::string ConnectionBase::id() const {
    if (parameters_.alias) {
        return *parameters_.alias;
    }
    return parameters_.address();
}

void ConnectionBase::require_scheme(std::initializer_list<std::string_view> accepted) const {
    if (std::find(accepted.begin(), accepted.end(), parameters_.scheme) == accepted.end()) {
        throw ConnectionError(std::format("Invalid scheme '{}' for this connection class",
                                          parameters_.scheme),
                              ErrorCategory::INVALID_ARGUMENT);
    }
}

void ConnectionBase::flush_connect_commands() {
    for (const auto& command : connect_commands_) {
        const Reply reply = send_and_receive(command);
        if (reply.is_error()) {
            throw ConnectionError(std::format("{} rejected by {}: {}", command.id(), id(), reply.str));
        }
    }
}

} // namespace kvconn
