#include "connection/node_group.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace kvconn {

void NodeGroup::add(std::unique_ptr<IConnection> connection) {
    if (!connection) {
        throw ContractViolation(std::format("Cannot add a null connection to group '{}'", name_));
    }
    utils::log::debug(std::format("Group '{}': added node {}", name_, connection->id()));
    nodes_.push_back(std::move(connection));
}

bool NodeGroup::remove(const IConnection& connection) {
    const auto it = std::ranges::find_if(nodes_, [&connection](const auto& node) {
        return node.get() == &connection;
    });
    if (it == nodes_.end()) {
        return false;
    }
    utils::log::debug(std::format("Group '{}': removed node {}", name_, (*it)->id()));
    nodes_.erase(it);
    return true;
}

IConnection* NodeGroup::connection_by_id(std::string_view id) const {
    const auto it = std::ranges::find_if(nodes_, [id](const auto& node) {
        return node->id() == id;
    });
    return it == nodes_.end() ? nullptr : it->get();
}

void NodeGroup::connect() {
    for (const auto& node : nodes_) {
        node->connect();
    }
}

void NodeGroup::disconnect() {
    for (const auto& node : nodes_) {
        node->disconnect();
    }
}

bool NodeGroup::is_connected() const {
    return std::ranges::any_of(nodes_, [](const auto& node) { return node->is_connected(); });
}

std::vector<std::string> NodeGroup::ids() const {
    std::vector<std::string> result;
    result.reserve(nodes_.size());
    for (const auto& node : nodes_) {
        result.push_back(node->id());
    }
    return result;
}

} // namespace kvconn
