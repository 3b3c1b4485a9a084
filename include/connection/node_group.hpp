#pragma once

#include "connection/iaggregate_connection.hpp"

#include <memory>
#include <string>
#include <vector>

namespace kvconn {

/**
 * @brief Ordered group of nodes with no routing of its own
 *
 * Keeps nodes in insertion order. connect() opens every node and stops at
 * the first failure; nodes connected before it stay connected.
 */
class NodeGroup : public IAggregateConnection {
public:
    NodeGroup() = default;
    explicit NodeGroup(std::string name) : name_(std::move(name)) {}

    void add(std::unique_ptr<IConnection> connection) override;
    bool remove(const IConnection& connection) override;
    [[nodiscard]] IConnection* connection_by_id(std::string_view id) const override;
    [[nodiscard]] size_t size() const override { return nodes_.size(); }

    void connect() override;
    void disconnect() override;
    [[nodiscard]] bool is_connected() const override;

    [[nodiscard]] const std::string& name() const { return name_; }

    /** @brief Node at insertion position index, or nullptr if out of range */
    [[nodiscard]] IConnection* at(size_t index) const {
        return index < nodes_.size() ? nodes_[index].get() : nullptr;
    }

    [[nodiscard]] std::vector<std::string> ids() const;

private:
    std::string name_;
    std::vector<std::unique_ptr<IConnection>> nodes_;
};

} // namespace kvconn
