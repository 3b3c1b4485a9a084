#pragma once

#include "connection/iconnection_factory.hpp"
#include "connection/scheme_registry.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace kvconn {

/**
 * @brief Standard connection factory
 *
 * Each instance owns its own scheme table; independent factories with
 * different schemes can coexist.
 *
 * Class initializers (define<T>, ConnectionConstructor) get their
 * connections prepared: AUTH then SELECT are queued from the parameters.
 * Lazy initializers are called with (parameters, *this) and are never
 * prepared; they queue whatever setup commands they need themselves.
 *
 * Usage:
 *   ConnectionFactory factory;
 *   auto conn = factory.create("tcp://10.0.0.1:6379?password=secret&database=2");
 *
 *   factory.define("pair", [](const ConnectionParameters& p, IConnectionFactory& f) {
 *       ...build sub-connections with f.create(...)...
 *   });
 */
class ConnectionFactory : public IConnectionFactory {
public:
    /** @brief Factory with the default schemes (tcp, unix, http) */
    ConnectionFactory();

    explicit ConnectionFactory(SchemeRegistry registry);

    using IConnectionFactory::define;

    void define(std::string_view scheme, Initializer initializer) override;
    void undefine(std::string_view scheme) override;

    [[nodiscard]] std::unique_ptr<IConnection> create(const ConnectionParameters& parameters) override;
    [[nodiscard]] std::unique_ptr<IConnection> create(std::string_view uri) override;
    [[nodiscard]] std::unique_ptr<IConnection> create(const ParameterMap& values) override;

    void aggregate(IAggregateConnection& target, std::vector<AggregateEntry> entries) override;

    [[nodiscard]] const SchemeRegistry& registry() const { return registry_; }

protected:
    /**
     * @brief Queue implicit setup commands on a freshly built connection
     *
     * AUTH <password> if a password is set, then SELECT <database> if a
     * database is set. The server refuses session commands before
     * authentication, so the order is fixed.
     */
    virtual void prepare_connection(IConnection& connection);

private:
    SchemeRegistry registry_;
};

} // namespace kvconn
