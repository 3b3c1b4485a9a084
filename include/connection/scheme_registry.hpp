#pragma once

#include "connection/iconnection.hpp"
#include "connection/parameters.hpp"

#include <concepts>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace kvconn {

class IConnectionFactory;

namespace schemes {
    inline constexpr std::string_view TCP = "tcp";
    inline constexpr std::string_view UNIX = "unix";
    inline constexpr std::string_view HTTP = "http";
}

/// Builds a connection from parameters; the factory prepares the result.
using ConnectionConstructor =
    std::function<std::unique_ptr<IConnection>(const ConnectionParameters&)>;

/// Builds a connection with access to the factory; never auto-prepared.
using LazyInitializer =
    std::function<std::unique_ptr<IConnection>(const ConnectionParameters&, IConnectionFactory&)>;

using Initializer = std::variant<ConnectionConstructor, LazyInitializer>;

/**
 * @brief Constructor initializer for a concrete connection class
 *
 * Only instantiable for classes that implement IConnection and can be built
 * from parameters, so a class that does not satisfy the Connection
 * capability is rejected at compile time.
 */
template<typename T>
    requires std::derived_from<T, IConnection> && std::constructible_from<T, const ConnectionParameters&>
[[nodiscard]] ConnectionConstructor make_constructor() {
    return [](const ConnectionParameters& parameters) -> std::unique_ptr<IConnection> {
        return std::make_unique<T>(parameters);
    };
}

/**
 * @brief Mapping from scheme name to initializer
 *
 * Scheme names are case-insensitive (stored lower-case). No internal
 * locking: mutate during setup, or synchronize externally.
 */
class SchemeRegistry {
public:
    /** @brief Empty registry */
    SchemeRegistry() = default;

    /** @brief Registry with tcp/unix -> StreamConnection and http -> WebdisConnection */
    [[nodiscard]] static SchemeRegistry with_defaults();

    /**
     * @brief Register or replace the initializer for a scheme
     * @throws InvalidInitializer if the initializer holds no callable
     * @throws KvError (INVALID_ARGUMENT) if the scheme name is empty
     */
    void define(std::string_view scheme, Initializer initializer);

    template<typename T>
        requires std::derived_from<T, IConnection> && std::constructible_from<T, const ConnectionParameters&>
    void define(std::string_view scheme) {
        define(scheme, make_constructor<T>());
    }

    /**
     * @brief Remove a scheme; removing an absent scheme is not an error
     * @return true if a mapping was removed
     */
    bool undefine(std::string_view scheme);

    /** @brief Initializer for scheme, or nullptr */
    [[nodiscard]] const Initializer* find(std::string_view scheme) const;

    [[nodiscard]] bool contains(std::string_view scheme) const { return find(scheme) != nullptr; }

    /** @brief Registered scheme names, sorted */
    [[nodiscard]] std::vector<std::string> schemes() const;

    [[nodiscard]] size_t size() const { return initializers_.size(); }

private:
    std::unordered_map<std::string, Initializer> initializers_;
};

} // namespace kvconn
