#include "connection/scheme_registry.hpp"
#include "connection/stream_connection.hpp"
#include "connection/webdis_connection.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace kvconn {

SchemeRegistry SchemeRegistry::with_defaults() {
    SchemeRegistry registry;
    registry.define<StreamConnection>(schemes::TCP);
    registry.define<StreamConnection>(schemes::UNIX);
    registry.define<WebdisConnection>(schemes::HTTP);
    return registry;
}

void SchemeRegistry::define(std::string_view scheme, Initializer initializer) {
    if (scheme.empty()) {
        throw KvError(ErrorCategory::INVALID_ARGUMENT, "Scheme name is empty");
    }

    const bool callable = std::visit([](const auto& fn) { return static_cast<bool>(fn); }, initializer);
    if (!callable) {
        throw InvalidInitializer(std::format(
            "Initializer for scheme '{}' must be a connection class or a callable object", scheme));
    }

    const bool lazy = std::holds_alternative<LazyInitializer>(initializer);
    initializers_.insert_or_assign(utils::to_lower(scheme), std::move(initializer));
    utils::log::debug(std::format("Scheme '{}' defined ({} initializer)", scheme, lazy ? "lazy" : "class"));
}

bool SchemeRegistry::undefine(std::string_view scheme) {
    const bool removed = initializers_.erase(utils::to_lower(scheme)) > 0;
    if (removed) {
        utils::log::debug(std::format("Scheme '{}' undefined", scheme));
    }
    return removed;
}

const Initializer* SchemeRegistry::find(std::string_view scheme) const {
    const auto it = initializers_.find(utils::to_lower(scheme));
    return it == initializers_.end() ? nullptr : &it->second;
}

std::vector<std::string> SchemeRegistry::schemes() const {
    std::vector<std::string> names;
    names.reserve(initializers_.size());
    for (const auto& [name, _] : initializers_) {
        names.push_back(name);
    }
    std::ranges::sort(names);
    return names;
}

} // namespace kvconn
