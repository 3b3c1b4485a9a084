#pragma once

#include "core/utils.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace kvconn {

namespace commands {
    inline constexpr std::string_view AUTH = "AUTH";
    inline constexpr std::string_view SELECT = "SELECT";
    inline constexpr std::string_view PING = "PING";
}

/**
 * @brief One protocol command as an ordered token sequence
 *
 * The command name is upper-cased on construction; arguments are kept as-is.
 */
class RawCommand {
public:
    RawCommand(std::string_view id, std::vector<std::string> arguments = {})
        : id_(utils::to_upper(id)), arguments_(std::move(arguments)) {}

    RawCommand(std::initializer_list<std::string> tokens) {
        auto it = tokens.begin();
        if (it != tokens.end()) {
            id_ = utils::to_upper(*it++);
        }
        arguments_.assign(it, tokens.end());
    }

    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] const std::vector<std::string>& arguments() const { return arguments_; }

    /** @brief [id, arguments...] */
    [[nodiscard]] std::vector<std::string> tokens() const {
        std::vector<std::string> result;
        result.reserve(arguments_.size() + 1);
        result.push_back(id_);
        result.insert(result.end(), arguments_.begin(), arguments_.end());
        return result;
    }

    bool operator==(const RawCommand&) const = default;

    [[nodiscard]] static RawCommand auth(std::string credential) {
        return RawCommand(commands::AUTH, {std::move(credential)});
    }

    [[nodiscard]] static RawCommand select(int64_t database) {
        return RawCommand(commands::SELECT, {std::to_string(database)});
    }

private:
    std::string id_;
    std::vector<std::string> arguments_;
};

} // namespace kvconn
