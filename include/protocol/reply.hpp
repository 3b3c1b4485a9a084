#pragma once

#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <vector>

namespace kvconn {

enum class ReplyType {
    STATUS,
    ERROR,
    INTEGER,
    BULK,
    NIL,
    ARRAY
};

/**
 * @brief Decoded server reply
 *
 * Transport-neutral: the stream connection fills it from RESP, the
 * HTTP-bridged connection from the gateway's JSON body.
 */
struct Reply {
    ReplyType type = ReplyType::NIL;
    std::string str;              // STATUS, ERROR, BULK
    int64_t integer = 0;          // INTEGER
    std::vector<Reply> elements;  // ARRAY

    static Reply status(std::string s) { return Reply{ReplyType::STATUS, std::move(s), 0, {}}; }
    static Reply error(std::string s) { return Reply{ReplyType::ERROR, std::move(s), 0, {}}; }
    static Reply integer_value(int64_t n) { return Reply{ReplyType::INTEGER, {}, n, {}}; }
    static Reply bulk(std::string s) { return Reply{ReplyType::BULK, std::move(s), 0, {}}; }
    static Reply nil() { return Reply{}; }
    static Reply array(std::vector<Reply> items) {
        return Reply{ReplyType::ARRAY, {}, 0, std::move(items)};
    }

    [[nodiscard]] bool is_error() const { return type == ReplyType::ERROR; }
    [[nodiscard]] bool is_nil() const { return type == ReplyType::NIL; }

    bool operator==(const Reply&) const = default;

    [[nodiscard]] std::string to_string() const {
        switch (type) {
            case ReplyType::STATUS: return str;
            case ReplyType::ERROR: return std::format("(error) {}", str);
            case ReplyType::INTEGER: return std::format("(integer) {}", integer);
            case ReplyType::BULK: return std::format("\"{}\"", str);
            case ReplyType::NIL: return "(nil)";
            case ReplyType::ARRAY: {
                std::string out = "[";
                for (size_t i = 0; i < elements.size(); ++i) {
                    if (i > 0) out += ", ";
                    out += elements[i].to_string();
                }
                out += "]";
                return out;
            }
        }
        return {};
    }
};

} // namespace kvconn
