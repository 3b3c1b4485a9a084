#include "protocol/resp.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace kvconn {

// ============================================================================
// RespWriter
// ============================================================================

std::string RespWriter::encode(const RawCommand& command) {
    const auto& args = command.arguments();

    size_t estimate = 16 + command.id().size();
    for (const auto& arg : args) {
        estimate += arg.size() + 16;
    }

    std::string out;
    out.reserve(estimate);
    out += std::format("{}{}{}", resp::TYPE_ARRAY, args.size() + 1, resp::CRLF);
    out += std::format("{}{}{}{}{}", resp::TYPE_BULK, command.id().size(), resp::CRLF,
                       command.id(), resp::CRLF);
    for (const auto& arg : args) {
        out += std::format("{}{}{}", resp::TYPE_BULK, arg.size(), resp::CRLF);
        out += arg;
        out += resp::CRLF;
    }
    return out;
}

// ============================================================================
// RespReader
// ============================================================================

void RespReader::feed(std::string_view data) {
    // Compact once the consumed prefix dominates the buffer
    if (consumed_ > 0 && consumed_ * 2 > buffer_.size()) {
        buffer_.erase(0, consumed_);
        consumed_ = 0;
    }
    buffer_.append(data);
}

std::optional<Reply> RespReader::next() {
    size_t pos = consumed_;
    auto reply = parse(pos, 0);
    if (reply) {
        consumed_ = pos;
        if (consumed_ == buffer_.size()) {
            reset();
        }
    }
    return reply;
}

std::optional<std::string_view> RespReader::read_line(size_t& pos) const {
    const size_t end = buffer_.find(resp::CRLF, pos);
    if (end == std::string::npos) {
        return std::nullopt;
    }
    std::string_view line(buffer_.data() + pos, end - pos);
    pos = end + resp::CRLF.size();
    return line;
}

int64_t RespReader::parse_length(std::string_view line) const {
    const auto value = utils::try_parse_int<int64_t>(line);
    if (!value) {
        throw ConnectionError(std::format("Protocol error: invalid length '{}'", line),
                              ErrorCategory::PROTOCOL_ERROR);
    }
    return *value;
}

std::optional<Reply> RespReader::parse(size_t& pos, int depth) const {
    if (depth > resp::MAX_DEPTH) {
        throw ConnectionError("Protocol error: reply nesting too deep", ErrorCategory::PROTOCOL_ERROR);
    }
    if (pos >= buffer_.size()) {
        return std::nullopt;
    }

    size_t cursor = pos;
    const char type = buffer_[cursor++];
    const auto line = read_line(cursor);
    if (!line) {
        return std::nullopt;
    }

    switch (type) {
        case resp::TYPE_STATUS:
            pos = cursor;
            return Reply::status(std::string(*line));

        case resp::TYPE_ERROR:
            pos = cursor;
            return Reply::error(std::string(*line));

        case resp::TYPE_INTEGER:
            pos = cursor;
            return Reply::integer_value(parse_length(*line));

        case resp::TYPE_BULK: {
            const int64_t length = parse_length(*line);
            if (length == -1) {
                pos = cursor;
                return Reply::nil();
            }
            if (length < 0 || length > resp::MAX_BULK_LENGTH) {
                throw ConnectionError(std::format("Protocol error: invalid bulk length {}", length),
                                      ErrorCategory::PROTOCOL_ERROR);
            }
            const auto size = static_cast<size_t>(length);
            if (buffer_.size() < cursor + size + resp::CRLF.size()) {
                return std::nullopt;
            }
            if (buffer_.compare(cursor + size, resp::CRLF.size(), resp::CRLF) != 0) {
                throw ConnectionError("Protocol error: bulk string not terminated by CRLF",
                                      ErrorCategory::PROTOCOL_ERROR);
            }
            std::string value = buffer_.substr(cursor, size);
            pos = cursor + size + resp::CRLF.size();
            return Reply::bulk(std::move(value));
        }

        case resp::TYPE_ARRAY: {
            const int64_t count = parse_length(*line);
            if (count == -1) {
                pos = cursor;
                return Reply::nil();
            }
            if (count < 0) {
                throw ConnectionError(std::format("Protocol error: invalid array length {}", count),
                                      ErrorCategory::PROTOCOL_ERROR);
            }
            std::vector<Reply> items;
            items.reserve(static_cast<size_t>(std::min<int64_t>(count, 1024)));
            for (int64_t i = 0; i < count; ++i) {
                auto item = parse(cursor, depth + 1);
                if (!item) {
                    return std::nullopt;
                }
                items.push_back(std::move(*item));
            }
            pos = cursor;
            return Reply::array(std::move(items));
        }

        default:
            throw ConnectionError(
                std::format("Protocol error: unknown reply type byte 0x{:02x}",
                            static_cast<unsigned int>(static_cast<unsigned char>(type))),
                ErrorCategory::PROTOCOL_ERROR);
    }
}

} // namespace kvconn
