#pragma once

#include "connection/raw_command.hpp"
#include "protocol/reply.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace kvconn {

// RESP (REdis Serialization Protocol) type markers
namespace resp {

constexpr char TYPE_STATUS = '+';
constexpr char TYPE_ERROR = '-';
constexpr char TYPE_INTEGER = ':';
constexpr char TYPE_BULK = '$';
constexpr char TYPE_ARRAY = '*';

constexpr std::string_view CRLF = "\r\n";

// Upper bound on a single bulk string, matching the server's proto-max-bulk-len default
constexpr int64_t MAX_BULK_LENGTH = 512LL * 1024 * 1024;

// Nesting limit for array replies
constexpr int MAX_DEPTH = 32;

} // namespace resp

// Encoder for client requests
class RespWriter {
public:
    /**
     * @brief Encode a command as a RESP array of bulk strings
     *
     * ["SELECT", "3"] -> "*2\r\n$6\r\nSELECT\r\n$1\r\n3\r\n"
     */
    [[nodiscard]] static std::string encode(const RawCommand& command);
};

/**
 * @brief Incremental reply decoder
 *
 * Bytes arrive in arbitrary chunks via feed(); next() yields a reply once a
 * complete one is buffered and leaves partial data in place.
 */
class RespReader {
public:
    void feed(std::string_view data);

    /**
     * @brief Pop the next complete reply
     * @return Reply, or nullopt if more bytes are needed
     * @throws ConnectionError (PROTOCOL_ERROR) on malformed input
     */
    [[nodiscard]] std::optional<Reply> next();

    [[nodiscard]] size_t buffered() const { return buffer_.size() - consumed_; }

    void reset() {
        buffer_.clear();
        consumed_ = 0;
    }

private:
    // Parses one reply starting at pos; advances pos past it on success.
    [[nodiscard]] std::optional<Reply> parse(size_t& pos, int depth) const;

    // Reads a CRLF-terminated line starting at pos.
    [[nodiscard]] std::optional<std::string_view> read_line(size_t& pos) const;

    [[nodiscard]] int64_t parse_length(std::string_view line) const;

    std::string buffer_;
    size_t consumed_ = 0;
};

} // namespace kvconn
