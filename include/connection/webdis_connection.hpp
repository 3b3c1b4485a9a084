#pragma once

#include "connection/connection_base.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace httplib {
class Client;
}

namespace kvconn {

namespace webdis {
    // Commands the gateway refuses to proxy
    inline constexpr std::string_view DISABLED_COMMANDS[] = {
        "AUTH", "SELECT", "MULTI", "EXEC", "WATCH", "UNWATCH", "DISCARD", "MONITOR"
    };

    inline constexpr std::string_view HTTP_USER = "user";
    inline constexpr std::string_view HTTP_PASS = "pass";
}

/**
 * @brief HTTP-bridged connection through a Webdis gateway ("http" scheme)
 *
 * Every command is POSTed as "CMD/arg1/arg2" (arguments URL-encoded) and the
 * JSON body {"CMD": value} is mapped to a Reply. There is no persistent
 * session: connect() only prepares the HTTP client and then flushes the
 * connect-command queue. The gateway rejects session-scoped commands, so a
 * queued AUTH or SELECT makes connect() fail with NOT_SUPPORTED; use the
 * `user`/`pass` parameters for HTTP basic auth instead.
 */
class WebdisConnection : public ConnectionBase {
public:
    /**
     * @throws ConnectionError (INVALID_ARGUMENT) for a scheme other than http
     */
    explicit WebdisConnection(ConnectionParameters parameters);

    ~WebdisConnection() override;

    WebdisConnection(const WebdisConnection&) = delete;
    WebdisConnection& operator=(const WebdisConnection&) = delete;

    /** @brief Body sent for a command: "CMD/arg1/arg2" */
    [[nodiscard]] static std::string command_path(const RawCommand& command);

    /**
     * @brief Map a gateway response body to a Reply
     * @throws ConnectionError (PROTOCOL_ERROR) if the body is not the expected JSON
     */
    [[nodiscard]] static Reply parse_response(const std::string& command_id, const std::string& body);

    [[nodiscard]] static bool is_disabled(std::string_view command_id);

protected:
    void open_transport() override;
    void close_transport() override;
    [[nodiscard]] bool transport_open() const override { return client_ != nullptr; }
    Reply send_and_receive(const RawCommand& command) override;

private:
    [[nodiscard]] static Reply json_to_reply(const nlohmann::json& value);

    std::unique_ptr<httplib::Client> client_;
};

} // namespace kvconn
