#include "connection/webdis_connection.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <httplib.h>

#include <algorithm>
#include <chrono>
#include <format>

namespace kvconn {

namespace {

constexpr const char* kContentType = "text/plain";

std::chrono::milliseconds to_millis(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

} // anonymous namespace

WebdisConnection::WebdisConnection(ConnectionParameters parameters)
    : ConnectionBase(std::move(parameters)) {
    require_scheme({"http"});
}

WebdisConnection::~WebdisConnection() {
    close_transport();
}

bool WebdisConnection::is_disabled(std::string_view command_id) {
    const std::string upper = utils::to_upper(command_id);
    return std::ranges::find(webdis::DISABLED_COMMANDS, upper) != std::end(webdis::DISABLED_COMMANDS);
}

std::string WebdisConnection::command_path(const RawCommand& command) {
    std::string path = command.id();
    for (const auto& arg : command.arguments()) {
        path += '/';
        path += utils::url_encode(arg);
    }
    return path;
}

// ============================================================================
// Transport
// ============================================================================

void WebdisConnection::open_transport() {
    const auto& endpoint = parameters();

    auto client = std::make_unique<httplib::Client>(std::format("http://{}", endpoint.address()));
    client->set_connection_timeout(to_millis(endpoint.timeout));
    if (endpoint.read_write_timeout) {
        client->set_read_timeout(to_millis(*endpoint.read_write_timeout));
        client->set_write_timeout(to_millis(*endpoint.read_write_timeout));
    }

    const auto user = endpoint.get(webdis::HTTP_USER);
    const auto pass = endpoint.get(webdis::HTTP_PASS);
    if (user && pass && !user->empty()) {
        client->set_basic_auth(*user, *pass);
    }

    client_ = std::move(client);
}

void WebdisConnection::close_transport() {
    client_.reset();
}

Reply WebdisConnection::send_and_receive(const RawCommand& command) {
    if (is_disabled(command.id())) {
        throw ConnectionError(std::format("Command '{}' is disabled by the Webdis gateway", command.id()),
                              ErrorCategory::NOT_SUPPORTED);
    }

    auto res = client_->Post("/", command_path(command), kContentType);
    if (!res) {
        throw ConnectionError(std::format("HTTP request to {} failed: {}",
                                          id(), httplib::to_string(res.error())));
    }
    if (res->status != 200) {
        throw ConnectionError(std::format("HTTP request to {} returned status {}", id(), res->status));
    }
    return parse_response(command.id(), res->body);
}

// ============================================================================
// Response mapping
// ============================================================================

Reply WebdisConnection::parse_response(const std::string& command_id, const std::string& body) {
    const auto root = nlohmann::json::parse(body, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        throw ConnectionError(std::format("Invalid JSON response for {}", command_id),
                              ErrorCategory::PROTOCOL_ERROR);
    }

    const auto it = root.find(utils::to_upper(command_id));
    if (it == root.end()) {
        throw ConnectionError(std::format("Response does not contain key '{}'", command_id),
                              ErrorCategory::PROTOCOL_ERROR);
    }

    // Status replies come back as [true, "OK"] and errors as [false, "ERR ..."]
    const auto& value = *it;
    if (value.is_array() && value.size() == 2 && value[0].is_boolean() && value[1].is_string()) {
        const auto message = value[1].get<std::string>();
        return value[0].get<bool>() ? Reply::status(message) : Reply::error(message);
    }
    return json_to_reply(value);
}

Reply WebdisConnection::json_to_reply(const nlohmann::json& value) {
    if (value.is_null()) {
        return Reply::nil();
    }
    if (value.is_string()) {
        return Reply::bulk(value.get<std::string>());
    }
    if (value.is_number_integer()) {
        return Reply::integer_value(value.get<int64_t>());
    }
    if (value.is_boolean()) {
        return Reply::integer_value(value.get<bool>() ? 1 : 0);
    }
    if (value.is_number_float()) {
        return Reply::bulk(value.dump());
    }
    if (value.is_array()) {
        std::vector<Reply> items;
        items.reserve(value.size());
        for (const auto& item : value) {
            items.push_back(json_to_reply(item));
        }
        return Reply::array(std::move(items));
    }

    // Hash replies arrive as objects; flatten to [field, value, ...]
    std::vector<Reply> items;
    items.reserve(value.size() * 2);
    for (const auto& [key, item] : value.items()) {
        items.push_back(Reply::bulk(key));
        items.push_back(json_to_reply(item));
    }
    return Reply::array(std::move(items));
}

} // namespace kvconn
