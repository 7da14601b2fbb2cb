#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace mcphost {

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params)>;
using NotificationHandler = std::function<void(const nlohmann::json& params)>;

/// Dispatches server-initiated requests and notifications. Responses to the
/// host's own requests never pass through here.
class Router {
public:
    void on_request(const std::string& method, RequestHandler handler);
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Returns the response to send for a request (MethodNotFound when no
    /// handler is registered), nothing for notifications and responses.
    [[nodiscard]] std::optional<JsonRpcMessage> dispatch(const JsonRpcMessage& msg);

    [[nodiscard]] bool has_handler(const std::string& method) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
};

} // namespace mcphost
