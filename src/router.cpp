#include "mcphost/router.hpp"
#include "mcphost/error.hpp"
#include "mcphost/log.hpp"

namespace mcphost {

void Router::on_request(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    notification_handlers_[method] = std::move(handler);
}

bool Router::has_handler(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

std::optional<JsonRpcMessage> Router::dispatch(const JsonRpcMessage& msg) {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        RequestHandler handler;
        nlohmann::json params = req->params ? *req->params : nlohmann::json::object();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = request_handlers_.find(req->method);
            if (it == request_handlers_.end()) {
                return make_error_response(req->id, error::MethodNotFound,
                                           "Method not found: " + req->method);
            }
            handler = it->second;
        }
        // Handlers run unlocked so they may register further handlers.
        try {
            auto result = handler(params);
            if (auto* ok = std::get_if<nlohmann::json>(&result)) {
                return make_result_response(req->id, std::move(*ok));
            }
            JsonRpcResponse resp;
            resp.id = req->id;
            resp.error = std::get<JsonRpcError>(result);
            return resp;
        } catch (const std::exception& e) {
            return make_error_response(req->id, error::InternalError, e.what());
        }
    }

    if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        NotificationHandler handler;
        nlohmann::json params = notif->params ? *notif->params : nlohmann::json::object();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = notification_handlers_.find(notif->method);
            if (it == notification_handlers_.end()) {
                MCPHOST_LOG_DEBUG("Ignoring notification ", notif->method);
                return std::nullopt;
            }
            handler = it->second;
        }
        try {
            handler(params);
        } catch (const std::exception& e) {
            MCPHOST_LOG_WARN("Notification handler for ", notif->method, " failed: ", e.what());
        }
    }

    return std::nullopt;
}

} // namespace mcphost
