#include "mcphost/protocol_client.hpp"
#include "mcphost/error.hpp"
#include "mcphost/log.hpp"
#include "mcphost/pending_requests.hpp"
#include "mcphost/router.hpp"

#include <atomic>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <thread>

namespace mcphost {

namespace {

LogLevel map_server_log_level(const std::string& level) {
    if (level == "debug") return LogLevel::Debug;
    if (level == "info" || level == "notice") return LogLevel::Info;
    if (level == "warning") return LogLevel::Warn;
    if (level == "error" || level == "critical" || level == "alert" || level == "emergency") {
        return LogLevel::Error;
    }
    return LogLevel::Info;
}

} // anonymous namespace

struct ProtocolClient::Impl {
    Options opts;
    std::shared_ptr<Channel<ServerEvent>> events;
    PendingRequests pending;
    Router router;

    std::mutex transport_mutex;
    std::shared_ptr<ITransport> transport;
    std::thread reader_thread;
    std::atomic<bool> connected{false};
    std::atomic<bool> initialized{false};

    mutable std::shared_mutex snapshot_mutex;
    CapabilitySnapshot snap;
    uint64_t tools_generation = 0;
    uint64_t resources_generation = 0;
    std::mutex refresh_mutex;

    std::atomic<uint64_t> requests_sent{0};
    std::atomic<uint64_t> responses_received{0};
    std::atomic<uint64_t> error_responses{0};
    std::atomic<uint64_t> timeouts{0};
    std::atomic<uint64_t> cancelled{0};
    std::atomic<uint64_t> dropped_messages{0};

    Impl(Options o, std::shared_ptr<Channel<ServerEvent>> ev)
        : opts(std::move(o)), events(std::move(ev)) {
        setup_handlers();
    }

    std::shared_ptr<ITransport> current_transport() {
        std::lock_guard<std::mutex> lock(transport_mutex);
        return transport;
    }

    void emit(ServerEvent ev) {
        if (!events) return;
        ev.server_id = opts.server_id;
        events->push(std::move(ev));
    }

    void invalidate_tools() {
        std::unique_lock<std::shared_mutex> lock(snapshot_mutex);
        snap.tools_valid = false;
        ++tools_generation;
    }

    void invalidate_resources() {
        std::unique_lock<std::shared_mutex> lock(snapshot_mutex);
        snap.resources_valid = false;
        ++resources_generation;
    }

    void setup_handlers() {
        router.on_notification("notifications/tools/list_changed", [this](const nlohmann::json&) {
            MCPHOST_LOG_DEBUG("[", opts.server_id, "] tool list changed");
            invalidate_tools();
            emit(ServerEvent{ServerEvent::Kind::ToolsChanged, {}, {}, {}, {}, {}});
        });
        router.on_notification("notifications/resources/list_changed", [this](const nlohmann::json&) {
            MCPHOST_LOG_DEBUG("[", opts.server_id, "] resource list changed");
            invalidate_resources();
            emit(ServerEvent{ServerEvent::Kind::ResourcesChanged, {}, {}, {}, {}, {}});
        });
        router.on_notification("notifications/resources/updated", [this](const nlohmann::json& params) {
            ServerEvent ev{ServerEvent::Kind::ResourceUpdated, {}, {}, {}, {}, {}};
            ev.uri = params.value("uri", "");
            emit(std::move(ev));
        });
        router.on_notification("notifications/message", [this](const nlohmann::json& params) {
            std::string level = params.value("level", "info");
            nlohmann::json data = params.contains("data") ? params.at("data") : nlohmann::json();
            MCPHOST_LOG(map_server_log_level(level), "[", opts.server_id, "] ",
                        data.is_string() ? data.get<std::string>() : data.dump());
            ServerEvent ev{ServerEvent::Kind::Log, {}, {}, {}, {}, {}};
            ev.level = level;
            ev.data = std::move(data);
            emit(std::move(ev));
        });
        router.on_notification("notifications/cancelled", [this](const nlohmann::json& params) {
            MCPHOST_LOG_DEBUG("[", opts.server_id, "] server cancelled request ",
                              params.value("requestId", nlohmann::json()).dump());
        });
        router.on_request("ping", [](const nlohmann::json&) -> HandlerResult {
            return nlohmann::json::object();
        });
    }

    void on_message(JsonRpcMessage msg) {
        if (auto* resp = std::get_if<JsonRpcResponse>(&msg)) {
            RequestId id = resp->id;
            if (pending.complete(id, std::move(*resp))) {
                ++responses_received;
            } else {
                ++dropped_messages;
                MCPHOST_LOG_WARN("[", opts.server_id, "] dropping response with unknown id ",
                                 to_string(id));
            }
            return;
        }

        auto response = router.dispatch(msg);
        if (!response) return;
        auto t = current_transport();
        if (!t) return;
        try {
            t->send(*response);
        } catch (const TransportError& e) {
            MCPHOST_LOG_DEBUG("[", opts.server_id, "] could not answer server request: ", e.what());
        }
    }

    void on_error(std::exception_ptr ep) {
        ++dropped_messages;
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            MCPHOST_LOG_WARN("[", opts.server_id, "] dropping inbound message: ", e.what());
        }
    }

    void send(const JsonRpcMessage& msg) {
        auto t = current_transport();
        if (!t || !connected) throw ConnectionStopped("Not connected to server '" + opts.server_id + "'");
        try {
            t->send(msg);
        } catch (const TransportError& e) {
            throw ConnectionStopped("Connection to server '" + opts.server_id + "' closed: " + e.what());
        }
    }

    template <typename T>
    std::vector<T> fetch_all(const std::string& method, const char* key) {
        std::vector<T> items;
        std::set<std::string> seen_cursors;
        std::optional<std::string> cursor;
        do {
            nlohmann::json params = nlohmann::json::object();
            if (cursor) params["cursor"] = *cursor;
            nlohmann::json result = call_blocking(method, params, opts.request_timeout);

            if (!result.is_object() || !result.contains(key) || !result.at(key).is_array()) {
                throw ProtocolViolation(method + " result is missing '" + key + "' array");
            }
            try {
                for (const auto& item : result.at(key)) items.push_back(item.get<T>());
            } catch (const nlohmann::json::exception& e) {
                throw ProtocolViolation(method + " returned a malformed entry: " + e.what());
            }

            cursor.reset();
            if (result.contains("nextCursor") && result.at("nextCursor").is_string()) {
                cursor = result.at("nextCursor").get<std::string>();
                if (!seen_cursors.insert(*cursor).second) {
                    throw ProtocolViolation(method + " repeated pagination cursor " + *cursor);
                }
            }
        } while (cursor);
        return items;
    }

    nlohmann::json call_blocking(const std::string& method, const nlohmann::json& params,
                                 std::chrono::milliseconds timeout);

    ProtocolClient* owner = nullptr;
};

// ---------- PendingCall ----------

PendingCall::PendingCall(PendingCall&& other) noexcept
    : client_(other.client_),
      id_(other.id_),
      method_(std::move(other.method_)),
      response_(std::move(other.response_)) {
    other.client_ = nullptr;
}

PendingCall& PendingCall::operator=(PendingCall&& other) noexcept {
    if (this != &other) {
        abandon();
        client_ = other.client_;
        id_ = other.id_;
        method_ = std::move(other.method_);
        response_ = std::move(other.response_);
        other.client_ = nullptr;
    }
    return *this;
}

PendingCall::~PendingCall() {
    abandon();
}

void PendingCall::abandon() noexcept {
    // A consumed future means wait() already saw the outcome.
    if (!client_ || !response_.valid()) return;
    try {
        client_->cancel_request(id_, "Request abandoned by caller");
    } catch (const std::exception& e) {
        MCPHOST_LOG_WARN("request ", method_, " id=", id_, " abandoned: ", e.what());
    }
    client_ = nullptr;
}

nlohmann::json PendingCall::wait(std::optional<std::chrono::milliseconds> timeout) {
    return client_->await_result(*this, timeout ? *timeout : client_->options().request_timeout);
}

bool PendingCall::cancel(const std::string& reason) {
    return client_->cancel_request(id_, reason);
}

// ---------- ProtocolClient ----------

ProtocolClient::ProtocolClient(Options opts, std::shared_ptr<Channel<ServerEvent>> events)
    : impl_(std::make_unique<Impl>(std::move(opts), std::move(events))) {
    impl_->owner = this;
}

ProtocolClient::~ProtocolClient() {
    disconnect();
}

void ProtocolClient::connect(std::unique_ptr<ITransport> transport, CloseCallback on_closed) {
    disconnect();

    std::shared_ptr<ITransport> t(std::move(transport));
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = t;
    }
    impl_->invalidate_tools();
    impl_->invalidate_resources();
    impl_->initialized = false;
    impl_->connected = true;

    Impl* impl = impl_.get();
    impl_->reader_thread = std::thread([impl, t, on_closed = std::move(on_closed)]() {
        t->start(
            [impl](JsonRpcMessage msg) { impl->on_message(std::move(msg)); },
            [impl](std::exception_ptr ep) { impl->on_error(ep); },
            [impl, &on_closed]() {
                impl->connected = false;
                impl->initialized = false;
                size_t failed = impl->pending.fail_all(std::make_exception_ptr(
                    ConnectionStopped("Server '" + impl->opts.server_id + "' closed the connection")));
                MCPHOST_LOG_DEBUG("[", impl->opts.server_id, "] peer closed, failed ", failed,
                                  " pending request(s)");
                if (on_closed) on_closed();
            });
        impl->connected = false;
    });
}

void ProtocolClient::disconnect() {
    std::shared_ptr<ITransport> t;
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        t = impl_->transport;
    }
    impl_->connected = false;
    impl_->initialized = false;
    impl_->pending.fail_all(std::make_exception_ptr(
        ConnectionStopped("Connection to server '" + impl_->opts.server_id + "' stopped")));

    if (t) t->shutdown();
    if (impl_->reader_thread.joinable()) {
        if (impl_->reader_thread.get_id() == std::this_thread::get_id()) {
            impl_->reader_thread.detach();
        } else {
            impl_->reader_thread.join();
        }
    }
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        if (impl_->transport == t) impl_->transport.reset();
    }
}

bool ProtocolClient::is_connected() const {
    return impl_->connected;
}

bool ProtocolClient::is_initialized() const {
    return impl_->initialized;
}

InitializeResult ProtocolClient::initialize() {
    nlohmann::json params = {
        {"protocolVersion", std::string(PROTOCOL_VERSION)},
        {"clientInfo", impl_->opts.client_info},
        {"capabilities", impl_->opts.capabilities}
    };

    nlohmann::json result;
    try {
        result = impl_->call_blocking("initialize", params, impl_->opts.startup_timeout);
    } catch (const RemoteToolError& e) {
        throw ProtocolViolation("Server '" + impl_->opts.server_id + "' rejected initialize: " + e.what());
    }

    if (!result.is_object()) {
        throw ProtocolViolation("initialize result is not an object");
    }
    if (!result.contains("protocolVersion") || !result.at("protocolVersion").is_string()) {
        throw ProtocolViolation("initialize result is missing protocolVersion");
    }
    if (!result.contains("serverInfo") || !result.at("serverInfo").is_object()
        || !result.at("serverInfo").contains("name")
        || !result.at("serverInfo").at("name").is_string()) {
        throw ProtocolViolation("initialize result is missing serverInfo");
    }

    InitializeResult init;
    init.protocol_version = result.at("protocolVersion").get<std::string>();
    init.server_info.name = result.at("serverInfo").at("name").get<std::string>();
    init.server_info.version = result.at("serverInfo").value("version", "");
    init.capabilities = result.value("capabilities", nlohmann::json::object());
    if (result.contains("instructions") && result.at("instructions").is_string()) {
        init.instructions = result.at("instructions").get<std::string>();
    }

    if (!is_supported_protocol_version(init.protocol_version)) {
        throw IncompatibleVersion(init.protocol_version);
    }

    {
        std::unique_lock<std::shared_mutex> lock(impl_->snapshot_mutex);
        impl_->snap = CapabilitySnapshot{};
        impl_->snap.protocol_version = init.protocol_version;
        impl_->snap.server_info = init.server_info;
        impl_->snap.server_capabilities = init.capabilities;
        ++impl_->tools_generation;
        ++impl_->resources_generation;
    }

    notify("notifications/initialized");
    impl_->initialized = true;
    MCPHOST_LOG_INFO("[", impl_->opts.server_id, "] initialized ", init.server_info.name, " ",
                     init.server_info.version, " (protocol ", init.protocol_version, ")");
    return init;
}

nlohmann::json ProtocolClient::Impl::call_blocking(const std::string& method,
                                                   const nlohmann::json& params,
                                                   std::chrono::milliseconds timeout) {
    PendingCall pc = owner->start_call(method, params);
    return owner->await_result(pc, timeout);
}

nlohmann::json ProtocolClient::call(const std::string& method, const nlohmann::json& params,
                                    std::optional<std::chrono::milliseconds> timeout) {
    return impl_->call_blocking(method, params, timeout ? *timeout : impl_->opts.request_timeout);
}

PendingCall ProtocolClient::start_call(const std::string& method, const nlohmann::json& params) {
    if (!impl_->connected) {
        throw ConnectionStopped("Not connected to server '" + impl_->opts.server_id + "'");
    }
    auto ticket = impl_->pending.register_request(method);

    JsonRpcRequest req;
    req.id = RequestId{ticket.id};
    req.method = method;
    req.params = params;
    try {
        impl_->send(req);
    } catch (...) {
        impl_->pending.remove(ticket.id);
        throw;
    }
    ++impl_->requests_sent;
    MCPHOST_LOG_TRACE("[", impl_->opts.server_id, "] -> ", method, " id=", ticket.id);
    return PendingCall(this, ticket.id, method, std::move(ticket.response));
}

nlohmann::json ProtocolClient::await_result(PendingCall& call, std::chrono::milliseconds timeout) {
    if (call.response_.wait_for(timeout) == std::future_status::timeout) {
        // A response may race the timeout; only the side that removes the
        // entry decides the outcome.
        if (impl_->pending.remove(call.id_)) {
            ++impl_->timeouts;
            MCPHOST_LOG_WARN("[", impl_->opts.server_id, "] request ", call.method_, " id=",
                             call.id_, " timed out after ", timeout.count(), "ms");
            try {
                notify("notifications/cancelled",
                       {{"requestId", call.id_}, {"reason", "Request timed out"}});
            } catch (const ConnectionStopped& e) {
                MCPHOST_LOG_DEBUG("[", impl_->opts.server_id, "] cancel not delivered: ", e.what());
            }
            throw TimeoutError("Request timed out: " + call.method_ + " after "
                               + std::to_string(timeout.count()) + "ms");
        }
    }

    JsonRpcResponse resp = call.response_.get();
    if (resp.error) {
        ++impl_->error_responses;
        throw RemoteToolError(resp.error->code, resp.error->message, resp.error->data);
    }
    return resp.result ? std::move(*resp.result) : nlohmann::json::object();
}

bool ProtocolClient::cancel_request(int64_t id, const std::string& reason) {
    if (!impl_->pending.fail(id, std::make_exception_ptr(RequestCancelled(reason)))) {
        return false;
    }
    ++impl_->cancelled;
    try {
        notify("notifications/cancelled", {{"requestId", id}, {"reason", reason}});
    } catch (const ConnectionStopped& e) {
        MCPHOST_LOG_DEBUG("[", impl_->opts.server_id, "] cancel not delivered: ", e.what());
    }
    return true;
}

void ProtocolClient::notify(const std::string& method, const nlohmann::json& params) {
    JsonRpcNotification n;
    n.method = method;
    n.params = params;
    impl_->send(n);
}

size_t ProtocolClient::fail_all_pending(std::exception_ptr error) {
    return impl_->pending.fail_all(std::move(error));
}

size_t ProtocolClient::pending_count() const {
    return impl_->pending.size();
}

CapabilitySnapshot ProtocolClient::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(impl_->snapshot_mutex);
    return impl_->snap;
}

std::vector<ToolDescriptor> ProtocolClient::tools() {
    {
        std::shared_lock<std::shared_mutex> lock(impl_->snapshot_mutex);
        if (impl_->snap.tools_valid) return impl_->snap.tools;
    }
    std::lock_guard<std::mutex> refresh(impl_->refresh_mutex);
    uint64_t generation;
    {
        std::shared_lock<std::shared_mutex> lock(impl_->snapshot_mutex);
        if (impl_->snap.tools_valid) return impl_->snap.tools;
        generation = impl_->tools_generation;
    }

    auto fetched = impl_->fetch_all<ToolDescriptor>("tools/list", "tools");
    {
        std::unique_lock<std::shared_mutex> lock(impl_->snapshot_mutex);
        // A list-changed notice during the fetch leaves the cache invalid.
        if (impl_->tools_generation == generation) {
            impl_->snap.tools = fetched;
            impl_->snap.tools_valid = true;
        }
    }
    return fetched;
}

std::vector<ResourceDescriptor> ProtocolClient::resources() {
    {
        std::shared_lock<std::shared_mutex> lock(impl_->snapshot_mutex);
        if (impl_->snap.resources_valid) return impl_->snap.resources;
    }
    std::lock_guard<std::mutex> refresh(impl_->refresh_mutex);
    uint64_t generation;
    {
        std::shared_lock<std::shared_mutex> lock(impl_->snapshot_mutex);
        if (impl_->snap.resources_valid) return impl_->snap.resources;
        generation = impl_->resources_generation;
    }

    auto fetched = impl_->fetch_all<ResourceDescriptor>("resources/list", "resources");
    {
        std::unique_lock<std::shared_mutex> lock(impl_->snapshot_mutex);
        if (impl_->resources_generation == generation) {
            impl_->snap.resources = fetched;
            impl_->snap.resources_valid = true;
        }
    }
    return fetched;
}

void ProtocolClient::invalidate_tools() {
    impl_->invalidate_tools();
}

void ProtocolClient::invalidate_resources() {
    impl_->invalidate_resources();
}

ProtocolClient::Stats ProtocolClient::stats() const {
    Stats s;
    s.requests_sent = impl_->requests_sent;
    s.responses_received = impl_->responses_received;
    s.error_responses = impl_->error_responses;
    s.timeouts = impl_->timeouts;
    s.cancelled = impl_->cancelled;
    s.dropped_messages = impl_->dropped_messages;
    return s;
}

const ProtocolClient::Options& ProtocolClient::options() const {
    return impl_->opts;
}

} // namespace mcphost
