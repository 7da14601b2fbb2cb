#pragma once
#include "channel.hpp"
#include "json_rpc.hpp"
#include "types.hpp"
#include "version.hpp"
#include "transport/transport.hpp"
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcphost {

class ProtocolClient;

/// A request in flight. Obtained from ProtocolClient::start_call(); must not
/// outlive the client that issued it. Dropping a call that is still pending
/// cancels it.
class PendingCall {
public:
    PendingCall(PendingCall&& other) noexcept;
    PendingCall& operator=(PendingCall&& other) noexcept;
    ~PendingCall();

    [[nodiscard]] int64_t id() const { return id_; }
    [[nodiscard]] const std::string& method() const { return method_; }

    /// Wait for the result. Throws TimeoutError (the entry is removed),
    /// RemoteToolError for an error response, RequestCancelled after
    /// cancel(), ConnectionStopped if the connection goes away.
    nlohmann::json wait(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Release the waiter with RequestCancelled and tell the server.
    /// Returns false if the call had already completed.
    bool cancel(const std::string& reason = "Cancelled by client");

private:
    friend class ProtocolClient;
    PendingCall(ProtocolClient* client, int64_t id, std::string method,
                std::future<JsonRpcResponse> response)
        : client_(client), id_(id), method_(std::move(method)), response_(std::move(response)) {}

    void abandon() noexcept;

    ProtocolClient* client_;
    int64_t id_;
    std::string method_;
    std::future<JsonRpcResponse> response_;
};

/// Request/response correlation and capability negotiation over one
/// transport. One reader thread demultiplexes inbound messages; any number
/// of threads may issue calls concurrently.
class ProtocolClient {
public:
    struct Options {
        std::string server_id;
        Implementation client_info{std::string(CLIENT_NAME), std::string(LIBRARY_VERSION)};
        nlohmann::json capabilities = nlohmann::json::object();
        std::chrono::milliseconds request_timeout{30000};
        std::chrono::milliseconds startup_timeout{10000};
    };

    struct Stats {
        uint64_t requests_sent = 0;
        uint64_t responses_received = 0;
        uint64_t error_responses = 0;
        uint64_t timeouts = 0;
        uint64_t cancelled = 0;
        uint64_t dropped_messages = 0;
    };

    /// Server notifications are forwarded to `events` when given.
    explicit ProtocolClient() : ProtocolClient(Options{}) {}
    explicit ProtocolClient(Options opts,
                            std::shared_ptr<Channel<ServerEvent>> events = nullptr);
    ~ProtocolClient();

    ProtocolClient(const ProtocolClient&) = delete;
    ProtocolClient& operator=(const ProtocolClient&) = delete;

    // ---- Connection ----

    /// Attach a transport and start its reader thread. `on_closed` runs on
    /// the reader thread when the peer closes the stream; it must not call
    /// disconnect().
    void connect(std::unique_ptr<ITransport> transport, CloseCallback on_closed = nullptr);

    /// Fail outstanding calls with ConnectionStopped, shut the transport
    /// down and join the reader.
    void disconnect();

    [[nodiscard]] bool is_connected() const;
    [[nodiscard]] bool is_initialized() const;

    // ---- Protocol ----

    /// Handshake bounded by the startup timeout. Throws ProtocolViolation
    /// for a malformed result and IncompatibleVersion for an unsupported
    /// protocol revision.
    InitializeResult initialize();

    /// Issue a request and block for its result.
    nlohmann::json call(const std::string& method,
                        const nlohmann::json& params = nlohmann::json::object(),
                        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Issue a request without waiting.
    [[nodiscard]] PendingCall start_call(const std::string& method,
                                         const nlohmann::json& params = nlohmann::json::object());

    void notify(const std::string& method,
                const nlohmann::json& params = nlohmann::json::object());

    size_t fail_all_pending(std::exception_ptr error);
    [[nodiscard]] size_t pending_count() const;

    // ---- Capability cache ----

    [[nodiscard]] CapabilitySnapshot snapshot() const;

    /// Cached lists, refetched (following pagination) when invalid.
    std::vector<ToolDescriptor> tools();
    std::vector<ResourceDescriptor> resources();

    void invalidate_tools();
    void invalidate_resources();

    [[nodiscard]] Stats stats() const;
    [[nodiscard]] const Options& options() const;

private:
    friend class PendingCall;

    nlohmann::json await_result(PendingCall& call, std::chrono::milliseconds timeout);
    bool cancel_request(int64_t id, const std::string& reason);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcphost
