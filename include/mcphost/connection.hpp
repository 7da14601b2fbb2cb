#pragma once
#include "channel.hpp"
#include "protocol_client.hpp"
#include "supervisor.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mcphost {

/// One addressable server: a supervised process plus the protocol session
/// running over its stdio. The capability set is fixed: lifecycle, tools,
/// resources, subscriptions and ping.
class ServerConnection {
public:
    struct Options {
        ProtocolClient::Options client;
        SupervisorPolicy supervisor;
        bool prefetch_capabilities = true;
    };

    explicit ServerConnection(ServerDefinition def)
        : ServerConnection(std::move(def), Options{}) {}
    explicit ServerConnection(ServerDefinition def, Options opts,
                              std::shared_ptr<ProcessLauncher> launcher = nullptr);
    ~ServerConnection();

    ServerConnection(const ServerConnection&) = delete;
    ServerConnection& operator=(const ServerConnection&) = delete;

    [[nodiscard]] const ServerDefinition& definition() const { return def_; }
    [[nodiscard]] const std::string& id() const { return def_.id; }

    // ---- Lifecycle ----
    void start();
    void stop();
    void restart();
    [[nodiscard]] ConnectionState state() const;
    bool wait_for_state(ConnectionState target, std::chrono::milliseconds timeout) const;

    // ---- Tools ----

    /// Cached tool catalog with host-side security levels applied.
    std::vector<ToolDescriptor> list_tools();

    /// Throws ConfirmationRequired when the tool's level is above Safe and
    /// `confirmation` does not cover it; RemoteToolError when the server
    /// answers with an error.
    ToolResult call_tool(const std::string& name,
                         const nlohmann::json& arguments = nlohmann::json::object(),
                         std::optional<Confirmation> confirmation = std::nullopt);

    /// Per-definition override, then annotation hints, then the definition
    /// default.
    [[nodiscard]] SecurityLevel security_level_for(const ToolDescriptor& tool) const;

    // ---- Resources ----
    std::vector<ResourceDescriptor> list_resources();

    /// Throws ResourceNotFound when the server returns no text or binary content.
    std::vector<ResourceContent> read_resource(const std::string& uri);
    void subscribe(const std::string& uri);
    void unsubscribe(const std::string& uri);

    // ---- Health ----

    /// Round trip of a protocol ping on the established session.
    std::chrono::milliseconds ping(std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    void record_health_outcome(bool healthy, const std::optional<std::string>& error = std::nullopt);

    // ---- Observation ----
    [[nodiscard]] ServerStatus status() const;
    [[nodiscard]] CapabilitySnapshot capabilities() const;
    [[nodiscard]] ServerListing listing() const;

    /// Notifications and state changes, in arrival order. Closed when the
    /// connection is destroyed.
    Channel<ServerEvent>& events() { return *events_; }

    ProtocolClient& client() { return client_; }

private:
    void ensure_running() const;
    nlohmann::json request(const std::string& method, const nlohmann::json& params,
                           std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    void handshake();

    const ServerDefinition def_;
    const Options opts_;
    std::shared_ptr<Channel<ServerEvent>> events_;
    std::atomic<uint64_t> request_count_{0};
    std::atomic<uint64_t> error_count_{0};
    ProtocolClient client_;
    ProcessSupervisor supervisor_;   // declared last: stopped before the client goes away
};

} // namespace mcphost
