#pragma once
#include "mcphost/process.hpp"
#include "mcphost/router.hpp"
#include "mcphost/transport/stdio_transport.hpp"
#include "mcphost/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace mcphost::testing {

using ToolHandler = std::function<HandlerResult(const nlohmann::json& arguments)>;

struct FakeTool {
    nlohmann::json descriptor;
    ToolHandler handler;
};

struct FakeResource {
    ResourceDescriptor descriptor;
    std::optional<std::string> text;
    std::optional<std::string> blob;
};

/// Behaviour of a scripted server.
struct FakeServerConfig {
    std::string name = "fake-server";
    std::string version = "1.0.0-mock";
    std::string protocol_version = "2024-11-05";

    bool fail_initialize = false;
    bool omit_protocol_version = false;
    bool omit_server_info = false;

    std::chrono::milliseconds initialize_delay{0};
    std::chrono::milliseconds ping_delay{0};
    std::chrono::milliseconds response_delay{0};

    std::set<std::string> unanswered_methods;   // never respond to these
    size_t page_size = 0;                       // 0 disables pagination

    std::vector<FakeTool> tools;
    std::vector<FakeResource> resources;

    /// Seen for every inbound request before it is handled.
    std::function<void(const std::string& method)> on_request;
};

FakeTool make_tool(const std::string& name, const std::string& description, ToolHandler handler,
                   std::optional<nlohmann::json> annotations = std::nullopt);

/// read_file / write_file tools and one text resource.
FakeServerConfig filesystem_config();

nlohmann::json text_result(const std::string& text);

/// Scripted protocol server on a pair of descriptors. Each request is
/// handled on its own thread so responses may complete out of order.
class FakeServer {
public:
    FakeServer(FakeServerConfig cfg, int read_fd, int write_fd);
    ~FakeServer();

    FakeServer(const FakeServer&) = delete;
    FakeServer& operator=(const FakeServer&) = delete;

    /// Serve on a background thread.
    void start();

    /// Serve on the calling thread until the peer closes the stream.
    void serve();

    /// Simulates process exit: stop serving and close both descriptors.
    void close();
    [[nodiscard]] bool closed() const { return closed_; }

    void notify(const std::string& method, const nlohmann::json& params = nlohmann::json::object());

    [[nodiscard]] std::vector<std::string> received_methods() const;
    [[nodiscard]] size_t request_count(const std::string& method) const;
    [[nodiscard]] std::vector<nlohmann::json> cancellations() const;
    [[nodiscard]] std::set<std::string> subscriptions() const;

private:
    void setup_handlers();
    void on_message(JsonRpcMessage msg);
    bool pause(std::chrono::milliseconds d);
    nlohmann::json page(const std::vector<nlohmann::json>& items, const nlohmann::json& params,
                        const char* key) const;

    FakeServerConfig cfg_;
    Router router_;
    std::unique_ptr<StdioTransport> transport_;
    std::thread serve_thread_;
    std::atomic<bool> closed_{false};

    std::mutex workers_mutex_;
    std::vector<std::thread> workers_;

    mutable std::mutex state_mutex_;
    std::condition_variable stop_cv_;
    bool stopping_ = false;
    std::vector<std::string> received_;
    std::vector<nlohmann::json> cancellations_;
    std::set<std::string> subscriptions_;
};

/// ProcessLauncher that runs a FakeServer in-process per launch.
class FakeLauncher : public ProcessLauncher {
public:
    explicit FakeLauncher(FakeServerConfig cfg = {});

    std::unique_ptr<ProcessHandle> launch(const LaunchSpec& spec) override;

    void set_config(FakeServerConfig cfg);
    void set_fail_spawn(bool fail) { fail_spawn_ = fail; }
    void set_fail_terminate(bool fail) { fail_terminate_ = fail; }

    [[nodiscard]] size_t launch_count() const;
    [[nodiscard]] std::shared_ptr<FakeServer> last_server() const;
    [[nodiscard]] std::optional<LaunchSpec> last_spec() const;

private:
    mutable std::mutex mutex_;
    FakeServerConfig cfg_;
    std::vector<std::shared_ptr<FakeServer>> servers_;
    std::optional<LaunchSpec> last_spec_;
    std::atomic<bool> fail_spawn_{false};
    std::atomic<bool> fail_terminate_{false};
    int next_pid_ = 40000;
};

/// Two pipes: the client reads what the server writes and vice versa.
struct PipePair {
    int client_read = -1;
    int client_write = -1;
    int server_read = -1;
    int server_write = -1;
};

PipePair make_pipe_pair();

} // namespace mcphost::testing
