#include <gtest/gtest.h>
#include "mcphost/connection.hpp"
#include "mcphost/error.hpp"
#include "mcphost/process.hpp"
#include <signal.h>
#include <chrono>
#include <thread>

using namespace mcphost;
using namespace std::chrono_literals;

// Runs the mock_mcp_server executable through the fork/exec launcher.

namespace {

ServerConnection::Options test_options() {
    ServerConnection::Options opts;
    opts.client.request_timeout = 5000ms;
    opts.client.startup_timeout = 5000ms;
    opts.supervisor.backoff.base = 10ms;
    opts.supervisor.backoff.cap = 50ms;
    opts.supervisor.shutdown_grace = 1000ms;
    return opts;
}

ServerDefinition mock_definition(const std::string& id = "mock") {
    ServerDefinition d;
    d.id = id;
    d.name = id;
    d.command = MCPHOST_MOCK_SERVER_PATH;
    d.args = {"--name", id};
    return d;
}

bool process_alive(int pid) {
    return ::kill(pid, 0) == 0;
}

} // namespace

TEST(RealProcess, StartCallStop) {
    ServerConnection conn(mock_definition(), test_options());
    conn.start();
    ASSERT_EQ(conn.state(), ConnectionState::Running);
    EXPECT_EQ(conn.capabilities().server_info.name, "mock");

    auto result = conn.call_tool("read_file", {{"path", "/etc/hostname"}});
    EXPECT_EQ(result.text(), "Mock file content for: /etc/hostname");

    EXPECT_TRUE(conn.listing().loaded);

    conn.stop();
    EXPECT_EQ(conn.state(), ConnectionState::Stopped);
}

TEST(RealProcess, StopReapsChild) {
    PosixProcessLauncher launcher;
    LaunchSpec spec;
    spec.command = MCPHOST_MOCK_SERVER_PATH;
    auto handle = launcher.launch(spec);
    int pid = handle->pid();
    EXPECT_GT(pid, 0);
    EXPECT_TRUE(handle->running());

    handle->terminate(1000ms);
    EXPECT_FALSE(handle->running());
    EXPECT_TRUE(handle->exit_status().has_value());
    EXPECT_FALSE(process_alive(pid));
}

TEST(RealProcess, EnvironmentAndWorkingDirectory) {
    auto def = mock_definition();
    def.env = {{"MCPHOST_TEST_VALUE", "from-definition"}};
    def.working_directory = "/";
    ServerConnection conn(def, test_options());
    conn.start();

    EXPECT_EQ(conn.call_tool("get_env", {{"name", "MCPHOST_TEST_VALUE"}}).text(), "from-definition");
    EXPECT_EQ(conn.call_tool("get_cwd").text(), "/");
}

TEST(RealProcess, UnknownCommandIsSpawnFailure) {
    auto def = mock_definition();
    def.command = "/nonexistent/mcp-server-binary";
    ServerConnection conn(def, test_options());
    EXPECT_THROW(conn.start(), SpawnFailure);
    EXPECT_EQ(conn.state(), ConnectionState::Stopped);
}

TEST(RealProcess, RejectedHandshakeEndsInError) {
    auto def = mock_definition();
    def.args.push_back("--fail-initialize");
    auto opts = test_options();
    opts.supervisor.max_restarts = 2;
    ServerConnection conn(def, opts);
    EXPECT_THROW(conn.start(), ProtocolViolation);
    EXPECT_EQ(conn.state(), ConnectionState::Error);
}

TEST(RealProcess, CrashIsRestarted) {
    ServerConnection conn(mock_definition(), test_options());
    conn.start();
    ASSERT_EQ(conn.status().restart_count, 0u);

    // The server exits before answering.
    EXPECT_THROW(conn.call_tool("crash"), ConnectionStopped);

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (std::chrono::steady_clock::now() < deadline) {
        if (conn.state() == ConnectionState::Running && conn.status().restart_count == 1) break;
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(conn.state(), ConnectionState::Running);
    EXPECT_EQ(conn.status().restart_count, 1u);
    EXPECT_EQ(conn.call_tool("read_file", {{"path", "x"}}).text(), "Mock file content for: x");
}

TEST(RealProcess, SlowServerHealthProbe) {
    auto def = mock_definition();
    def.args.insert(def.args.end(), {"--delay-ms", "100"});
    ServerConnection conn(def, test_options());
    conn.start();
    EXPECT_GE(conn.ping(), 100ms);
}
