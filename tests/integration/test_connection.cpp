#include <gtest/gtest.h>
#include "mcphost/connection.hpp"
#include "mcphost/error.hpp"
#include "../support/fake_server.hpp"
#include <chrono>
#include <thread>

using namespace mcphost;
using namespace mcphost::testing;
using namespace std::chrono_literals;

namespace {

ServerConnection::Options test_options() {
    ServerConnection::Options opts;
    opts.client.request_timeout = 3000ms;
    opts.client.startup_timeout = 3000ms;
    opts.supervisor.backoff.base = 1ms;
    opts.supervisor.backoff.cap = 5ms;
    opts.supervisor.shutdown_grace = 100ms;
    return opts;
}

ServerDefinition filesystem_definition() {
    ServerDefinition d;
    d.id = "filesystem";
    d.name = "filesystem";
    d.command = "mcp-server-filesystem";
    d.capabilities.tools = true;
    d.capabilities.resources = true;
    return d;
}

HandlerResult noop(const nlohmann::json&) {
    return text_result("ok");
}

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // namespace

// ---- Tools and security ----

TEST(ServerConnection, FilesystemReadAndWrite) {
    auto cfg = filesystem_config();
    cfg.tools[1].descriptor["annotations"] = {{"destructiveHint", true}};
    auto launcher = std::make_shared<FakeLauncher>(cfg);
    ServerConnection conn(filesystem_definition(), test_options(), launcher);
    conn.start();
    ASSERT_EQ(conn.state(), ConnectionState::Running);

    auto read = conn.call_tool("read_file", {{"path", "/tmp/test.txt"}});
    EXPECT_EQ(read.text(), "Mock file content for: /tmp/test.txt");
    EXPECT_FALSE(read.is_error);

    nlohmann::json args = {{"path", "/tmp/out.txt"}, {"content", "hello"}};
    try {
        conn.call_tool("write_file", args);
        FAIL() << "expected ConfirmationRequired";
    } catch (const ConfirmationRequired& e) {
        EXPECT_EQ(e.tool, "write_file");
        EXPECT_EQ(e.required, SecurityLevel::System);
    }
    EXPECT_THROW(conn.call_tool("write_file", args, Confirmation{SecurityLevel::Workspace}),
                 ConfirmationRequired);
    EXPECT_EQ(launcher->last_server()->request_count("tools/call"), 1u);

    auto wrote = conn.call_tool("write_file", args, Confirmation{SecurityLevel::System});
    EXPECT_EQ(wrote.text(), "Wrote 5 bytes to /tmp/out.txt");
}

TEST(ServerConnection, SecurityLevelPrecedence) {
    auto def = filesystem_definition();
    def.default_security_level = SecurityLevel::Workspace;
    def.tool_security["pinned"] = SecurityLevel::Safe;
    ServerConnection conn(def, test_options(), std::make_shared<FakeLauncher>());

    ToolDescriptor plain;
    plain.name = "plain";
    EXPECT_EQ(conn.security_level_for(plain), SecurityLevel::Workspace);

    ToolDescriptor read_only;
    read_only.name = "look";
    read_only.annotations = nlohmann::json{{"readOnlyHint", true}, {"openWorldHint", true}};
    EXPECT_EQ(conn.security_level_for(read_only), SecurityLevel::Safe);

    ToolDescriptor destructive;
    destructive.name = "rm";
    destructive.annotations = nlohmann::json{{"destructiveHint", true}};
    EXPECT_EQ(conn.security_level_for(destructive), SecurityLevel::System);

    ToolDescriptor open_world;
    open_world.name = "fetch";
    open_world.annotations = nlohmann::json{{"openWorldHint", true}};
    EXPECT_EQ(conn.security_level_for(open_world), SecurityLevel::Network);

    ToolDescriptor pinned;
    pinned.name = "pinned";
    pinned.annotations = nlohmann::json{{"destructiveHint", true}};
    EXPECT_EQ(conn.security_level_for(pinned), SecurityLevel::Safe);
}

TEST(ServerConnection, ListToolsAppliesLevels) {
    FakeServerConfig cfg;
    cfg.tools.push_back(make_tool("search", "", noop, nlohmann::json{{"readOnlyHint", true}}));
    cfg.tools.push_back(make_tool("deploy", "", noop, nlohmann::json{{"openWorldHint", true}}));
    ServerConnection conn(filesystem_definition(), test_options(), std::make_shared<FakeLauncher>(cfg));
    conn.start();

    auto tools = conn.list_tools();
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].security_level, SecurityLevel::Safe);
    EXPECT_EQ(tools[1].security_level, SecurityLevel::Network);
}

TEST(ServerConnection, UnknownToolIsRemoteError) {
    ServerConnection conn(filesystem_definition(), test_options(),
                          std::make_shared<FakeLauncher>(filesystem_config()));
    conn.start();
    EXPECT_THROW(conn.call_tool("does_not_exist"), RemoteToolError);

    auto status = conn.status();
    EXPECT_EQ(status.request_count, 1u);
    EXPECT_EQ(status.error_count, 1u);
}

TEST(ServerConnection, ToolLevelErrorIsAResult) {
    FakeServerConfig cfg;
    cfg.tools.push_back(make_tool("flaky", "", [](const nlohmann::json&) -> HandlerResult {
        auto r = text_result("disk full");
        r["isError"] = true;
        return r;
    }));
    ServerConnection conn(filesystem_definition(), test_options(), std::make_shared<FakeLauncher>(cfg));
    conn.start();
    auto result = conn.call_tool("flaky");
    EXPECT_TRUE(result.is_error);
    EXPECT_EQ(result.text(), "disk full");
}

TEST(ServerConnection, CallsRequireRunning) {
    ServerConnection conn(filesystem_definition(), test_options(),
                          std::make_shared<FakeLauncher>(filesystem_config()));
    EXPECT_THROW(conn.list_tools(), ConnectionStopped);
    EXPECT_THROW(conn.ping(), ConnectionStopped);
    EXPECT_THROW(conn.read_resource("file:///workspace/README.md"), ConnectionStopped);
}

TEST(ServerConnection, CapabilitiesPrefetched) {
    auto launcher = std::make_shared<FakeLauncher>(filesystem_config());
    ServerConnection conn(filesystem_definition(), test_options(), launcher);
    conn.start();

    auto caps = conn.capabilities();
    EXPECT_EQ(caps.server_info.name, "filesystem");
    EXPECT_TRUE(caps.tools_valid);
    EXPECT_TRUE(caps.resources_valid);
    EXPECT_EQ(caps.tools.size(), 2u);
    EXPECT_EQ(launcher->last_server()->request_count("tools/list"), 1u);
}

// ---- Resources ----

TEST(ServerConnection, ReadResource) {
    ServerConnection conn(filesystem_definition(), test_options(),
                          std::make_shared<FakeLauncher>(filesystem_config()));
    conn.start();

    auto resources = conn.list_resources();
    ASSERT_EQ(resources.size(), 1u);
    auto contents = conn.read_resource(resources[0].uri);
    ASSERT_EQ(contents.size(), 1u);
    EXPECT_EQ(contents[0].text, "# Workspace\n");
    EXPECT_EQ(contents[0].mime_type, "text/markdown");
}

TEST(ServerConnection, ReadMissingResource) {
    ServerConnection conn(filesystem_definition(), test_options(),
                          std::make_shared<FakeLauncher>(filesystem_config()));
    conn.start();
    try {
        conn.read_resource("file:///nope");
        FAIL() << "expected ResourceNotFound";
    } catch (const ResourceNotFound& e) {
        EXPECT_EQ(e.uri, "file:///nope");
    }
}

TEST(ServerConnection, EmptyResourceContentIsNotFound) {
    FakeServerConfig cfg;
    FakeResource empty;
    empty.descriptor = {"mem://empty", "empty", std::nullopt, std::nullopt};
    cfg.resources.push_back(empty);
    ServerConnection conn(filesystem_definition(), test_options(), std::make_shared<FakeLauncher>(cfg));
    conn.start();
    EXPECT_THROW(conn.read_resource("mem://empty"), ResourceNotFound);
}

TEST(ServerConnection, SubscribeAndUpdates) {
    auto launcher = std::make_shared<FakeLauncher>(filesystem_config());
    ServerConnection conn(filesystem_definition(), test_options(), launcher);
    conn.start();
    while (conn.events().try_pop()) {}

    const std::string uri = "file:///workspace/README.md";
    conn.subscribe(uri);
    EXPECT_EQ(launcher->last_server()->subscriptions().count(uri), 1u);

    launcher->last_server()->notify("notifications/resources/updated", {{"uri", uri}});
    auto ev = conn.events().pop(3000ms);
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->kind, ServerEvent::Kind::ResourceUpdated);
    EXPECT_EQ(ev->server_id, "filesystem");
    EXPECT_EQ(ev->uri, uri);

    conn.unsubscribe(uri);
    EXPECT_TRUE(launcher->last_server()->subscriptions().empty());
}

// ---- Health and lifecycle ----

TEST(ServerConnection, PingMeasuresRoundTrip) {
    FakeServerConfig cfg;
    cfg.ping_delay = 50ms;
    ServerConnection conn(filesystem_definition(), test_options(), std::make_shared<FakeLauncher>(cfg));
    conn.start();
    EXPECT_GE(conn.ping(), 50ms);
}

TEST(ServerConnection, ListingReflectsState) {
    ServerConnection conn(filesystem_definition(), test_options(), std::make_shared<FakeLauncher>());
    EXPECT_FALSE(conn.listing().loaded);
    EXPECT_EQ(conn.listing().type, "mcp-server");
    conn.start();
    EXPECT_TRUE(conn.listing().loaded);
    conn.stop();
    EXPECT_FALSE(conn.listing().loaded);
}

TEST(ServerConnection, CrashIsRestarted) {
    auto launcher = std::make_shared<FakeLauncher>(filesystem_config());
    ServerConnection conn(filesystem_definition(), test_options(), launcher);
    conn.start();

    launcher->last_server()->close();
    ASSERT_TRUE(eventually([&] {
        return launcher->launch_count() == 2 && conn.state() == ConnectionState::Running;
    }));
    EXPECT_EQ(conn.status().restart_count, 1u);
    EXPECT_EQ(conn.call_tool("read_file", {{"path", "/a"}}).text(), "Mock file content for: /a");
}

TEST(ServerConnection, CrashWithoutAutoRestartIsError) {
    auto opts = test_options();
    opts.supervisor.auto_restart = false;
    auto launcher = std::make_shared<FakeLauncher>();
    ServerConnection conn(filesystem_definition(), opts, launcher);
    conn.start();

    launcher->last_server()->close();
    ASSERT_TRUE(conn.wait_for_state(ConnectionState::Error, 3000ms));
    EXPECT_EQ(launcher->launch_count(), 1u);
    EXPECT_EQ(conn.status().last_error, "Process exited unexpectedly");
}

TEST(ServerConnection, CrashDuringCallReleasesCaller) {
    FakeServerConfig cfg;
    cfg.unanswered_methods = {"tools/call"};
    cfg.tools.push_back(make_tool("hang", "", noop));
    auto launcher = std::make_shared<FakeLauncher>(cfg);
    auto opts = test_options();
    opts.supervisor.auto_restart = false;
    ServerConnection conn(filesystem_definition(), opts, launcher);
    conn.start();

    std::thread killer([&]() {
        std::this_thread::sleep_for(50ms);
        launcher->last_server()->close();
    });
    EXPECT_THROW(conn.call_tool("hang"), ConnectionStopped);
    killer.join();
}

TEST(ServerConnection, StopDuringCallReleasesCaller) {
    FakeServerConfig cfg;
    cfg.unanswered_methods = {"tools/call"};
    cfg.tools.push_back(make_tool("hang", "", noop));
    ServerConnection conn(filesystem_definition(), test_options(), std::make_shared<FakeLauncher>(cfg));
    conn.start();

    std::thread stopper([&]() {
        std::this_thread::sleep_for(50ms);
        conn.stop();
    });
    EXPECT_THROW(conn.call_tool("hang"), ConnectionStopped);
    stopper.join();
    EXPECT_EQ(conn.state(), ConnectionState::Stopped);
}

TEST(ServerConnection, StateChangesAreEvents) {
    ServerConnection conn(filesystem_definition(), test_options(), std::make_shared<FakeLauncher>());
    conn.start();
    conn.stop();

    std::vector<ConnectionState> states;
    while (auto ev = conn.events().try_pop()) {
        if (ev->kind == ServerEvent::Kind::StateChanged) states.push_back(*ev->state);
    }
    EXPECT_EQ(states, (std::vector<ConnectionState>{ConnectionState::Starting,
                                                    ConnectionState::Running,
                                                    ConnectionState::Stopped}));
}
