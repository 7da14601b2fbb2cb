#include <gtest/gtest.h>
#include "mcphost/registry.hpp"
#include "mcphost/error.hpp"
#include "../support/fake_server.hpp"
#include <atomic>
#include <chrono>
#include <set>
#include <thread>

using namespace mcphost;
using namespace mcphost::testing;
using namespace std::chrono_literals;

namespace {

ServerConnection::Options connection_options() {
    ServerConnection::Options opts;
    opts.client.request_timeout = 3000ms;
    opts.client.startup_timeout = 3000ms;
    opts.supervisor.backoff.base = 1ms;
    opts.supervisor.backoff.cap = 5ms;
    opts.supervisor.shutdown_grace = 100ms;
    return opts;
}

Registry::Options registry_options(std::shared_ptr<FakeLauncher> launcher) {
    Registry::Options opts;
    opts.connection = connection_options();
    opts.launcher = std::move(launcher);
    return opts;
}

ServerDefinition make_definition(const std::string& id, bool auto_start = false) {
    ServerDefinition d;
    d.id = id;
    d.name = id;
    d.command = "mcp-server-" + id;
    d.auto_start = auto_start;
    return d;
}

} // namespace

// ---- Membership ----

TEST(Registry, RegisterAndGet) {
    Registry registry(registry_options(std::make_shared<FakeLauncher>()));
    auto handle = registry.register_server(make_definition("git"));
    EXPECT_EQ(handle.id(), "git");
    EXPECT_TRUE(handle.valid());
    EXPECT_TRUE(registry.contains("git"));
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.get("git")->state(), ConnectionState::Stopped);
    EXPECT_EQ(registry.get("git")->definition().command, "mcp-server-git");
}

TEST(Registry, DuplicateIdRejected) {
    Registry registry(registry_options(std::make_shared<FakeLauncher>()));
    registry.register_server(make_definition("git"));
    try {
        registry.register_server(make_definition("git"));
        FAIL() << "expected DuplicateId";
    } catch (const DuplicateId& e) {
        EXPECT_EQ(e.id, "git");
    }
    EXPECT_EQ(registry.size(), 1u);
}

TEST(Registry, MismatchedIdRejected) {
    Registry registry(registry_options(std::make_shared<FakeLauncher>()));
    EXPECT_THROW(registry.register_server("other", make_definition("git")), ConfigError);
    EXPECT_THROW(registry.register_server("", make_definition("")), ConfigError);
}

TEST(Registry, ExplicitIdFillsDefinition) {
    Registry registry(registry_options(std::make_shared<FakeLauncher>()));
    auto def = make_definition("");
    registry.register_server("named-later", def);
    EXPECT_EQ(registry.get("named-later")->id(), "named-later");
}

TEST(Registry, UnknownIdIsNotFound) {
    Registry registry(registry_options(std::make_shared<FakeLauncher>()));
    EXPECT_THROW(registry.get("nope"), NotFound);
    EXPECT_THROW(registry.unregister_server("nope"), NotFound);
    EXPECT_THROW(registry.start("nope"), NotFound);
    EXPECT_THROW(registry.stop("nope"), NotFound);
}

TEST(Registry, ConcurrentRegistrationOfSameId) {
    Registry registry(registry_options(std::make_shared<FakeLauncher>()));
    std::atomic<int> registered{0};
    std::atomic<int> duplicates{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&]() {
            try {
                registry.register_server(make_definition("shared"));
                ++registered;
            } catch (const DuplicateId&) {
                ++duplicates;
            }
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(registered, 1);
    EXPECT_EQ(duplicates, 15);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(Registry, UnregisterStopsAndInvalidatesHandle) {
    auto launcher = std::make_shared<FakeLauncher>();
    Registry registry(registry_options(launcher));
    auto handle = registry.register_server(make_definition("git"));
    registry.start("git");
    ASSERT_EQ(handle->state(), ConnectionState::Running);
    auto server = launcher->last_server();

    registry.unregister_server("git");
    EXPECT_TRUE(server->closed());
    EXPECT_FALSE(registry.contains("git"));
    EXPECT_FALSE(handle.valid());
    EXPECT_THROW(handle->state(), NotFound);
}

TEST(Registry, UnregisterSurvivesFailedStop) {
    auto bad = std::make_shared<FakeLauncher>();
    bad->set_fail_terminate(true);
    Registry registry(registry_options(std::make_shared<FakeLauncher>()));
    auto conn = std::make_shared<ServerConnection>(make_definition("bad"), connection_options(), bad);
    registry.register_server("bad", conn->definition(), conn);
    registry.start("bad");

    EXPECT_NO_THROW(registry.unregister_server("bad"));
    EXPECT_FALSE(registry.contains("bad"));
    EXPECT_EQ(conn->state(), ConnectionState::Stopped);
}

TEST(Registry, ListAndStatus) {
    Registry registry(registry_options(std::make_shared<FakeLauncher>()));
    registry.register_server(make_definition("a"));
    registry.register_server(make_definition("b"));
    registry.start("a");

    auto listing = registry.list();
    ASSERT_EQ(listing.size(), 2u);
    for (const auto& l : listing) {
        EXPECT_EQ(l.type, "mcp-server");
        EXPECT_EQ(l.loaded, l.id == "a");
    }

    auto status = registry.health_status();
    EXPECT_EQ(status.at("a").state, ConnectionState::Running);
    EXPECT_EQ(status.at("b").state, ConnectionState::Stopped);

    auto ids = registry.ids();
    EXPECT_EQ(std::set<std::string>(ids.begin(), ids.end()), (std::set<std::string>{"a", "b"}));
    EXPECT_EQ(registry.handles().size(), 2u);
}

// ---- Bulk lifecycle ----

TEST(Registry, StartAutoStartServers) {
    auto launcher = std::make_shared<FakeLauncher>();
    Registry registry(registry_options(launcher));
    registry.register_server(make_definition("a", true));
    registry.register_server(make_definition("b", false));
    auto disabled = make_definition("c", true);
    disabled.enabled = false;
    registry.register_server(disabled);

    auto result = registry.start_auto_start_servers();
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.succeeded, std::vector<std::string>{"a"});
    EXPECT_EQ(registry.get("a")->state(), ConnectionState::Running);
    EXPECT_EQ(registry.get("b")->state(), ConnectionState::Stopped);
    EXPECT_EQ(registry.get("c")->state(), ConnectionState::Stopped);
    EXPECT_EQ(launcher->launch_count(), 1u);

    // Running servers are left alone.
    result = registry.start_auto_start_servers();
    EXPECT_TRUE(result.succeeded.empty());
    EXPECT_EQ(launcher->launch_count(), 1u);
}

TEST(Registry, AutoStartCollectsFailures) {
    Registry registry(registry_options(std::make_shared<FakeLauncher>()));
    auto needs_env = make_definition("github", true);
    needs_env.required_env = {"MCPHOST_TEST_SURELY_UNSET_TOKEN"};
    registry.register_server(needs_env);
    registry.register_server(make_definition("git", true));

    auto result = registry.start_auto_start_servers();
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].id, "github");
    EXPECT_NE(result.failures[0].message.find("MCPHOST_TEST_SURELY_UNSET_TOKEN"), std::string::npos);
    EXPECT_EQ(result.succeeded, std::vector<std::string>{"git"});
    EXPECT_EQ(registry.get("github")->state(), ConnectionState::Stopped);
    EXPECT_EQ(registry.get("git")->state(), ConnectionState::Running);
}

TEST(Registry, StopAllCollectsFailures) {
    auto good = std::make_shared<FakeLauncher>();
    auto bad = std::make_shared<FakeLauncher>();
    bad->set_fail_terminate(true);

    Registry registry(registry_options(good));
    registry.register_server(make_definition("a"));
    auto conn = std::make_shared<ServerConnection>(make_definition("b"), connection_options(), bad);
    registry.register_server("b", conn->definition(), conn);
    registry.register_server(make_definition("idle"));
    registry.start("a");
    registry.start("b");

    auto result = registry.stop_all();
    EXPECT_EQ(result.succeeded, std::vector<std::string>{"a"});
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].id, "b");
    EXPECT_EQ(registry.get("a")->state(), ConnectionState::Stopped);
    EXPECT_EQ(registry.get("b")->state(), ConnectionState::Stopped);
}

TEST(Registry, DestructionStopsServers) {
    auto launcher = std::make_shared<FakeLauncher>();
    std::shared_ptr<FakeServer> server;
    {
        Registry registry(registry_options(launcher));
        registry.register_server(make_definition("a", true));
        registry.start_auto_start_servers();
        server = launcher->last_server();
        ASSERT_FALSE(server->closed());
    }
    EXPECT_TRUE(server->closed());
}
