#pragma once
#include "backoff.hpp"
#include "channel.hpp"
#include "process.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace mcphost {

struct SupervisorPolicy {
    bool auto_restart = true;
    uint32_t max_restarts = 5;          // consecutive failures before Error
    BackoffPolicy backoff;
    std::chrono::milliseconds shutdown_grace{2000};
    uint32_t error_budget = 3;          // consecutive failed health checks before Error
};

/// How the supervisor drives the protocol session of the process it owns.
struct SessionHooks {
    /// Bind the new process's transport; `on_closed` fires if the peer closes.
    std::function<void(std::unique_ptr<ITransport>, std::function<void()> on_closed)> attach;
    /// Perform the handshake; throws on failure.
    std::function<void()> handshake;
    /// Tear the session down, failing outstanding requests.
    std::function<void()> detach;
    /// Release blocked requests early so a pending stop is not held up.
    std::function<void()> abort;
};

/// Owns one server process and its lifecycle state machine:
///
///   Stopped -> Starting -> Running
///   Starting/Running -> Error           handshake failure, budget exhausted
///   Running -> Restarting -> Starting   unexpected exit with auto-restart
///   any -> Stopped                      stop()
///
/// Transitions are serialized; recovery from an unexpected exit runs on an
/// internal worker thread.
class ProcessSupervisor {
public:
    ProcessSupervisor(ServerDefinition def,
                      std::shared_ptr<ProcessLauncher> launcher,
                      SessionHooks hooks,
                      SupervisorPolicy policy = {},
                      std::shared_ptr<Channel<ServerEvent>> events = nullptr);
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    /// Launch and handshake. No-op when already Running. Throws
    /// MissingEnvironment/SpawnFailure with the state unchanged; throws the
    /// last handshake error once the connection has settled in Error.
    void start();

    /// Always ends in Stopped. Rethrows ProcessError if the process could
    /// not be terminated cleanly.
    void stop();

    void restart();

    [[nodiscard]] ConnectionState state() const;
    bool wait_for_state(ConnectionState target, std::chrono::milliseconds timeout) const;

    /// Feed a health-check outcome into the error budget. Reaching the
    /// budget while Running moves the connection to Error.
    void record_health_outcome(bool healthy, const std::optional<std::string>& error = std::nullopt);

    /// state, last error, uptime, restart count
    [[nodiscard]] ServerStatus status() const;

    [[nodiscard]] uint32_t consecutive_failures() const;
    [[nodiscard]] std::optional<int> pid() const;
    [[nodiscard]] const SupervisorPolicy& policy() const { return policy_; }
    [[nodiscard]] const ServerDefinition& definition() const { return def_; }

private:
    enum class RetryOutcome { Running, Exhausted, Aborted };

    void launch_and_handshake();
    RetryOutcome retry_loop(uint64_t epoch);
    void stop_locked(std::exception_ptr* process_error);
    void teardown_locked(std::exception_ptr* process_error);
    void set_state(ConnectionState s);
    void set_last_error(const std::string& msg);
    void on_process_closed(uint64_t generation);
    void worker_loop();
    void handle_unexpected_exit(uint64_t generation);

    const ServerDefinition def_;
    std::shared_ptr<ProcessLauncher> launcher_;
    SessionHooks hooks_;
    const SupervisorPolicy policy_;
    std::shared_ptr<Channel<ServerEvent>> events_;
    Backoff backoff_;

    // Guarded by transition_mutex_.
    std::mutex transition_mutex_;
    std::unique_ptr<ProcessHandle> process_;
    std::exception_ptr last_failure_;

    mutable std::mutex state_mutex_;
    mutable std::condition_variable state_cv_;
    std::condition_variable backoff_cv_;
    std::condition_variable worker_cv_;
    ConnectionState state_ = ConnectionState::Stopped;
    std::optional<std::string> last_error_;
    std::chrono::steady_clock::time_point started_at_;
    uint32_t consecutive_failures_ = 0;
    uint32_t health_failures_ = 0;
    uint32_t restart_count_ = 0;
    uint64_t launch_generation_ = 0;
    uint64_t exited_generation_ = 0;
    uint64_t handled_generation_ = 0;
    uint32_t pending_stops_ = 0;    // stop() calls requested but not finished
    std::optional<int> pid_;
    bool shutdown_ = false;

    std::atomic<uint64_t> epoch_{0};
    std::thread worker_;
};

} // namespace mcphost
