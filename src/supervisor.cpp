#include "mcphost/supervisor.hpp"
#include "mcphost/config.hpp"
#include "mcphost/error.hpp"
#include "mcphost/log.hpp"

namespace mcphost {

ProcessSupervisor::ProcessSupervisor(ServerDefinition def,
                                     std::shared_ptr<ProcessLauncher> launcher,
                                     SessionHooks hooks,
                                     SupervisorPolicy policy,
                                     std::shared_ptr<Channel<ServerEvent>> events)
    : def_(std::move(def)),
      launcher_(std::move(launcher)),
      hooks_(std::move(hooks)),
      policy_(policy),
      events_(std::move(events)),
      backoff_(policy.backoff) {
    if (!launcher_) launcher_ = std::make_shared<PosixProcessLauncher>();
    worker_ = std::thread([this]() { worker_loop(); });
}

ProcessSupervisor::~ProcessSupervisor() {
    try {
        stop();
    } catch (const HostError& e) {
        MCPHOST_LOG_ERROR("[", def_.id, "] stop during shutdown failed: ", e.what());
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        shutdown_ = true;
    }
    worker_cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

// ---------- Public transitions ----------

void ProcessSupervisor::start() {
    std::lock_guard<std::mutex> transition(transition_mutex_);
    if (state() == ConnectionState::Running) return;

    const uint64_t epoch = epoch_.load();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        consecutive_failures_ = 0;
        health_failures_ = 0;
    }

    try {
        launch_and_handshake();
        return;
    } catch (const SpawnFailure& e) {
        set_last_error(e.what());
        MCPHOST_LOG_ERROR("[", def_.id, "] ", e.what());
        throw;
    } catch (const std::exception& e) {
        set_last_error(e.what());
        last_failure_ = std::current_exception();
        MCPHOST_LOG_WARN("[", def_.id, "] handshake failed: ", e.what());
    }

    if (epoch_.load() != epoch) {
        throw ConnectionStopped("Start of server '" + def_.id + "' was interrupted by stop()");
    }

    bool exhausted;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ++consecutive_failures_;
        exhausted = !policy_.auto_restart || consecutive_failures_ >= policy_.max_restarts;
    }
    if (exhausted) {
        set_state(ConnectionState::Error);
        std::rethrow_exception(last_failure_);
    }

    switch (retry_loop(epoch)) {
        case RetryOutcome::Running:
            return;
        case RetryOutcome::Aborted:
            throw ConnectionStopped("Start of server '" + def_.id + "' was interrupted by stop()");
        case RetryOutcome::Exhausted:
            break;
    }
    std::rethrow_exception(last_failure_);
}

void ProcessSupervisor::stop() {
    // Interrupt a recovery in progress before queueing for the lock.
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ++epoch_;
        ++pending_stops_;
    }
    backoff_cv_.notify_all();
    if (hooks_.abort) hooks_.abort();

    std::exception_ptr process_error;
    {
        std::lock_guard<std::mutex> transition(transition_mutex_);
        stop_locked(&process_error);
        std::lock_guard<std::mutex> lock(state_mutex_);
        --pending_stops_;
    }
    if (process_error) std::rethrow_exception(process_error);
}

void ProcessSupervisor::stop_locked(std::exception_ptr* process_error) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ++launch_generation_;
        if (state_ == ConnectionState::Stopped && !process_) return;
    }
    teardown_locked(process_error);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        consecutive_failures_ = 0;
        health_failures_ = 0;
    }
    set_state(ConnectionState::Stopped);
    MCPHOST_LOG_INFO("[", def_.id, "] stopped");
}

void ProcessSupervisor::restart() {
    stop();
    start();
}

// ---------- Internals ----------

void ProcessSupervisor::launch_and_handshake() {
    auto missing = missing_environment(def_);
    if (!missing.empty()) throw MissingEnvironment(std::move(missing));

    LaunchSpec spec{def_.command, def_.args, def_.env, def_.working_directory};
    auto handle = launcher_->launch(spec);

    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        generation = ++launch_generation_;
        pid_ = handle->pid();
    }
    set_state(ConnectionState::Starting);
    MCPHOST_LOG_INFO("[", def_.id, "] started '", def_.command, "' (pid ", handle->pid(), ")");

    try {
        hooks_.attach(handle->take_transport(), [this, generation]() {
            on_process_closed(generation);
        });
        hooks_.handshake();
    } catch (const std::exception&) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            ++launch_generation_;
            pid_.reset();
        }
        hooks_.detach();
        try {
            handle->terminate(policy_.shutdown_grace);
        } catch (const ProcessError& e) {
            MCPHOST_LOG_ERROR("[", def_.id, "] ", e.what());
        }
        throw;
    }

    process_ = std::move(handle);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        started_at_ = std::chrono::steady_clock::now();
        last_error_.reset();
    }
    set_state(ConnectionState::Running);
}

ProcessSupervisor::RetryOutcome ProcessSupervisor::retry_loop(uint64_t epoch) {
    while (true) {
        set_state(ConnectionState::Restarting);

        uint32_t attempt;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            attempt = consecutive_failures_ == 0 ? 0 : consecutive_failures_ - 1;
        }
        auto delay = backoff_.next(attempt);
        MCPHOST_LOG_INFO("[", def_.id, "] restarting in ", delay.count(), "ms");
        {
            std::unique_lock<std::mutex> lock(state_mutex_);
            backoff_cv_.wait_for(lock, delay, [&] { return epoch_.load() != epoch; });
        }
        if (epoch_.load() != epoch) return RetryOutcome::Aborted;

        try {
            launch_and_handshake();
            std::lock_guard<std::mutex> lock(state_mutex_);
            ++restart_count_;
            return RetryOutcome::Running;
        } catch (const std::exception& e) {
            set_last_error(e.what());
            last_failure_ = std::current_exception();
            MCPHOST_LOG_WARN("[", def_.id, "] restart attempt failed: ", e.what());
        }

        if (epoch_.load() != epoch) return RetryOutcome::Aborted;

        bool exhausted;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            ++consecutive_failures_;
            exhausted = consecutive_failures_ >= policy_.max_restarts;
        }
        if (exhausted) {
            MCPHOST_LOG_ERROR("[", def_.id, "] giving up after ", policy_.max_restarts,
                              " consecutive failures");
            set_state(ConnectionState::Error);
            return RetryOutcome::Exhausted;
        }
    }
}

void ProcessSupervisor::teardown_locked(std::exception_ptr* process_error) {
    hooks_.detach();
    if (!process_) return;
    try {
        process_->terminate(policy_.shutdown_grace);
    } catch (const ProcessError& e) {
        MCPHOST_LOG_ERROR("[", def_.id, "] ", e.what());
        if (process_error) *process_error = std::current_exception();
    }
    process_.reset();
    std::lock_guard<std::mutex> lock(state_mutex_);
    pid_.reset();
}

void ProcessSupervisor::set_state(ConnectionState s) {
    ConnectionState previous;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        previous = state_;
        state_ = s;
    }
    state_cv_.notify_all();
    if (previous == s) return;

    MCPHOST_LOG_DEBUG("[", def_.id, "] ", to_string(previous), " -> ", to_string(s));
    if (events_) {
        ServerEvent ev{ServerEvent::Kind::StateChanged, def_.id, {}, {}, {}, s};
        events_->push(std::move(ev));
    }
}

void ProcessSupervisor::set_last_error(const std::string& msg) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_error_ = msg;
}

void ProcessSupervisor::on_process_closed(uint64_t generation) {
    // Runs on the transport reader thread: record and hand off only.
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (generation != launch_generation_) return;
        exited_generation_ = generation;
    }
    worker_cv_.notify_all();
}

void ProcessSupervisor::worker_loop() {
    std::unique_lock<std::mutex> lock(state_mutex_);
    while (true) {
        worker_cv_.wait(lock, [this] {
            return shutdown_ || exited_generation_ != handled_generation_;
        });
        if (shutdown_) return;
        uint64_t generation = exited_generation_;
        handled_generation_ = generation;
        lock.unlock();
        handle_unexpected_exit(generation);
        lock.lock();
    }
}

void ProcessSupervisor::handle_unexpected_exit(uint64_t generation) {
    std::lock_guard<std::mutex> transition(transition_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (generation != launch_generation_ || state_ != ConnectionState::Running) return;
        ++launch_generation_;
    }
    const uint64_t epoch = epoch_.load();

    teardown_locked(nullptr);

    bool exhausted;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        // A stop() queued behind this recovery finishes the teardown.
        if (pending_stops_ > 0) return;
        last_error_ = "Process exited unexpectedly";
        ++consecutive_failures_;
        exhausted = consecutive_failures_ >= policy_.max_restarts;
    }
    MCPHOST_LOG_WARN("[", def_.id, "] process exited unexpectedly");

    if (!policy_.auto_restart || exhausted) {
        set_state(ConnectionState::Error);
        return;
    }
    retry_loop(epoch);
}

void ProcessSupervisor::record_health_outcome(bool healthy, const std::optional<std::string>& error) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (healthy) {
            health_failures_ = 0;
            if (state_ == ConnectionState::Running) consecutive_failures_ = 0;
            return;
        }
        if (state_ != ConnectionState::Running) return;
        if (++health_failures_ < policy_.error_budget) return;
    }

    std::lock_guard<std::mutex> transition(transition_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != ConnectionState::Running || health_failures_ < policy_.error_budget) return;
        ++launch_generation_;
        last_error_ = "Health check failed " + std::to_string(health_failures_)
                      + " consecutive times" + (error ? ": " + *error : std::string());
    }
    MCPHOST_LOG_ERROR("[", def_.id, "] error budget exhausted, stopping server");
    teardown_locked(nullptr);
    set_state(ConnectionState::Error);
}

// ---------- Queries ----------

ConnectionState ProcessSupervisor::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool ProcessSupervisor::wait_for_state(ConnectionState target,
                                       std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_mutex_);
    return state_cv_.wait_for(lock, timeout, [&] { return state_ == target; });
}

ServerStatus ProcessSupervisor::status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ServerStatus s;
    s.state = state_;
    s.last_error = last_error_;
    s.restart_count = restart_count_;
    if (state_ == ConnectionState::Running) {
        s.uptime = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_at_);
    }
    return s;
}

uint32_t ProcessSupervisor::consecutive_failures() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return consecutive_failures_;
}

std::optional<int> ProcessSupervisor::pid() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return pid_;
}

} // namespace mcphost
