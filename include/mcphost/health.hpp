#pragma once
#include "registry.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mcphost {

/// Probes registered servers on a schedule and keeps a HealthRecord per
/// server. Classification is an observation only; failed checks are fed to
/// the connection's error budget.
class HealthChecker {
public:
    struct Options {
        std::chrono::milliseconds interval{30000};
        std::chrono::milliseconds max_response_time{200};
        std::chrono::milliseconds probe_timeout{5000};
        bool smoke_test = true;
        bool feed_error_budget = true;
    };

    explicit HealthChecker(Registry& registry) : HealthChecker(registry, Options{}) {}
    explicit HealthChecker(Registry& registry, Options opts);
    ~HealthChecker();

    HealthChecker(const HealthChecker&) = delete;
    HealthChecker& operator=(const HealthChecker&) = delete;

    /// Probe one server now. Throws NotFound.
    HealthRecord check(const std::string& id);

    /// Probe every registered server concurrently.
    std::vector<HealthRecord> check_all();

    /// Run check_all() every interval on a background thread.
    void start();
    void stop();
    [[nodiscard]] bool running() const { return running_; }

    /// Fold an externally made observation into a server's record.
    HealthRecord record(const std::string& id, const std::string& name, bool healthy,
                        std::chrono::milliseconds response_time,
                        const std::optional<std::string>& error = std::nullopt);

    [[nodiscard]] std::optional<HealthRecord> record_for(const std::string& id) const;
    [[nodiscard]] HealthReport report() const;

    void reset(const std::string& id);
    void reset_all();

    [[nodiscard]] const Options& options() const { return opts_; }

private:
    struct Outcome {
        bool healthy = false;
        std::chrono::milliseconds response_time{0};
        uint64_t successes = 0;
        uint64_t errors = 0;
        std::optional<std::string> error;
    };

    Outcome probe(ServerConnection& conn) const;
    HealthRecord apply(const std::string& id, const std::string& name, const Outcome& outcome);
    void run();

    Registry& registry_;
    const Options opts_;

    mutable std::mutex records_mutex_;
    std::map<std::string, HealthRecord> records_;

    std::atomic<bool> running_{false};
    std::mutex schedule_mutex_;
    std::condition_variable schedule_cv_;
    std::thread scheduler_;
};

/// Plain-text rendering of a report.
std::string format_health_report(const HealthReport& report);

} // namespace mcphost
