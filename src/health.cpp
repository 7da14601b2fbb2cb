#include "mcphost/health.hpp"
#include "mcphost/error.hpp"
#include "mcphost/log.hpp"

#include <cstdio>
#include <future>
#include <set>
#include <sstream>

namespace mcphost {

HealthChecker::HealthChecker(Registry& registry, Options opts)
    : registry_(registry), opts_(opts) {}

HealthChecker::~HealthChecker() {
    stop();
}

// ---------- Probing ----------

HealthChecker::Outcome HealthChecker::probe(ServerConnection& conn) const {
    Outcome out;

    if (conn.state() != ConnectionState::Running) {
        out.errors = 1;
        out.error = "Server is not running (" + to_string(conn.state()) + ")";
        return out;
    }

    auto t0 = std::chrono::steady_clock::now();
    try {
        (void)conn.ping(opts_.probe_timeout);
    } catch (const HostError& e) {
        out.response_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0);
        out.errors = 1;
        out.error = std::string("Ping failed: ") + e.what();
        return out;
    }
    out.response_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0);
    out.successes = 1;

    if (out.response_time > opts_.max_response_time) {
        out.error = "Response time " + std::to_string(out.response_time.count())
                    + "ms exceeds maximum " + std::to_string(opts_.max_response_time.count()) + "ms";
        return out;
    }
    out.healthy = true;
    if (!opts_.smoke_test) return out;

    std::vector<ToolDescriptor> tools;
    try {
        tools = conn.list_tools();
    } catch (const HostError& e) {
        out.healthy = false;
        out.errors = 1;
        out.error = std::string("tools/list failed: ") + e.what();
        return out;
    }
    if (tools.empty()) return out;

    const auto& first = tools.front();
    if (first.security_level > SecurityLevel::Safe) {
        MCPHOST_LOG_DEBUG("[", conn.id(), "] skipping smoke test of '", first.name,
                          "' (", security_level_to_string(first.security_level), ")");
        return out;
    }
    try {
        (void)conn.call_tool(first.name, nlohmann::json::object());
    } catch (const HostError& e) {
        out.healthy = false;
        out.errors = 1;
        out.error = "tools/call failed for " + first.name + ": " + e.what();
    }
    return out;
}

HealthRecord HealthChecker::apply(const std::string& id, const std::string& name,
                                  const Outcome& outcome) {
    std::lock_guard<std::mutex> lock(records_mutex_);
    auto& rec = records_[id];
    rec.server_id = id;
    rec.server_name = name;
    rec.last_check = std::chrono::system_clock::now();
    rec.response_time = outcome.response_time;
    rec.success_count += outcome.successes;
    rec.error_count += outcome.errors;
    rec.healthy = outcome.healthy;
    rec.last_error = outcome.error;
    return rec;
}

HealthRecord HealthChecker::check(const std::string& id) {
    auto conn = registry_.get(id).lock();
    const bool was_running = conn->state() == ConnectionState::Running;

    Outcome outcome = probe(*conn);
    if (!outcome.healthy) {
        MCPHOST_LOG_WARN("[", id, "] health check failed: ", outcome.error.value_or("unhealthy"));
    }
    if (opts_.feed_error_budget && was_running) {
        conn->record_health_outcome(outcome.healthy, outcome.error);
    }
    return apply(id, conn->definition().name, outcome);
}

std::vector<HealthRecord> HealthChecker::check_all() {
    auto ids = registry_.ids();

    std::vector<std::pair<std::string, std::future<HealthRecord>>> pending;
    for (const auto& id : ids) {
        pending.emplace_back(id, std::async(std::launch::async, [this, id]() { return check(id); }));
    }

    std::vector<HealthRecord> results;
    for (auto& [id, fut] : pending) {
        try {
            results.push_back(fut.get());
        } catch (const NotFound&) {
            // Unregistered while the check was running.
            reset(id);
        }
    }

    // Drop records of servers that are gone.
    std::set<std::string> live(ids.begin(), ids.end());
    std::lock_guard<std::mutex> lock(records_mutex_);
    for (auto it = records_.begin(); it != records_.end();) {
        if (!live.count(it->first)) it = records_.erase(it);
        else ++it;
    }
    return results;
}

HealthRecord HealthChecker::record(const std::string& id, const std::string& name, bool healthy,
                                   std::chrono::milliseconds response_time,
                                   const std::optional<std::string>& error) {
    Outcome outcome;
    outcome.healthy = healthy;
    outcome.response_time = response_time;
    outcome.successes = healthy ? 1 : 0;
    outcome.errors = healthy ? 0 : 1;
    outcome.error = error;
    return apply(id, name, outcome);
}

// ---------- Scheduling ----------

void HealthChecker::start() {
    if (running_.exchange(true)) return;
    scheduler_ = std::thread([this]() { run(); });
    MCPHOST_LOG_INFO("Health checks every ", opts_.interval.count(), "ms");
}

void HealthChecker::stop() {
    {
        std::lock_guard<std::mutex> lock(schedule_mutex_);
        if (!running_.exchange(false)) return;
    }
    schedule_cv_.notify_all();
    if (scheduler_.joinable()) scheduler_.join();
}

void HealthChecker::run() {
    std::unique_lock<std::mutex> lock(schedule_mutex_);
    while (running_) {
        if (schedule_cv_.wait_for(lock, opts_.interval, [this] { return !running_; })) break;
        lock.unlock();
        check_all();
        lock.lock();
    }
}

// ---------- Reporting ----------

std::optional<HealthRecord> HealthChecker::record_for(const std::string& id) const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

HealthReport HealthChecker::report() const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    HealthReport r;
    for (const auto& [id, rec] : records_) {
        r.servers.push_back(rec);
        if (rec.healthy) ++r.healthy_servers;
    }
    r.total_servers = r.servers.size();
    r.unhealthy_servers = r.total_servers - r.healthy_servers;
    return r;
}

void HealthChecker::reset(const std::string& id) {
    std::lock_guard<std::mutex> lock(records_mutex_);
    records_.erase(id);
}

void HealthChecker::reset_all() {
    std::lock_guard<std::mutex> lock(records_mutex_);
    records_.clear();
}

std::string format_health_report(const HealthReport& report) {
    std::ostringstream out;
    const size_t total = report.total_servers == 0 ? 1 : report.total_servers;

    out << "MCP Server Health Report\n";
    out << "========================\n\n";
    out << "Total Servers: " << report.total_servers << "\n";
    out << "Healthy: " << report.healthy_servers << " ("
        << (report.healthy_servers * 100) / total << "%)\n";
    out << "Unhealthy: " << report.unhealthy_servers << " ("
        << (report.unhealthy_servers * 100) / total << "%)\n\n";

    for (const auto& rec : report.servers) {
        char rate[32];
        std::snprintf(rate, sizeof(rate), "%.1f", rec.success_rate() * 100.0);

        out << "Server: " << rec.server_name << " - "
            << (rec.healthy ? "✅ HEALTHY" : "❌ UNHEALTHY") << "\n";
        out << "  Response Time: " << rec.response_time.count() << "ms\n";
        out << "  Success Rate: " << rate << "%\n";
        out << "  Success/Error Count: " << rec.success_count << "/" << rec.error_count << "\n";
        if (rec.last_error) out << "  Last Error: " << *rec.last_error << "\n";
        out << "\n";
    }
    return out.str();
}

} // namespace mcphost
