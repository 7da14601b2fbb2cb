#include "mcphost/backoff.hpp"
#include <algorithm>
#include <cmath>

namespace mcphost {

std::chrono::milliseconds backoff_delay(const BackoffPolicy& policy, uint32_t attempt, double u) {
    const double base = static_cast<double>(policy.base.count());
    const double cap = static_cast<double>(policy.cap.count());

    // 2^attempt overflows quickly; the cap is reached long before.
    double delay = base * std::pow(2.0, static_cast<double>(std::min<uint32_t>(attempt, 30)));
    delay = std::min(delay, cap);

    const double jitter = std::clamp(policy.jitter, 0.0, 1.0);
    u = std::clamp(u, 0.0, 1.0);
    delay *= 1.0 + jitter * (2.0 * u - 1.0);
    delay = std::clamp(delay, 0.0, cap);

    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(delay)));
}

Backoff::Backoff(BackoffPolicy policy)
    : policy_(policy), rng_(std::random_device{}()) {}

Backoff::Backoff(BackoffPolicy policy, uint32_t seed)
    : policy_(policy), rng_(seed) {}

std::chrono::milliseconds Backoff::next(uint32_t attempt) {
    double u;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        u = std::uniform_real_distribution<double>(0.0, 1.0)(rng_);
    }
    return backoff_delay(policy_, attempt, u);
}

} // namespace mcphost
