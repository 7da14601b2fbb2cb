#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>

namespace mcphost {

struct BackoffPolicy {
    std::chrono::milliseconds base{250};
    std::chrono::milliseconds cap{5000};
    double jitter = 0.2;    // fraction of the delay, applied symmetrically
};

/// Delay before retry number `attempt` (0-based): base * 2^attempt, capped,
/// then scaled by (1 + jitter * (2u - 1)) and clamped to [0, cap].
/// `u` is a uniform sample in [0, 1].
std::chrono::milliseconds backoff_delay(const BackoffPolicy& policy, uint32_t attempt, double u);

/// Thread-safe jittered exponential backoff.
class Backoff {
public:
    explicit Backoff(BackoffPolicy policy = {});
    Backoff(BackoffPolicy policy, uint32_t seed);

    std::chrono::milliseconds next(uint32_t attempt);

    [[nodiscard]] const BackoffPolicy& policy() const { return policy_; }

private:
    BackoffPolicy policy_;
    std::mutex mutex_;
    std::mt19937 rng_;
};

} // namespace mcphost
