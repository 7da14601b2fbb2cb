#pragma once
#include "json_rpc.hpp"
#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

namespace mcphost {

/// Correlation table of outgoing requests awaiting a response. Ids are
/// allocated monotonically and never reused for the lifetime of the table.
class PendingRequests {
public:
    struct Ticket {
        int64_t id;
        std::future<JsonRpcResponse> response;
    };

    /// Allocate a fresh id and register a completion slot for it.
    Ticket register_request(const std::string& method);

    /// Deliver a response to its waiter. Returns false when no request with
    /// that id is pending (unmatched or already timed out).
    bool complete(const RequestId& id, JsonRpcResponse resp);

    /// Remove an entry without completing it. Returns false if absent.
    bool remove(int64_t id);

    /// Complete an entry with an error.
    bool fail(int64_t id, std::exception_ptr error);

    /// Fail every outstanding entry; returns how many were failed.
    size_t fail_all(std::exception_ptr error);

    [[nodiscard]] bool contains(int64_t id) const;
    [[nodiscard]] size_t size() const;

    /// Method name the entry was registered with, empty if absent.
    [[nodiscard]] std::string method_of(int64_t id) const;

private:
    struct Entry {
        std::string method;
        std::chrono::steady_clock::time_point created_at;
        std::promise<JsonRpcResponse> promise;
    };

    mutable std::mutex mutex_;
    std::unordered_map<int64_t, Entry> entries_;
    int64_t next_id_{1};
};

} // namespace mcphost
