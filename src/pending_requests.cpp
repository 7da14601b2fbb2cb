#include "mcphost/pending_requests.hpp"

namespace mcphost {

PendingRequests::Ticket PendingRequests::register_request(const std::string& method) {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t id = next_id_++;
    Entry entry;
    entry.method = method;
    entry.created_at = std::chrono::steady_clock::now();
    auto fut = entry.promise.get_future();
    entries_.emplace(id, std::move(entry));
    return Ticket{id, std::move(fut)};
}

bool PendingRequests::complete(const RequestId& id, JsonRpcResponse resp) {
    // Only integer ids are ever issued by this table.
    const auto* int_id = std::get_if<int64_t>(&id);
    if (!int_id) return false;

    std::promise<JsonRpcResponse> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(*int_id);
        if (it == entries_.end()) return false;
        promise = std::move(it->second.promise);
        entries_.erase(it);
    }
    promise.set_value(std::move(resp));
    return true;
}

bool PendingRequests::remove(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(id) > 0;
}

bool PendingRequests::fail(int64_t id, std::exception_ptr error) {
    std::promise<JsonRpcResponse> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) return false;
        promise = std::move(it->second.promise);
        entries_.erase(it);
    }
    promise.set_exception(error);
    return true;
}

size_t PendingRequests::fail_all(std::exception_ptr error) {
    std::unordered_map<int64_t, Entry> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(entries_);
    }
    for (auto& [id, entry] : drained) {
        entry.promise.set_exception(error);
    }
    return drained.size();
}

bool PendingRequests::contains(int64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(id) > 0;
}

size_t PendingRequests::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::string PendingRequests::method_of(int64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    return it == entries_.end() ? std::string() : it->second.method;
}

} // namespace mcphost
