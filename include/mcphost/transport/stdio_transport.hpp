#pragma once
#include "transport.hpp"
#include "../framer.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace mcphost {

/// Newline-delimited JSON over a pair of file descriptors: a child server's
/// stdout/stdin on the host side, or the process's own stdin/stdout on the
/// server side. Reads on the thread that calls start(); writes go through a
/// queue drained by an internal writer thread.
class StdioTransport : public ITransport {
public:
    /// Use the process's stdin/stdout (not owned).
    StdioTransport();

    /// Use the given descriptors; both are closed on destruction.
    StdioTransport(int read_fd, int write_fd);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void start(MessageCallback on_message,
               ErrorCallback on_error = nullptr,
               CloseCallback on_close = nullptr) override;
    void send(const JsonRpcMessage& msg) override;
    void shutdown() override;
    bool is_connected() const override;

private:
    void read_loop(const MessageCallback& on_message, const ErrorCallback& on_error,
                   const CloseCallback& on_close);
    void write_loop();
    void wake_reader();

    int read_fd_;
    int write_fd_;
    bool owns_fds_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> peer_closed_{false};

    std::thread writer_thread_;

    std::mutex write_mutex_;
    std::queue<std::string> write_queue_;
    std::condition_variable write_cv_;

    int wakeup_pipe_[2]{-1, -1};
};

} // namespace mcphost
