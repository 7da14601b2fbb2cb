#include "mcphost/transport/stdio_transport.hpp"
#include "mcphost/codec.hpp"
#include "mcphost/error.hpp"
#include "mcphost/log.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <csignal>
#include <cerrno>
#include <cstring>

namespace mcphost {

namespace {

void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

template <typename Exception>
void report(const ErrorCallback& on_error, const std::string& what) {
    if (!on_error) return;
    on_error(std::make_exception_ptr(Exception(what)));
}

// Close-on-exec so servers launched later do not inherit it.
void open_wakeup_pipe(int fds[2]) {
    if (::pipe2(fds, O_CLOEXEC) < 0) {
        throw TransportError(std::string("Failed to create wakeup pipe: ") + strerror(errno));
    }
    fcntl(fds[1], F_SETFL, fcntl(fds[1], F_GETFL, 0) | O_NONBLOCK);
}

} // anonymous namespace

StdioTransport::StdioTransport()
    : read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false) {
    open_wakeup_pipe(wakeup_pipe_);
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true) {
    open_wakeup_pipe(wakeup_pipe_);
}

StdioTransport::~StdioTransport() {
    shutdown();
    if (writer_thread_.joinable()) writer_thread_.join();
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start(MessageCallback on_message, ErrorCallback on_error,
                           CloseCallback on_close) {
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) return;
    ignore_sigpipe();
    connected_ = true;

    writer_thread_ = std::thread([this]() { write_loop(); });
    read_loop(on_message, on_error, on_close);

    connected_ = false;
    running_ = false;
    write_cv_.notify_all();
    if (writer_thread_.joinable()) writer_thread_.join();
}

void StdioTransport::read_loop(const MessageCallback& on_message, const ErrorCallback& on_error,
                               const CloseCallback& on_close) {
    LineFramer framer;
    char chunk[4096];

    while (running_) {
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            report<TransportError>(on_error, std::string("poll failed: ") + strerror(errno));
            break;
        }

        // Local shutdown
        if (fds[1].revents & POLLIN) return;

        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            if (!running_) return;
            report<TransportError>(on_error, std::string("Read error: ") + strerror(errno));
            break;
        }
        if (n == 0) break;  // EOF

        for (auto& frame : framer.feed(std::string_view(chunk, static_cast<size_t>(n)))) {
            JsonRpcMessage msg;
            try {
                msg = Codec::parse(frame);
            } catch (const ParseError& e) {
                report<ParseError>(on_error, e.what());
                continue;
            }
            on_message(std::move(msg));
        }
    }

    // Peer closed the stream.
    peer_closed_ = true;
    connected_ = false;
    if (!shutdown_requested_ && on_close) on_close();
}

void StdioTransport::write_loop() {
    while (true) {
        std::string frame;
        {
            std::unique_lock<std::mutex> lock(write_mutex_);
            write_cv_.wait(lock, [this] { return !write_queue_.empty() || !running_; });
            if (write_queue_.empty()) break;
            frame = std::move(write_queue_.front());
            write_queue_.pop();
        }

        const char* data = frame.data();
        size_t remaining = frame.size();
        while (remaining > 0) {
            ssize_t written = ::write(write_fd_, data, remaining);
            if (written < 0) {
                if (errno == EINTR) continue;
                MCPHOST_LOG_DEBUG("stdio write failed: ", strerror(errno));
                peer_closed_ = true;
                connected_ = false;
                std::lock_guard<std::mutex> lock(write_mutex_);
                std::queue<std::string>().swap(write_queue_);
                return;
            }
            data += written;
            remaining -= static_cast<size_t>(written);
        }
    }
}

void StdioTransport::send(const JsonRpcMessage& msg) {
    if (shutdown_requested_.load()) {
        throw TransportError("Transport shut down");
    }
    if (peer_closed_.load() || (running_.load() && !connected_.load())) {
        throw TransportError("Transport closed by peer");
    }
    std::string frame = LineFramer::encode(msg);
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        write_queue_.push(std::move(frame));
    }
    write_cv_.notify_one();
}

void StdioTransport::shutdown() {
    if (shutdown_requested_.exchange(true)) return;
    connected_ = false;
    running_ = false;
    write_cv_.notify_all();
    wake_reader();
}

void StdioTransport::wake_reader() {
    if (wakeup_pipe_[1] < 0) return;
    char b = 1;
    while (::write(wakeup_pipe_[1], &b, 1) < 0 && errno == EINTR) {}
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace mcphost
