#include "mcphost/process.hpp"
#include "mcphost/error.hpp"
#include "mcphost/log.hpp"
#include "mcphost/transport/stdio_transport.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

extern char** environ;

namespace mcphost {

namespace {

class Pipe {
public:
    Pipe() {
        if (::pipe2(fds_, O_CLOEXEC) < 0) {
            throw SpawnFailure(std::string("Failed to create pipe: ") + strerror(errno));
        }
    }
    ~Pipe() {
        close_read();
        close_write();
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int read_end() const { return fds_[0]; }
    int write_end() const { return fds_[1]; }

    int release_read() { int fd = fds_[0]; fds_[0] = -1; return fd; }
    int release_write() { int fd = fds_[1]; fds_[1] = -1; return fd; }

    void close_read() { if (fds_[0] >= 0) { ::close(fds_[0]); fds_[0] = -1; } }
    void close_write() { if (fds_[1] >= 0) { ::close(fds_[1]); fds_[1] = -1; } }

private:
    int fds_[2]{-1, -1};
};

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        std::string key = entry.substr(0, eq);
        if (overrides.count(key)) continue;
        env.push_back(std::move(entry));
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

class PosixProcessHandle : public ProcessHandle {
public:
    PosixProcessHandle(pid_t pid, int read_fd, int write_fd)
        : pid_(pid), transport_(std::make_unique<StdioTransport>(read_fd, write_fd)) {}

    ~PosixProcessHandle() override {
        if (exit_status_) return;
        try {
            terminate(std::chrono::milliseconds(0));
        } catch (const ProcessError& e) {
            MCPHOST_LOG_ERROR("Failed to reap process ", pid_, ": ", e.what());
        }
    }

    std::unique_ptr<ITransport> take_transport() override {
        return std::move(transport_);
    }

    int pid() const override { return static_cast<int>(pid_); }

    bool running() override {
        if (exit_status_) return false;
        return !try_reap();
    }

    std::optional<int> exit_status() const override { return exit_status_; }

    void terminate(std::chrono::milliseconds grace) override {
        if (exit_status_ || try_reap()) return;

        if (::kill(pid_, SIGTERM) < 0 && errno != ESRCH) {
            throw ProcessError("Failed to signal process " + std::to_string(pid_) + ": "
                               + strerror(errno));
        }

        auto deadline = std::chrono::steady_clock::now() + grace;
        while (std::chrono::steady_clock::now() < deadline) {
            if (try_reap()) return;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (try_reap()) return;

        MCPHOST_LOG_WARN("Process ", pid_, " did not exit within ", grace.count(),
                         "ms, killing it");
        if (::kill(pid_, SIGKILL) < 0 && errno != ESRCH) {
            throw ProcessError("Failed to kill process " + std::to_string(pid_) + ": "
                               + strerror(errno));
        }
        int status = 0;
        pid_t r;
        do {
            r = ::waitpid(pid_, &status, 0);
        } while (r < 0 && errno == EINTR);
        if (r < 0) {
            throw ProcessError("Failed to wait for process " + std::to_string(pid_) + ": "
                               + strerror(errno));
        }
        exit_status_ = decode_status(status);
    }

private:
    bool try_reap() {
        int status = 0;
        pid_t r = ::waitpid(pid_, &status, WNOHANG);
        if (r == pid_) {
            exit_status_ = decode_status(status);
            return true;
        }
        if (r < 0 && errno == ECHILD) {
            // Reaped elsewhere; nothing left to wait for.
            exit_status_ = -1;
            return true;
        }
        return false;
    }

    pid_t pid_;
    std::unique_ptr<ITransport> transport_;
    std::optional<int> exit_status_;
};

} // anonymous namespace

std::unique_ptr<ProcessHandle> PosixProcessLauncher::launch(const LaunchSpec& spec) {
    if (spec.command.empty()) {
        throw SpawnFailure("Empty command");
    }

    Pipe to_child;
    Pipe from_child;
    Pipe exec_status;   // CLOEXEC: closes silently on successful exec

    // Everything the child needs is prepared before fork.
    std::vector<std::string> args;
    args.push_back(spec.command);
    args.insert(args.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    std::vector<std::string> env = build_environment(spec.env);
    std::vector<char*> envp;
    for (auto& e : env) envp.push_back(e.data());
    envp.push_back(nullptr);

    const char* cwd = spec.working_directory ? spec.working_directory->c_str() : nullptr;

    pid_t pid = ::fork();
    if (pid < 0) {
        throw SpawnFailure(std::string("Failed to fork: ") + strerror(errno));
    }

    if (pid == 0) {
        ::dup2(to_child.read_end(), STDIN_FILENO);
        ::dup2(from_child.write_end(), STDOUT_FILENO);

        int err = 0;
        if (cwd && ::chdir(cwd) < 0) {
            err = errno;
        } else {
            environ = envp.data();
            ::execvp(argv[0], argv.data());
            err = errno;
        }
        ssize_t ignored = ::write(exec_status.write_end(), &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    to_child.close_read();
    from_child.close_write();
    exec_status.close_write();

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_status.read_end(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        std::string what = cwd && child_errno == ENOENT && ::access(cwd, F_OK) < 0
            ? "working directory '" + std::string(cwd) + "' does not exist"
            : std::string(strerror(child_errno));
        throw SpawnFailure("Failed to launch '" + spec.command + "': " + what);
    }

    MCPHOST_LOG_DEBUG("Launched '", spec.command, "' as pid ", pid);
    return std::make_unique<PosixProcessHandle>(pid, from_child.release_read(),
                                                to_child.release_write());
}

} // namespace mcphost
