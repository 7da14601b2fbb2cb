#pragma once
#include "transport/transport.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcphost {

/// What to run for one server.
struct LaunchSpec {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;    // overrides on top of the host environment
    std::optional<std::string> working_directory;
};

/// A launched server process.
class ProcessHandle {
public:
    virtual ~ProcessHandle() = default;

    /// The transport over the child's stdin/stdout. Callable once.
    virtual std::unique_ptr<ITransport> take_transport() = 0;

    [[nodiscard]] virtual int pid() const = 0;

    /// Reaps the child without blocking if it has exited.
    [[nodiscard]] virtual bool running() = 0;

    /// Exit code (or 128 + signal) once the child has been reaped.
    [[nodiscard]] virtual std::optional<int> exit_status() const = 0;

    /// Ask the child to exit, wait up to `grace`, then force it. A child
    /// that has already exited is not an error. Throws ProcessError.
    virtual void terminate(std::chrono::milliseconds grace) = 0;
};

/// Seam between supervision and the OS.
class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    /// Throws SpawnFailure if the process cannot be started.
    virtual std::unique_ptr<ProcessHandle> launch(const LaunchSpec& spec) = 0;
};

/// fork/exec with the child's stdin/stdout connected to pipes.
class PosixProcessLauncher : public ProcessLauncher {
public:
    std::unique_ptr<ProcessHandle> launch(const LaunchSpec& spec) override;
};

} // namespace mcphost
