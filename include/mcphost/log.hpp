#pragma once
#include <atomic>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace mcphost {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Off
};

std::string log_level_to_string(LogLevel level);

using LogSink = std::function<void(LogLevel, const std::string&)>;

/// Process-wide diagnostic logger. Writes timestamped lines to stderr unless
/// a sink is installed. Never writes to stdout.
class Logger {
public:
    static Logger& instance();

    [[nodiscard]] bool enabled(LogLevel level) const {
        return level != LogLevel::Off && level >= level_.load(std::memory_order_relaxed);
    }
    void set_level(LogLevel level) { level_.store(level, std::memory_order_relaxed); }
    [[nodiscard]] LogLevel level() const { return level_.load(std::memory_order_relaxed); }

    /// Replace the output; nullptr restores stderr.
    void set_sink(LogSink sink);

    void write(LogLevel level, const std::string& message);

    template <typename... Args>
    void log(LogLevel level, Args&&... args) {
        if (!enabled(level)) return;
        std::ostringstream oss;
        (oss << ... << std::forward<Args>(args));
        write(level, oss.str());
    }

private:
    Logger() = default;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::mutex sink_mutex_;
    LogSink sink_;
};

} // namespace mcphost

#define MCPHOST_LOG(level, ...)                                        \
    do {                                                               \
        auto& mcphost_logger_ = ::mcphost::Logger::instance();         \
        if (mcphost_logger_.enabled(level))                            \
            mcphost_logger_.log(level, __VA_ARGS__);                   \
    } while (0)

#define MCPHOST_LOG_TRACE(...) MCPHOST_LOG(::mcphost::LogLevel::Trace, __VA_ARGS__)
#define MCPHOST_LOG_DEBUG(...) MCPHOST_LOG(::mcphost::LogLevel::Debug, __VA_ARGS__)
#define MCPHOST_LOG_INFO(...)  MCPHOST_LOG(::mcphost::LogLevel::Info, __VA_ARGS__)
#define MCPHOST_LOG_WARN(...)  MCPHOST_LOG(::mcphost::LogLevel::Warn, __VA_ARGS__)
#define MCPHOST_LOG_ERROR(...) MCPHOST_LOG(::mcphost::LogLevel::Error, __VA_ARGS__)
