#pragma once
#include "security.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcphost {

class HostError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ---- Framing / transport ----

class ParseError : public HostError {
public:
    using HostError::HostError;
};

class TransportError : public HostError {
public:
    using HostError::HostError;
};

// ---- Process lifecycle ----

class SpawnFailure : public HostError {
public:
    using HostError::HostError;
};

class MissingEnvironment : public SpawnFailure {
public:
    std::vector<std::string> variables;

    explicit MissingEnvironment(std::vector<std::string> vars)
        : SpawnFailure("Missing required environment variables: " + join(vars)),
          variables(std::move(vars)) {}

private:
    static std::string join(const std::vector<std::string>& vars) {
        std::string out;
        for (const auto& v : vars) {
            if (!out.empty()) out += ", ";
            out += v;
        }
        return out;
    }
};

class ProcessError : public HostError {
public:
    using HostError::HostError;
};

// ---- Protocol ----

class ProtocolViolation : public HostError {
public:
    using HostError::HostError;
};

class IncompatibleVersion : public ProtocolViolation {
public:
    std::string server_version;

    explicit IncompatibleVersion(std::string version)
        : ProtocolViolation("Unsupported protocol version: " + version),
          server_version(std::move(version)) {}
};

class TimeoutError : public HostError {
public:
    using HostError::HostError;
};

class ConnectionStopped : public HostError {
public:
    using HostError::HostError;
};

class RequestCancelled : public HostError {
public:
    using HostError::HostError;
};

// ---- Invocation ----

class RemoteToolError : public HostError {
public:
    int code;
    std::optional<nlohmann::json> data;

    RemoteToolError(int code, const std::string& msg,
                    std::optional<nlohmann::json> data = std::nullopt)
        : HostError(msg), code(code), data(std::move(data)) {}
};

class ResourceNotFound : public HostError {
public:
    std::string uri;

    explicit ResourceNotFound(std::string u)
        : HostError("Resource not found: " + u), uri(std::move(u)) {}
};

class ConfirmationRequired : public HostError {
public:
    std::string tool;
    SecurityLevel required;

    ConfirmationRequired(std::string tool_name, SecurityLevel level)
        : HostError("Tool '" + tool_name + "' requires confirmation for security level "
                    + security_level_to_string(level)),
          tool(std::move(tool_name)), required(level) {}
};

// ---- Registry / config ----

class DuplicateId : public HostError {
public:
    std::string id;

    explicit DuplicateId(std::string i)
        : HostError("MCP server with id '" + i + "' is already registered"), id(std::move(i)) {}
};

class NotFound : public HostError {
public:
    std::string id;

    explicit NotFound(std::string i)
        : HostError("MCP server with id '" + i + "' is not registered"), id(std::move(i)) {}
};

class ConfigError : public HostError {
public:
    using HostError::HostError;
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
    constexpr int ResourceNotFound = -32002;
} // namespace error

} // namespace mcphost
