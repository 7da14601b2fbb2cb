#pragma once
#include "security.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcphost {

// ---------- Server definition ----------

/// Capability families a server is declared to provide.
struct CapabilityFlags {
    bool tools = false;
    bool resources = false;
    bool prompts = false;
    bool logging = false;

    bool operator==(const CapabilityFlags& o) const {
        return tools == o.tools && resources == o.resources && prompts == o.prompts
               && logging == o.logging;
    }
};

/// Immutable launch and identity configuration of one server.
struct ServerDefinition {
    std::string id;
    std::string name;
    std::string description;
    std::string version = "1.0.0";
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::vector<std::string> required_env;
    std::optional<std::string> working_directory;
    bool auto_start = false;
    bool enabled = true;
    CapabilityFlags capabilities;
    SecurityLevel default_security_level = SecurityLevel::Safe;
    std::map<std::string, SecurityLevel> tool_security;

    bool operator==(const ServerDefinition& o) const {
        return id == o.id && name == o.name && description == o.description
               && version == o.version && command == o.command && args == o.args
               && env == o.env && required_env == o.required_env
               && working_directory == o.working_directory && auto_start == o.auto_start
               && enabled == o.enabled && capabilities == o.capabilities
               && default_security_level == o.default_security_level
               && tool_security == o.tool_security;
    }
};

// ---------- Lifecycle ----------

enum class ConnectionState {
    Stopped,
    Starting,
    Running,
    Restarting,
    Error
};

std::string to_string(ConnectionState state);

// ---------- Content types ----------

struct TextContent {
    std::string text;

    bool operator==(const TextContent& o) const { return text == o.text; }
};

struct ImageContent {
    std::string data;       // base64
    std::string mime_type;

    bool operator==(const ImageContent& o) const {
        return data == o.data && mime_type == o.mime_type;
    }
};

struct AudioContent {
    std::string data;       // base64
    std::string mime_type;

    bool operator==(const AudioContent& o) const {
        return data == o.data && mime_type == o.mime_type;
    }
};

struct EmbeddedResource {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;  // base64

    bool operator==(const EmbeddedResource& o) const {
        return uri == o.uri && mime_type == o.mime_type && text == o.text && blob == o.blob;
    }
};

using Content = std::variant<TextContent, ImageContent, AudioContent, EmbeddedResource>;

// ---------- Tools ----------

struct ToolDescriptor {
    std::string name;
    std::optional<std::string> description;
    nlohmann::json input_schema = nlohmann::json::object();
    std::optional<nlohmann::json> annotations;
    SecurityLevel security_level = SecurityLevel::Safe;

    bool operator==(const ToolDescriptor& o) const {
        return name == o.name && description == o.description
               && input_schema == o.input_schema && annotations == o.annotations
               && security_level == o.security_level;
    }
};

struct ToolResult {
    std::vector<Content> content;
    std::optional<nlohmann::json> structured_content;
    bool is_error = false;

    /// Concatenation of all text blocks, for display.
    [[nodiscard]] std::string text() const;

    bool operator==(const ToolResult& o) const {
        return content == o.content && structured_content == o.structured_content
               && is_error == o.is_error;
    }
};

// ---------- Resources ----------

struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;

    bool operator==(const ResourceDescriptor& o) const {
        return uri == o.uri && name == o.name && description == o.description
               && mime_type == o.mime_type;
    }
};

struct ResourceContent {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;  // base64

    bool operator==(const ResourceContent& o) const {
        return uri == o.uri && mime_type == o.mime_type && text == o.text && blob == o.blob;
    }
};

// ---------- Handshake ----------

struct Implementation {
    std::string name;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && version == o.version;
    }
};

struct InitializeResult {
    std::string protocol_version;
    nlohmann::json capabilities = nlohmann::json::object();
    Implementation server_info;
    std::optional<std::string> instructions;
};

/// What the client knows about a server after the handshake. Tool and
/// resource lists are valid only while the matching flag is set; a
/// list-changed notification clears it.
struct CapabilitySnapshot {
    std::string protocol_version;
    Implementation server_info;
    nlohmann::json server_capabilities = nlohmann::json::object();
    std::vector<ToolDescriptor> tools;
    std::vector<ResourceDescriptor> resources;
    bool tools_valid = false;
    bool resources_valid = false;
};

// ---------- Health / status ----------

struct HealthRecord {
    std::string server_id;
    std::string server_name;
    std::optional<std::chrono::system_clock::time_point> last_check;
    std::chrono::milliseconds response_time{0};
    uint64_t success_count = 0;
    uint64_t error_count = 0;
    std::optional<std::string> last_error;
    bool healthy = false;

    /// successes / (successes + errors) in [0, 1]; 0.0 before any observation.
    [[nodiscard]] double success_rate() const;
};

struct HealthReport {
    size_t total_servers = 0;
    size_t healthy_servers = 0;
    size_t unhealthy_servers = 0;
    std::vector<HealthRecord> servers;

    [[nodiscard]] double healthy_percentage() const;
    [[nodiscard]] double unhealthy_percentage() const;
};

/// Connection-level status kept by the supervisor.
struct ServerStatus {
    ConnectionState state = ConnectionState::Stopped;
    std::optional<std::string> last_error;
    std::chrono::milliseconds uptime{0};
    uint64_t request_count = 0;
    uint64_t error_count = 0;
    uint32_t restart_count = 0;
};

/// Registry listing row.
struct ServerListing {
    std::string id;
    std::string name;
    std::string description;
    std::string version;
    std::string type = "mcp-server";
    bool enabled = true;
    bool loaded = false;

    bool operator==(const ServerListing& o) const {
        return id == o.id && name == o.name && description == o.description
               && version == o.version && type == o.type && enabled == o.enabled
               && loaded == o.loaded;
    }
};

/// Outcome of a bulk registry operation.
struct BulkResult {
    struct Failure {
        std::string id;
        std::string message;
    };

    std::vector<std::string> succeeded;
    std::vector<Failure> failures;

    [[nodiscard]] bool ok() const { return failures.empty(); }
};

// ---------- Events ----------

/// Something a server told the host outside of a request.
struct ServerEvent {
    enum class Kind {
        ToolsChanged,
        ResourcesChanged,
        ResourceUpdated,
        Log,
        StateChanged
    };

    Kind kind;
    std::string server_id;
    std::optional<std::string> uri;          // ResourceUpdated
    std::optional<std::string> level;        // Log
    nlohmann::json data;                     // Log payload
    std::optional<ConnectionState> state;    // StateChanged
};

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const TextContent& t);
void from_json(const nlohmann::json& j, TextContent& t);

void to_json(nlohmann::json& j, const ImageContent& t);
void from_json(const nlohmann::json& j, ImageContent& t);

void to_json(nlohmann::json& j, const AudioContent& t);
void from_json(const nlohmann::json& j, AudioContent& t);

void to_json(nlohmann::json& j, const EmbeddedResource& t);
void from_json(const nlohmann::json& j, EmbeddedResource& t);

void to_json(nlohmann::json& j, const Content& c);
void from_json(const nlohmann::json& j, Content& c);

void to_json(nlohmann::json& j, const ToolDescriptor& t);
void from_json(const nlohmann::json& j, ToolDescriptor& t);

void to_json(nlohmann::json& j, const ToolResult& t);
void from_json(const nlohmann::json& j, ToolResult& t);

void to_json(nlohmann::json& j, const ResourceDescriptor& t);
void from_json(const nlohmann::json& j, ResourceDescriptor& t);

void to_json(nlohmann::json& j, const ResourceContent& t);
void from_json(const nlohmann::json& j, ResourceContent& t);

void to_json(nlohmann::json& j, const Implementation& t);
void from_json(const nlohmann::json& j, Implementation& t);

void to_json(nlohmann::json& j, const InitializeResult& t);
void from_json(const nlohmann::json& j, InitializeResult& t);

void to_json(nlohmann::json& j, const HealthRecord& t);
void to_json(nlohmann::json& j, const HealthReport& t);
void to_json(nlohmann::json& j, const ServerStatus& t);
void to_json(nlohmann::json& j, const ServerListing& t);
void to_json(nlohmann::json& j, const BulkResult& t);

} // namespace mcphost
