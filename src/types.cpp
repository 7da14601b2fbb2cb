#include "mcphost/types.hpp"
#include <stdexcept>

namespace mcphost {

// ---------- Enums ----------

std::string to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Stopped:    return "stopped";
        case ConnectionState::Starting:   return "starting";
        case ConnectionState::Running:    return "running";
        case ConnectionState::Restarting: return "restarting";
        case ConnectionState::Error:      return "error";
    }
    return "unknown";
}

std::string security_level_to_string(SecurityLevel level) {
    switch (level) {
        case SecurityLevel::Safe:      return "safe";
        case SecurityLevel::Workspace: return "workspace";
        case SecurityLevel::System:    return "system";
        case SecurityLevel::Network:   return "network";
    }
    return "safe";
}

std::optional<SecurityLevel> security_level_from_string(std::string_view s) {
    if (s == "safe")      return SecurityLevel::Safe;
    if (s == "workspace") return SecurityLevel::Workspace;
    if (s == "system")    return SecurityLevel::System;
    if (s == "network")   return SecurityLevel::Network;
    return std::nullopt;
}

// ---------- Content ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextContent& t) {
    t.text = j.at("text").get<std::string>();
}

void to_json(nlohmann::json& j, const ImageContent& t) {
    j = {{"type", "image"}, {"data", t.data}, {"mimeType", t.mime_type}};
}

void from_json(const nlohmann::json& j, ImageContent& t) {
    t.data = j.at("data").get<std::string>();
    t.mime_type = j.at("mimeType").get<std::string>();
}

void to_json(nlohmann::json& j, const AudioContent& t) {
    j = {{"type", "audio"}, {"data", t.data}, {"mimeType", t.mime_type}};
}

void from_json(const nlohmann::json& j, AudioContent& t) {
    t.data = j.at("data").get<std::string>();
    t.mime_type = j.at("mimeType").get<std::string>();
}

void to_json(nlohmann::json& j, const EmbeddedResource& t) {
    nlohmann::json resource;
    resource["uri"] = t.uri;
    if (t.mime_type) resource["mimeType"] = *t.mime_type;
    if (t.text) resource["text"] = *t.text;
    if (t.blob) resource["blob"] = *t.blob;
    j = {{"type", "resource"}, {"resource", resource}};
}

void from_json(const nlohmann::json& j, EmbeddedResource& t) {
    const auto& resource = j.at("resource");
    t.uri = resource.at("uri").get<std::string>();
    if (resource.contains("mimeType")) t.mime_type = resource.at("mimeType").get<std::string>();
    if (resource.contains("text")) t.text = resource.at("text").get<std::string>();
    if (resource.contains("blob")) t.blob = resource.at("blob").get<std::string>();
}

void to_json(nlohmann::json& j, const Content& c) {
    std::visit([&j](const auto& v) { to_json(j, v); }, c);
}

void from_json(const nlohmann::json& j, Content& c) {
    const std::string type = j.at("type").get<std::string>();
    if (type == "text") {
        c = j.get<TextContent>();
    } else if (type == "image") {
        c = j.get<ImageContent>();
    } else if (type == "audio") {
        c = j.get<AudioContent>();
    } else if (type == "resource") {
        c = j.get<EmbeddedResource>();
    } else {
        throw std::invalid_argument("Unknown content type: " + type);
    }
}

// ---------- Tools ----------

void to_json(nlohmann::json& j, const ToolDescriptor& t) {
    j = {{"name", t.name}, {"inputSchema", t.input_schema},
         {"securityLevel", security_level_to_string(t.security_level)}};
    if (t.description) j["description"] = *t.description;
    if (t.annotations) j["annotations"] = *t.annotations;
}

void from_json(const nlohmann::json& j, ToolDescriptor& t) {
    t.name = j.at("name").get<std::string>();
    t.input_schema = j.value("inputSchema", nlohmann::json::object());
    if (j.contains("description") && j.at("description").is_string()) {
        t.description = j.at("description").get<std::string>();
    }
    if (j.contains("annotations")) t.annotations = j.at("annotations");
    // security_level is assigned by the host; servers do not get to pick it.
}

std::string ToolResult::text() const {
    std::string out;
    for (const auto& block : content) {
        if (const auto* t = std::get_if<TextContent>(&block)) {
            if (!out.empty()) out += "\n";
            out += t->text;
        }
    }
    return out;
}

void to_json(nlohmann::json& j, const ToolResult& t) {
    j = {{"content", t.content}};
    if (t.structured_content) j["structuredContent"] = *t.structured_content;
    if (t.is_error) j["isError"] = true;
}

void from_json(const nlohmann::json& j, ToolResult& t) {
    t.content = j.value("content", std::vector<Content>{});
    if (j.contains("structuredContent")) t.structured_content = j.at("structuredContent");
    t.is_error = j.value("isError", false);
}

// ---------- Resources ----------

void to_json(nlohmann::json& j, const ResourceDescriptor& t) {
    j = {{"uri", t.uri}, {"name", t.name}};
    if (t.description) j["description"] = *t.description;
    if (t.mime_type) j["mimeType"] = *t.mime_type;
}

void from_json(const nlohmann::json& j, ResourceDescriptor& t) {
    t.uri = j.at("uri").get<std::string>();
    t.name = j.value("name", t.uri);
    if (j.contains("description")) t.description = j.at("description").get<std::string>();
    if (j.contains("mimeType")) t.mime_type = j.at("mimeType").get<std::string>();
}

void to_json(nlohmann::json& j, const ResourceContent& t) {
    j = {{"uri", t.uri}};
    if (t.mime_type) j["mimeType"] = *t.mime_type;
    if (t.text) j["text"] = *t.text;
    if (t.blob) j["blob"] = *t.blob;
}

void from_json(const nlohmann::json& j, ResourceContent& t) {
    t.uri = j.at("uri").get<std::string>();
    if (j.contains("mimeType")) t.mime_type = j.at("mimeType").get<std::string>();
    if (j.contains("text")) t.text = j.at("text").get<std::string>();
    if (j.contains("blob")) t.blob = j.at("blob").get<std::string>();
}

// ---------- Handshake ----------

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = j.at("name").get<std::string>();
    t.version = j.at("version").get<std::string>();
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {{"protocolVersion", t.protocol_version},
         {"capabilities", t.capabilities},
         {"serverInfo", t.server_info}};
    if (t.instructions) j["instructions"] = *t.instructions;
}

void from_json(const nlohmann::json& j, InitializeResult& t) {
    t.protocol_version = j.at("protocolVersion").get<std::string>();
    t.capabilities = j.value("capabilities", nlohmann::json::object());
    t.server_info = j.at("serverInfo").get<Implementation>();
    if (j.contains("instructions")) t.instructions = j.at("instructions").get<std::string>();
}

// ---------- Health / status ----------

double HealthRecord::success_rate() const {
    const uint64_t total = success_count + error_count;
    if (total == 0) return 0.0;
    return static_cast<double>(success_count) / static_cast<double>(total);
}

double HealthReport::healthy_percentage() const {
    if (total_servers == 0) return 0.0;
    return static_cast<double>(healthy_servers) / static_cast<double>(total_servers) * 100.0;
}

double HealthReport::unhealthy_percentage() const {
    if (total_servers == 0) return 0.0;
    return static_cast<double>(unhealthy_servers) / static_cast<double>(total_servers) * 100.0;
}

void to_json(nlohmann::json& j, const HealthRecord& t) {
    j = {{"serverId", t.server_id},
         {"serverName", t.server_name},
         {"healthy", t.healthy},
         {"responseTimeMs", t.response_time.count()},
         {"successCount", t.success_count},
         {"errorCount", t.error_count},
         {"successRate", t.success_rate()}};
    if (t.last_error) j["lastError"] = *t.last_error;
    if (t.last_check) {
        j["lastCheckMs"] = std::chrono::duration_cast<std::chrono::milliseconds>(
            t.last_check->time_since_epoch()).count();
    }
}

void to_json(nlohmann::json& j, const HealthReport& t) {
    j = {{"totalServers", t.total_servers},
         {"healthyServers", t.healthy_servers},
         {"unhealthyServers", t.unhealthy_servers},
         {"servers", t.servers}};
}

void to_json(nlohmann::json& j, const ServerStatus& t) {
    j = {{"state", to_string(t.state)},
         {"uptimeMs", t.uptime.count()},
         {"requestCount", t.request_count},
         {"errorCount", t.error_count},
         {"restartCount", t.restart_count}};
    if (t.last_error) j["lastError"] = *t.last_error;
}

void to_json(nlohmann::json& j, const ServerListing& t) {
    j = {{"id", t.id},
         {"name", t.name},
         {"description", t.description},
         {"version", t.version},
         {"type", t.type},
         {"enabled", t.enabled},
         {"loaded", t.loaded}};
}

void to_json(nlohmann::json& j, const BulkResult& t) {
    j = {{"succeeded", t.succeeded}, {"failures", nlohmann::json::array()}};
    for (const auto& f : t.failures) {
        j["failures"].push_back({{"id", f.id}, {"message", f.message}});
    }
}

} // namespace mcphost
