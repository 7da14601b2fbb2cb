#include "mcphost/config.hpp"
#include "mcphost/error.hpp"
#include <cstdlib>
#include <set>

namespace mcphost {

namespace {

template <typename T>
T get_field(const nlohmann::json& j, const char* key, const std::string& id) {
    try {
        return j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Server '" + id + "': invalid field '" + key + "': " + e.what());
    }
}

SecurityLevel parse_level(const nlohmann::json& j, const std::string& id) {
    if (!j.is_string()) {
        throw ConfigError("Server '" + id + "': security level must be a string");
    }
    auto lvl = security_level_from_string(j.get<std::string>());
    if (!lvl) {
        throw ConfigError("Server '" + id + "': unknown security level '"
                          + j.get<std::string>() + "'");
    }
    return *lvl;
}

ServerDefinition catalog_entry(const std::string& name, const std::string& description,
                               std::vector<std::string> required_env,
                               CapabilityFlags caps = {true, false, false, false}) {
    ServerDefinition d;
    d.id = name;
    d.name = name;
    d.description = description;
    d.command = "mcp-server-" + name;
    d.required_env = std::move(required_env);
    d.auto_start = false;
    d.capabilities = caps;
    return d;
}

} // anonymous namespace

void to_json(nlohmann::json& j, const ServerDefinition& d) {
    j = {{"id", d.id},
         {"name", d.name},
         {"description", d.description},
         {"version", d.version},
         {"command", d.command},
         {"args", d.args},
         {"env", d.env},
         {"requiredEnv", d.required_env},
         {"autoStart", d.auto_start},
         {"enabled", d.enabled},
         {"capabilities", {{"tools", d.capabilities.tools},
                           {"resources", d.capabilities.resources},
                           {"prompts", d.capabilities.prompts},
                           {"logging", d.capabilities.logging}}},
         {"defaultSecurityLevel", security_level_to_string(d.default_security_level)}};
    if (d.working_directory) j["cwd"] = *d.working_directory;
    if (!d.tool_security.empty()) {
        nlohmann::json levels = nlohmann::json::object();
        for (const auto& [tool, lvl] : d.tool_security) {
            levels[tool] = security_level_to_string(lvl);
        }
        j["toolSecurity"] = levels;
    }
}

void from_json(const nlohmann::json& j, ServerDefinition& d) {
    if (!j.is_object()) throw ConfigError("Server definition must be an object");

    d.id = j.contains("id") ? get_field<std::string>(j, "id", "") : d.id;
    if (d.id.empty()) throw ConfigError("Server definition is missing 'id'");

    if (!j.contains("command")) throw ConfigError("Server '" + d.id + "' is missing 'command'");
    d.command = get_field<std::string>(j, "command", d.id);
    if (d.command.empty()) throw ConfigError("Server '" + d.id + "' has an empty 'command'");

    d.name = j.contains("name") ? get_field<std::string>(j, "name", d.id) : d.id;
    if (j.contains("description")) d.description = get_field<std::string>(j, "description", d.id);
    if (j.contains("version")) d.version = get_field<std::string>(j, "version", d.id);
    if (j.contains("args")) d.args = get_field<std::vector<std::string>>(j, "args", d.id);
    if (j.contains("env")) d.env = get_field<std::map<std::string, std::string>>(j, "env", d.id);
    if (j.contains("requiredEnv")) {
        d.required_env = get_field<std::vector<std::string>>(j, "requiredEnv", d.id);
    }
    if (j.contains("cwd")) {
        d.working_directory = get_field<std::string>(j, "cwd", d.id);
    } else if (j.contains("workingDirectory")) {
        d.working_directory = get_field<std::string>(j, "workingDirectory", d.id);
    }
    if (j.contains("autoStart")) d.auto_start = get_field<bool>(j, "autoStart", d.id);
    if (j.contains("enabled")) d.enabled = get_field<bool>(j, "enabled", d.id);

    if (j.contains("capabilities")) {
        const auto& caps = j.at("capabilities");
        if (!caps.is_object()) throw ConfigError("Server '" + d.id + "': 'capabilities' must be an object");
        d.capabilities.tools = caps.value("tools", false);
        d.capabilities.resources = caps.value("resources", false);
        d.capabilities.prompts = caps.value("prompts", false);
        d.capabilities.logging = caps.value("logging", false);
    }

    if (j.contains("defaultSecurityLevel")) {
        d.default_security_level = parse_level(j.at("defaultSecurityLevel"), d.id);
    }
    if (j.contains("toolSecurity")) {
        const auto& levels = j.at("toolSecurity");
        if (!levels.is_object()) throw ConfigError("Server '" + d.id + "': 'toolSecurity' must be an object");
        for (auto it = levels.begin(); it != levels.end(); ++it) {
            d.tool_security[it.key()] = parse_level(it.value(), d.id);
        }
    }
}

std::vector<ServerDefinition> parse_server_definitions(const nlohmann::json& j) {
    std::vector<ServerDefinition> defs;

    if (j.is_array()) {
        for (const auto& item : j) {
            ServerDefinition d;
            from_json(item, d);
            defs.push_back(std::move(d));
        }
    } else if (j.is_object() && j.contains("mcpServers")) {
        const auto& servers = j.at("mcpServers");
        if (!servers.is_object()) throw ConfigError("'mcpServers' must be an object");
        for (auto it = servers.begin(); it != servers.end(); ++it) {
            ServerDefinition d;
            d.id = it.key();
            nlohmann::json body = it.value();
            if (body.is_object() && !body.contains("id")) body["id"] = it.key();
            from_json(body, d);
            defs.push_back(std::move(d));
        }
    } else {
        throw ConfigError("Expected an array of servers or an object with 'mcpServers'");
    }

    std::set<std::string> seen;
    for (const auto& d : defs) {
        if (!seen.insert(d.id).second) {
            throw ConfigError("Duplicate server id '" + d.id + "'");
        }
    }
    return defs;
}

std::vector<ServerDefinition> default_server_catalog() {
    return {
        catalog_entry("filesystem", "Secure file operations with permission management", {},
                      {true, true, false, false}),
        catalog_entry("git", "Local Git repository operations", {}),
        catalog_entry("github", "GitHub API integration for repos, issues, PRs", {"GITHUB_TOKEN"}),
        catalog_entry("docker", "Container and image management", {}),
        catalog_entry("sentry", "Production error monitoring and debugging", {"SENTRY_DSN"}),
        catalog_entry("socket", "Security analysis for dependencies", {"SOCKET_API_KEY"}),
        catalog_entry("semgrep", "Static code analysis for vulnerabilities", {}),
        catalog_entry("jam", "Debug recordings with video and logs", {"JAM_API_KEY"}),
        catalog_entry("puppeteer", "Headless browser automation for testing", {}),
        catalog_entry("playwright", "Microsoft's web automation framework", {}),
        catalog_entry("postgresql", "Read-only database queries and schema inspection",
                      {"DATABASE_URL"}, {true, true, false, false}),
        catalog_entry("mindsdb", "Unified interface to vector databases", {"MINDSDB_API_KEY"}),
        catalog_entry("google-drive", "File search and management",
                      {"GOOGLE_CLIENT_ID", "GOOGLE_CLIENT_SECRET"}, {true, true, false, false}),
        catalog_entry("zapier", "Connect to 8,000+ applications", {"ZAPIER_API_KEY"}),
        catalog_entry("pipedream", "Access to thousands of APIs", {"PIPEDREAM_API_KEY"}),
    };
}

std::optional<std::string> process_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

std::vector<std::string> missing_environment(const ServerDefinition& def,
                                             const EnvLookup& lookup) {
    std::vector<std::string> missing;
    for (const auto& var : def.required_env) {
        auto it = def.env.find(var);
        if (it != def.env.end() && !it->second.empty()) continue;
        auto value = lookup ? lookup(var) : std::nullopt;
        if (!value || value->empty()) missing.push_back(var);
    }
    return missing;
}

} // namespace mcphost
