#pragma once
#include "types.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcphost {

void to_json(nlohmann::json& j, const ServerDefinition& d);

/// Throws ConfigError on a missing id/command or a malformed field.
void from_json(const nlohmann::json& j, ServerDefinition& d);

/// Accepts either an array of definitions or an object of the form
/// {"mcpServers": {"<id>": {...}}}. Ids must be unique.
std::vector<ServerDefinition> parse_server_definitions(const nlohmann::json& j);

/// The pre-integrated servers, all with auto-start off.
std::vector<ServerDefinition> default_server_catalog();

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Reads the host process environment.
std::optional<std::string> process_env(const std::string& name);

/// Required variables that are neither overridden by the definition nor
/// present (non-empty) in the environment seen through `lookup`.
std::vector<std::string> missing_environment(const ServerDefinition& def,
                                             const EnvLookup& lookup = process_env);

} // namespace mcphost
