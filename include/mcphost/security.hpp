#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace mcphost {

/// How much of the user's machine a tool may touch. Ordered: a tool above
/// Safe needs an explicit confirmation covering its level.
enum class SecurityLevel {
    Safe,
    Workspace,
    System,
    Network
};

std::string security_level_to_string(SecurityLevel level);
std::optional<SecurityLevel> security_level_from_string(std::string_view s);

/// Caller's grant for tool invocations up to and including `granted`.
struct Confirmation {
    SecurityLevel granted = SecurityLevel::Safe;

    [[nodiscard]] bool covers(SecurityLevel required) const { return granted >= required; }
};

} // namespace mcphost
