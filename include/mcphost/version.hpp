#pragma once
#include <array>
#include <string_view>

namespace mcphost {

constexpr std::string_view LIBRARY_VERSION  = "0.1.0";
constexpr std::string_view CLIENT_NAME      = "mcphost";
constexpr std::string_view PROTOCOL_VERSION = "2025-06-18";
constexpr std::string_view JSONRPC_VERSION  = "2.0";

/// Protocol revisions a server may answer initialize with. Newest first.
constexpr std::array<std::string_view, 3> SUPPORTED_PROTOCOL_VERSIONS = {
    "2025-06-18", "2025-03-26", "2024-11-05"
};

[[nodiscard]] constexpr bool is_supported_protocol_version(std::string_view v) {
    for (auto s : SUPPORTED_PROTOCOL_VERSIONS) {
        if (s == v) return true;
    }
    return false;
}

} // namespace mcphost
