#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace mcphost {

class Codec {
public:
    /// Parse one JSON-RPC frame.
    /// Throws ParseError on invalid JSON, a wrong jsonrpc version, or a
    /// message that is neither request, response nor notification.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Serialize a message to compact JSON (no trailing newline).
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

} // namespace mcphost
