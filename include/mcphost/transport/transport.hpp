#pragma once
#include "../json_rpc.hpp"
#include <exception>
#include <functional>

namespace mcphost {

using MessageCallback = std::function<void(JsonRpcMessage)>;
using ErrorCallback = std::function<void(std::exception_ptr)>;
using CloseCallback = std::function<void()>;

/// Abstract message transport to one server.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Run the read side on the calling thread until shutdown() or until the
    /// peer closes. `on_close` fires only for a peer-side close, never for
    /// a local shutdown().
    virtual void start(MessageCallback on_message,
                       ErrorCallback on_error = nullptr,
                       CloseCallback on_close = nullptr) = 0;

    /// Queue a message for the peer. Throws TransportError once closed.
    virtual void send(const JsonRpcMessage& msg) = 0;

    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace mcphost
