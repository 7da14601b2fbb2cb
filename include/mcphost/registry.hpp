#pragma once
#include "connection.hpp"
#include "error.hpp"
#include "types.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace mcphost {

/// Caller's reference to a registered connection. It stops resolving once
/// the server is unregistered; dereferencing it then throws NotFound.
class ServerHandle {
public:
    ServerHandle() = default;
    ServerHandle(std::string id, std::weak_ptr<ServerConnection> conn)
        : id_(std::move(id)), conn_(std::move(conn)) {}

    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] bool valid() const { return !conn_.expired(); }

    /// Keeps the connection alive for the duration of one expression.
    std::shared_ptr<ServerConnection> operator->() const { return lock(); }

    [[nodiscard]] std::shared_ptr<ServerConnection> lock() const {
        auto conn = conn_.lock();
        if (!conn) throw NotFound(id_);
        return conn;
    }

private:
    std::string id_;
    std::weak_ptr<ServerConnection> conn_;
};

/// The set of servers known to the host. Owns every connection; creation
/// and destruction of connections happen only through registration.
class Registry {
public:
    struct Options {
        ServerConnection::Options connection;
        std::shared_ptr<ProcessLauncher> launcher;   // defaults to fork/exec
    };

    explicit Registry() : Registry(Options{}) {}
    explicit Registry(Options opts);
    ~Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    /// Throws DuplicateId if `id` is taken. A null `connection` is built from
    /// the definition with the registry's options.
    ServerHandle register_server(const std::string& id, ServerDefinition def,
                                 std::shared_ptr<ServerConnection> connection = nullptr);
    ServerHandle register_server(ServerDefinition def);

    /// Stops the server, then removes it. Throws NotFound.
    void unregister_server(const std::string& id);

    /// Throws NotFound.
    [[nodiscard]] ServerHandle get(const std::string& id) const;
    [[nodiscard]] bool contains(const std::string& id) const;
    [[nodiscard]] std::vector<std::string> ids() const;
    [[nodiscard]] std::vector<ServerHandle> handles() const;
    [[nodiscard]] std::vector<ServerListing> list() const;
    [[nodiscard]] size_t size() const;

    void start(const std::string& id);
    void stop(const std::string& id);

    /// Starts every enabled auto-start server that is not Running.
    BulkResult start_auto_start_servers();

    /// Stops every Running, Starting or Restarting server.
    BulkResult stop_all();

    [[nodiscard]] std::map<std::string, ServerStatus> health_status() const;

private:
    std::shared_ptr<ServerConnection> find(const std::string& id) const;
    std::vector<std::shared_ptr<ServerConnection>> snapshot() const;

    Options opts_;
    mutable std::shared_mutex map_mutex_;
    std::map<std::string, std::shared_ptr<ServerConnection>> servers_;
    std::mutex unregister_mutex_;
};

} // namespace mcphost
