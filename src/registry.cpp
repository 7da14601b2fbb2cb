#include "mcphost/registry.hpp"
#include "mcphost/error.hpp"
#include "mcphost/log.hpp"

namespace mcphost {

Registry::Registry(Options opts) : opts_(std::move(opts)) {
    if (!opts_.launcher) opts_.launcher = std::make_shared<PosixProcessLauncher>();
}

Registry::~Registry() {
    auto result = stop_all();
    for (const auto& f : result.failures) {
        MCPHOST_LOG_ERROR("Failed to stop server '", f.id, "' during shutdown: ", f.message);
    }
}

// ---------- Membership ----------

ServerHandle Registry::register_server(const std::string& id, ServerDefinition def,
                                       std::shared_ptr<ServerConnection> connection) {
    if (id.empty()) throw ConfigError("Server id must not be empty");
    if (def.id.empty()) def.id = id;
    if (def.id != id) {
        throw ConfigError("Server id '" + id + "' does not match definition id '" + def.id + "'");
    }
    if (connection && connection->id() != id) {
        throw ConfigError("Connection for '" + connection->id() + "' registered as '" + id + "'");
    }

    {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        if (servers_.count(id)) throw DuplicateId(id);
    }
    if (!connection) {
        connection = std::make_shared<ServerConnection>(def, opts_.connection, opts_.launcher);
    }

    std::unique_lock<std::shared_mutex> lock(map_mutex_);
    auto [it, inserted] = servers_.emplace(id, connection);
    if (!inserted) throw DuplicateId(id);
    MCPHOST_LOG_INFO("Registered MCP server '", id, "' (", def.command, ")");
    return ServerHandle(id, it->second);
}

ServerHandle Registry::register_server(ServerDefinition def) {
    std::string id = def.id;
    return register_server(id, std::move(def));
}

void Registry::unregister_server(const std::string& id) {
    std::lock_guard<std::mutex> serial(unregister_mutex_);
    auto conn = find(id);
    try {
        conn->stop();
    } catch (const HostError& e) {
        MCPHOST_LOG_WARN("Server '", id, "' did not stop cleanly: ", e.what());
    }
    {
        std::unique_lock<std::shared_mutex> lock(map_mutex_);
        servers_.erase(id);
    }
    MCPHOST_LOG_INFO("Unregistered MCP server '", id, "'");
}

std::shared_ptr<ServerConnection> Registry::find(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    auto it = servers_.find(id);
    if (it == servers_.end()) throw NotFound(id);
    return it->second;
}

std::vector<std::shared_ptr<ServerConnection>> Registry::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    std::vector<std::shared_ptr<ServerConnection>> out;
    out.reserve(servers_.size());
    for (const auto& [id, conn] : servers_) out.push_back(conn);
    return out;
}

// ---------- Queries ----------

ServerHandle Registry::get(const std::string& id) const {
    return ServerHandle(id, find(id));
}

bool Registry::contains(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    return servers_.count(id) > 0;
}

std::vector<std::string> Registry::ids() const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    std::vector<std::string> out;
    for (const auto& [id, conn] : servers_) out.push_back(id);
    return out;
}

std::vector<ServerHandle> Registry::handles() const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    std::vector<ServerHandle> out;
    for (const auto& [id, conn] : servers_) out.emplace_back(id, conn);
    return out;
}

std::vector<ServerListing> Registry::list() const {
    std::vector<ServerListing> out;
    for (const auto& conn : snapshot()) out.push_back(conn->listing());
    return out;
}

size_t Registry::size() const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    return servers_.size();
}

std::map<std::string, ServerStatus> Registry::health_status() const {
    std::map<std::string, ServerStatus> out;
    for (const auto& conn : snapshot()) out.emplace(conn->id(), conn->status());
    return out;
}

// ---------- Lifecycle ----------

void Registry::start(const std::string& id) {
    find(id)->start();
}

void Registry::stop(const std::string& id) {
    find(id)->stop();
}

BulkResult Registry::start_auto_start_servers() {
    BulkResult result;
    for (const auto& conn : snapshot()) {
        const auto& def = conn->definition();
        if (!def.auto_start || !def.enabled) continue;
        if (conn->state() == ConnectionState::Running) continue;
        try {
            conn->start();
            result.succeeded.push_back(def.id);
        } catch (const std::exception& e) {
            MCPHOST_LOG_ERROR("Auto-start of '", def.id, "' failed: ", e.what());
            result.failures.push_back({def.id, e.what()});
        }
    }
    return result;
}

BulkResult Registry::stop_all() {
    BulkResult result;
    for (const auto& conn : snapshot()) {
        auto s = conn->state();
        if (s != ConnectionState::Running && s != ConnectionState::Starting
            && s != ConnectionState::Restarting) {
            continue;
        }
        try {
            conn->stop();
            result.succeeded.push_back(conn->id());
        } catch (const std::exception& e) {
            MCPHOST_LOG_ERROR("Stopping '", conn->id(), "' failed: ", e.what());
            result.failures.push_back({conn->id(), e.what()});
        }
    }
    return result;
}

} // namespace mcphost
