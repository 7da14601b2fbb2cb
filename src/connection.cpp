#include "mcphost/connection.hpp"
#include "mcphost/error.hpp"
#include "mcphost/log.hpp"
#include <algorithm>

namespace mcphost {

namespace {

ProtocolClient::Options client_options(const ServerDefinition& def,
                                       ProtocolClient::Options opts) {
    opts.server_id = def.id;
    return opts;
}

bool hint(const std::optional<nlohmann::json>& annotations, const char* key) {
    if (!annotations || !annotations->is_object()) return false;
    auto it = annotations->find(key);
    return it != annotations->end() && it->is_boolean() && it->get<bool>();
}

} // anonymous namespace

ServerConnection::ServerConnection(ServerDefinition def, Options opts,
                                   std::shared_ptr<ProcessLauncher> launcher)
    : def_(std::move(def)),
      opts_(std::move(opts)),
      events_(std::make_shared<Channel<ServerEvent>>()),
      client_(client_options(def_, opts_.client), events_),
      supervisor_(def_, std::move(launcher),
                  SessionHooks{
                      [this](std::unique_ptr<ITransport> t, std::function<void()> on_closed) {
                          client_.connect(std::move(t), std::move(on_closed));
                      },
                      [this]() { handshake(); },
                      [this]() { client_.disconnect(); },
                      [this]() {
                          client_.fail_all_pending(std::make_exception_ptr(
                              ConnectionStopped("Server '" + def_.id + "' is stopping")));
                      }},
                  opts_.supervisor, events_) {}

ServerConnection::~ServerConnection() {
    events_->close();
}

// ---------- Lifecycle ----------

void ServerConnection::start() {
    supervisor_.start();
}

void ServerConnection::stop() {
    supervisor_.stop();
}

void ServerConnection::restart() {
    supervisor_.restart();
}

ConnectionState ServerConnection::state() const {
    return supervisor_.state();
}

bool ServerConnection::wait_for_state(ConnectionState target,
                                      std::chrono::milliseconds timeout) const {
    return supervisor_.wait_for_state(target, timeout);
}

void ServerConnection::handshake() {
    client_.initialize();
    if (!opts_.prefetch_capabilities) return;

    auto caps = client_.snapshot().server_capabilities;
    try {
        if (caps.contains("tools")) client_.tools();
        if (caps.contains("resources")) client_.resources();
    } catch (const HostError& e) {
        // The lists are fetched again on first use.
        MCPHOST_LOG_WARN("[", def_.id, "] capability prefetch failed: ", e.what());
    }
}

void ServerConnection::ensure_running() const {
    auto s = supervisor_.state();
    if (s != ConnectionState::Running) {
        throw ConnectionStopped("Server '" + def_.id + "' is not running (" + to_string(s) + ")");
    }
}

nlohmann::json ServerConnection::request(const std::string& method, const nlohmann::json& params,
                                         std::optional<std::chrono::milliseconds> timeout) {
    ensure_running();
    ++request_count_;
    try {
        return client_.call(method, params, timeout);
    } catch (const HostError&) {
        ++error_count_;
        throw;
    }
}

// ---------- Tools ----------

SecurityLevel ServerConnection::security_level_for(const ToolDescriptor& tool) const {
    auto it = def_.tool_security.find(tool.name);
    if (it != def_.tool_security.end()) return it->second;

    if (hint(tool.annotations, "readOnlyHint")) return SecurityLevel::Safe;
    SecurityLevel level = def_.default_security_level;
    if (hint(tool.annotations, "destructiveHint")) level = std::max(level, SecurityLevel::System);
    if (hint(tool.annotations, "openWorldHint")) level = std::max(level, SecurityLevel::Network);
    return level;
}

std::vector<ToolDescriptor> ServerConnection::list_tools() {
    ensure_running();
    auto tools = client_.tools();
    for (auto& t : tools) t.security_level = security_level_for(t);
    return tools;
}

ToolResult ServerConnection::call_tool(const std::string& name, const nlohmann::json& arguments,
                                       std::optional<Confirmation> confirmation) {
    ToolDescriptor descriptor;
    descriptor.name = name;
    auto tools = list_tools();
    auto it = std::find_if(tools.begin(), tools.end(),
                           [&](const ToolDescriptor& t) { return t.name == name; });
    if (it != tools.end()) descriptor = *it;
    else descriptor.security_level = security_level_for(descriptor);

    if (descriptor.security_level > SecurityLevel::Safe
        && !(confirmation && confirmation->covers(descriptor.security_level))) {
        throw ConfirmationRequired(name, descriptor.security_level);
    }

    nlohmann::json result = request("tools/call", {{"name", name}, {"arguments", arguments}});
    try {
        return result.get<ToolResult>();
    } catch (const std::exception& e) {
        ++error_count_;
        throw ProtocolViolation("Malformed tools/call result from '" + def_.id + "': " + e.what());
    }
}

// ---------- Resources ----------

std::vector<ResourceDescriptor> ServerConnection::list_resources() {
    ensure_running();
    return client_.resources();
}

std::vector<ResourceContent> ServerConnection::read_resource(const std::string& uri) {
    nlohmann::json result;
    try {
        result = request("resources/read", {{"uri", uri}});
    } catch (const RemoteToolError& e) {
        if (e.code == error::ResourceNotFound) throw ResourceNotFound(uri);
        throw;
    }

    std::vector<ResourceContent> contents;
    if (result.contains("contents") && result.at("contents").is_array()) {
        for (const auto& item : result.at("contents")) {
            try {
                auto c = item.get<ResourceContent>();
                if (c.text || c.blob) contents.push_back(std::move(c));
            } catch (const nlohmann::json::exception& e) {
                MCPHOST_LOG_WARN("[", def_.id, "] skipping malformed resource content: ", e.what());
            }
        }
    }
    if (contents.empty()) throw ResourceNotFound(uri);
    return contents;
}

void ServerConnection::subscribe(const std::string& uri) {
    (void)request("resources/subscribe", {{"uri", uri}});
}

void ServerConnection::unsubscribe(const std::string& uri) {
    (void)request("resources/unsubscribe", {{"uri", uri}});
}

// ---------- Health ----------

std::chrono::milliseconds ServerConnection::ping(std::optional<std::chrono::milliseconds> timeout) {
    auto t0 = std::chrono::steady_clock::now();
    (void)request("ping", nlohmann::json::object(), timeout);
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0);
}

void ServerConnection::record_health_outcome(bool healthy, const std::optional<std::string>& error) {
    supervisor_.record_health_outcome(healthy, error);
}

// ---------- Observation ----------

ServerStatus ServerConnection::status() const {
    ServerStatus s = supervisor_.status();
    s.request_count = request_count_;
    s.error_count = error_count_;
    return s;
}

CapabilitySnapshot ServerConnection::capabilities() const {
    return client_.snapshot();
}

ServerListing ServerConnection::listing() const {
    ServerListing l;
    l.id = def_.id;
    l.name = def_.name;
    l.description = def_.description;
    l.version = def_.version;
    l.enabled = def_.enabled;
    l.loaded = supervisor_.state() == ConnectionState::Running;
    return l;
}

} // namespace mcphost
