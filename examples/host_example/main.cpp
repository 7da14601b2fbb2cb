/// Host example: loads server definitions from a JSON file, starts the
/// auto-start servers, lists their tools and prints a health report.
/// Usage: ./host_example <servers.json>
///
/// servers.json may be an array of definitions or an {"mcpServers": {...}}
/// object, e.g.
///   {"mcpServers": {"fs": {"command": "./mock_mcp_server", "autoStart": true}}}

#include <mcphost/mcphost.hpp>
#include <fstream>
#include <iostream>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <servers.json>\n";
        return 1;
    }

    std::ifstream in(argv[1]);
    if (!in) {
        std::cerr << "Cannot open " << argv[1] << "\n";
        return 1;
    }

    try {
        auto defs = mcphost::parse_server_definitions(nlohmann::json::parse(in));

        mcphost::Registry registry;
        for (auto& def : defs) registry.register_server(std::move(def));

        auto started = registry.start_auto_start_servers();
        for (const auto& f : started.failures) {
            std::cout << "[" << f.id << "] failed to start: " << f.message << "\n";
        }

        for (const auto& id : started.succeeded) {
            auto conn = registry.get(id).lock();
            auto caps = conn->capabilities();
            std::cout << "\n--- " << id << " (" << caps.server_info.name
                      << " v" << caps.server_info.version << ", protocol "
                      << caps.protocol_version << ") ---\n";
            for (const auto& tool : conn->list_tools()) {
                std::cout << "  " << tool.name << " ["
                          << mcphost::security_level_to_string(tool.security_level) << "]";
                if (tool.description) std::cout << " - " << *tool.description;
                std::cout << "\n";
            }
        }

        mcphost::HealthChecker checker(registry);
        checker.check_all();
        std::cout << "\n" << mcphost::format_health_report(checker.report());

        auto stopped = registry.stop_all();
        for (const auto& f : stopped.failures) {
            std::cout << "[" << f.id << "] failed to stop: " << f.message << "\n";
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Invalid JSON in " << argv[1] << ": " << e.what() << "\n";
        return 1;
    } catch (const mcphost::HostError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
