#include "parley_server/log.hpp"
#include "parley_server/server.hpp"
#include "parley_server/server_config.hpp"

#include <csignal>
#include <fstream>
#include <iostream>

namespace {
parley_server::EpollServer* g_server = nullptr;

extern "C" void on_signal(int) {
    if (g_server) g_server->stop();
}
}

int main(int argc, char* argv[]) {
    try {
        // Load config from argv[1], else configs/server.toml (or fallback to defaults)
        const std::string config_path = argc > 1 ? argv[1] : "configs/server.toml";
        parley_server::ServerConfig cfg;

        if (std::ifstream(config_path)) {
            cfg = parley_server::ServerConfig::from_file(config_path);
            std::cout << "[server] Loaded config from " << config_path << "\n";
        } else if (argc > 1) {
            std::cerr << "FATAL: config file not found: " << config_path << std::endl;
            return 1;
        } else {
            std::cout << "[server] Config not found, using defaults\n";
        }

        parley_server::LogLevel level = parley_server::LogLevel::Info;
        parley_server::parse_log_level(cfg.log_level, level);
        parley_server::set_log_level(level);

        parley_server::log_info("Starting on ", cfg.bind_address, ":", cfg.port,
                                " (history ", cfg.history_limit, ", default room '",
                                cfg.default_room, "')");

        parley_server::EpollServer server(std::move(cfg));
        server.open();

        g_server = &server;
        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);
        std::signal(SIGPIPE, SIG_IGN);

        server.run();  // blocks until SIGINT/SIGTERM
        g_server = nullptr;

    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
