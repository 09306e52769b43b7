// ============================================================
// server/main.cpp -- snapcp server entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "server_app.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>

static ServerApp* g_app = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_app) g_app->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <state_dir> <ip> <port> [options]\n"
        << "\n"
        << "  state_dir          directory holding the persisted state\n"
        << "  ip                 IP address to listen on (use 0.0.0.0 for all interfaces)\n"
        << "  port               TCP port (default for clients: " << DEFAULT_SERVER_PORT << ")\n"
        << "\nOptions:\n"
        << "  --idle-timeout S   abort a session silent for S seconds (default: 60, 0 = never)\n"
        << "  --max-snapshot-mb N  reject uploads larger than N MiB (default: unlimited)\n"
        << "  --log-file PATH    also append log lines to PATH\n"
        << "  --verbose          enable debug logging\n"
        << "\nEach connection is one restore session. Sessions upload in parallel;\n"
        << "applying a snapshot is serialized.\n"
        << "\nExample:\n"
        << "  " << prog << " /var/lib/snapcp 0.0.0.0 " << DEFAULT_SERVER_PORT << "\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;
    platform::ignore_sigpipe();

    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }

    ServerConfig cfg;
    cfg.state_dir  = argv[1];
    cfg.listen_ip  = argv[2];
    int port_int   = std::atoi(argv[3]);
    int max_mb     = 0;
    std::string log_file;
    bool verbose   = false;

    for (int i = 4; i < argc; ++i) {
        if (std::strcmp(argv[i], "--idle-timeout") == 0 && i + 1 < argc) {
            cfg.idle_timeout_s = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--max-snapshot-mb") == 0 && i + 1 < argc) {
            max_mb = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!utils::validate_path(cfg.state_dir)) {
        std::cerr << "ERROR: Invalid state_dir\n";
        return 1;
    }
    if (cfg.listen_ip != "0.0.0.0" && !utils::validate_ip(cfg.listen_ip)) {
        std::cerr << "ERROR: Invalid IP address: " << cfg.listen_ip << "\n";
        return 1;
    }
    if (!utils::validate_port(port_int)) {
        std::cerr << "ERROR: Invalid port: " << port_int << "\n";
        return 1;
    }
    if (cfg.idle_timeout_s < 0 || cfg.idle_timeout_s > 86400) {
        std::cerr << "ERROR: --idle-timeout must be 0-86400\n";
        return 1;
    }
    if (max_mb < 0) {
        std::cerr << "ERROR: --max-snapshot-mb must not be negative\n";
        return 1;
    }

    cfg.listen_port        = (u16)port_int;
    cfg.max_snapshot_bytes = (u64)max_mb * 1024 * 1024;
    Logger::get().set_level(verbose ? LogLevel::DEBUG : LogLevel::INFO);

    try {
        if (!log_file.empty()) Logger::get().set_log_file(log_file);

        ServerApp app(std::move(cfg));
        g_app = &app;

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        int rc = app.run();
        g_app = nullptr;
        return rc;
    } catch (const std::exception& e) {
        g_app = nullptr;
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
