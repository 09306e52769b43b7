// ============================================================
// client/main.cpp -- snapcp client entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/deployment.hpp"
#include "restore_client.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <cstdlib>
#include <cstring>

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " restore [<file>|-] [options]\n"
        << "\n"
        << "  Restore the server's state from a snapshot.\n"
        << "\n"
        << "  file            snapshot to upload; '-' reads stdin, no argument\n"
        << "                  reads stdin unless it is a terminal\n"
        << "\nOptions:\n"
        << "  --addr H:P      server address (default: $" << ENV_SERVER_ADDR
        << ", else 127.0.0.1:" << DEFAULT_SERVER_PORT << ")\n"
        << "  --timeout S     give up waiting for the server's answer after S seconds\n"
        << "                  (default: wait indefinitely)\n"
        << "  --verbose       enable debug logging\n"
        << "\nExamples:\n"
        << "  " << prog << " restore backup.snap\n"
        << "  cat backup.snap | " << prog << " restore --addr 10.0.0.5:" << DEFAULT_SERVER_PORT << "\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;
    platform::ignore_sigpipe();

    if (argc < 2 || std::strcmp(argv[1], "restore") != 0) {
        print_usage(argv[0]);
        return 1;
    }

    std::vector<std::string> positional;
    std::string addr_opt;
    int timeout_s = 0;
    bool verbose  = false;

    for (int i = 2; i < argc; ++i) {
        if (std::strcmp(argv[i], "--addr") == 0 && i + 1 < argc) {
            addr_opt = argv[++i];
        } else if (std::strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
            timeout_s = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            positional.push_back(argv[i]);
        }
    }

    if (timeout_s < 0 || timeout_s > MAX_RESULT_TIMEOUT_S) {
        std::cerr << "ERROR: --timeout must be 0-" << MAX_RESULT_TIMEOUT_S << "\n";
        return 1;
    }

    // stdout is reserved for the completion message
    Logger::get().set_stderr_only(true);
    Logger::get().set_level(verbose ? LogLevel::DEBUG : LogLevel::WARN);

    try {
        std::string host;
        u16 port = DEFAULT_SERVER_PORT;
        resolve_server(addr_opt, host, port);

        file_io::ByteSource src = select_source(positional);
        const bool from_stdin   = src.is_stdin();
        const std::string name  = src.name();

        std::unique_ptr<TcpRestoreStream> stream;
        try {
            stream = std::make_unique<TcpRestoreStream>(host, port, timeout_s);
        } catch (const std::exception& e) {
            throw RestoreError("failed to connect to " + host + ":" +
                               std::to_string(port) + ": " + e.what());
        }

        RestoreClient client;
        RestoreResult r = client.run(src, *stream);
        src.close();

        if (!r.ok()) {
            std::cerr << "ERROR: server rejected snapshot (" << restore_status_str(r.status)
                      << "): " << r.message << "\n";
            return 1;
        }

        if (from_stdin) {
            std::cout << "Server data restored.\n";
        } else {
            std::cout << "Server data restored from '" << name << "'.\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
}
