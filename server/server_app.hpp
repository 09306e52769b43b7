#pragma once

// ============================================================
// server_app.hpp -- snapcp server: restore endpoint daemon
//   Listens on a port and serves CONCURRENT restore sessions.
//
// Concurrency model:
//   accept_loop()      → accepts one socket at a time, spawns a
//                        connection thread per socket.
//   connection threads → each drives one RestoreSession from
//                        OPEN to RESULT. Receiving runs in parallel;
//                        the commit is serialized inside StateStore.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/socket.hpp"
#include "state_store.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <memory>
#include <atomic>
#include <thread>
#include <mutex>

struct ServerConfig {
    std::string state_dir;
    std::string listen_ip{"0.0.0.0"};
    u16         listen_port{DEFAULT_SERVER_PORT};
    int         idle_timeout_s{60};     // max silence while receiving (0 = none)
    u64         max_snapshot_bytes{0};  // 0 = unbounded
};

class ServerApp {
public:
    explicit ServerApp(ServerConfig config);
    ~ServerApp();

    // Prepare the state directory, bind and listen. Called by run() if
    // the caller has not done so already.
    void listen();

    // Port actually bound (useful with listen_port = 0)
    u16 port() const { return bound_port_; }

    // Blocks until stop() is called (or fatal error)
    int run();

    // Call from signal handler to shut down gracefully. In-flight
    // sessions are cut off and discarded.
    void stop();

    StateStore& store() { return store_; }

private:
    struct Worker {
        std::thread                        thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    ServerConfig           config_;
    StateStore             store_;
    TcpSocket              listen_sock_;
    std::atomic<bool>      listening_{false};
    std::atomic<bool>      running_{false};
    u16                    bound_port_{0};

    std::vector<Worker>    workers_;
    std::mutex             workers_mutex_;

    // Sockets of in-flight sessions, so stop() can interrupt them
    std::unordered_map<u64, TcpSocket*> active_;
    std::mutex                          active_mutex_;

    void accept_loop();

    // One connection = one restore session
    void handle_connection(TcpSocket sock);
    void serve_session(TcpSocket& sock, u64 session_id);
    void send_result(TcpSocket& sock, const RestoreResult& r, u64 session_id);
    void drain_input(TcpSocket& sock);

    // Join finished workers (all of them if wait_all)
    void reap_workers(bool wait_all);
};
