#pragma once

#include "CancellationToken.hpp"
#include "RequestHandler.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct ServerConfig {
    std::string socket_path = "/tmp/automacro.sock";
    int max_connections = 5;
    int idle_timeout_sec = 300;     // 0 disables the idle shutdown
};

// Serves many connections at once, one thread each, while running at most one
// handler call at a time across all of them.
class RpcServer {
public:
    RpcServer(ServerConfig config, RequestHandler& handler);
    ~RpcServer();

    RpcServer(const RpcServer&) = delete;
    RpcServer& operator=(const RpcServer&) = delete;

    // Bind and listen, then accept on a background thread.
    // Throws std::runtime_error when the socket cannot be set up.
    void start();

    // start() and block until stop() or the idle timeout
    void run();

    void stop();

    // Ask run() to return; safe to call from any thread
    void request_stop();

    // Read, dispatch and answer lines on an already connected descriptor
    // until the peer hangs up or the server stops. Takes ownership of fd.
    void serve_connection(int fd);

    // Response line for one request line
    std::string handle_line(const std::string& line);

    size_t active_connections() const { return active_connections_.load(); }

    // Connection threads not yet joined, finished or not
    size_t retained_threads();
    bool is_running() const { return running_.load(); }

private:
    struct Connection {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void accept_loop();
    void reject(int fd);

    // Join connection threads whose peer has gone
    void reap_finished();

    ServerConfig config_;
    RequestHandler& handler_;

    int listen_fd_ = -1;
    std::atomic<bool> running_{false};
    CancellationSource stop_source_;

    std::thread accept_thread_;
    std::mutex threads_mutex_;
    std::vector<Connection> connections_;
    std::atomic<size_t> active_connections_{0};

    std::mutex activity_mutex_;
    std::chrono::steady_clock::time_point last_activity_;

    // Held only around handler calls; the backend session is not reentrant
    std::mutex command_mutex_;
};
