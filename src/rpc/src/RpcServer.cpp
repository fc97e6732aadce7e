#include "RpcServer.hpp"
#include "LineChannel.hpp"
#include "RpcProtocol.hpp"
#include "TransportError.hpp"
#include "LogUtils.hpp"
#include <algorithm>
#include <cerrno>
#include <iterator>
#include <cstring>
#include <poll.h>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace {

constexpr int kAcceptPollMs = 200;

}

RpcServer::RpcServer(ServerConfig config, RequestHandler& handler)
    : config_(std::move(config)),
      handler_(handler),
      last_activity_(std::chrono::steady_clock::now()) {}

RpcServer::~RpcServer() {
    stop();
}

void RpcServer::start() {
    sockaddr_un addr{};
    if (config_.socket_path.empty() || config_.socket_path.size() >= sizeof(addr.sun_path)) {
        throw std::runtime_error("Invalid socket path: " + config_.socket_path);
    }
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, config_.socket_path.c_str(), sizeof(addr.sun_path) - 1);

    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        throw std::runtime_error(std::string("socket failed: ") + std::strerror(errno));
    }

    ::unlink(config_.socket_path.c_str());
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(fd);
        throw std::runtime_error("bind " + config_.socket_path + " failed: " + std::strerror(err));
    }
    if (::listen(fd, 16) < 0) {
        int err = errno;
        ::close(fd);
        throw std::runtime_error(std::string("listen failed: ") + std::strerror(err));
    }

    listen_fd_ = fd;
    running_ = true;
    {
        std::lock_guard<std::mutex> lock(activity_mutex_);
        last_activity_ = std::chrono::steady_clock::now();
    }
    accept_thread_ = std::thread([this]() { accept_loop(); });
    LogUtils::info("Automation server listening on {} (max {} connections)",
                   config_.socket_path, config_.max_connections);
}

void RpcServer::run() {
    start();
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    stop();
}

void RpcServer::stop() {
    const bool was_running = running_.exchange(false);
    stop_source_.cancel();

    if (accept_thread_.joinable() && accept_thread_.get_id() != std::this_thread::get_id()) {
        accept_thread_.join();
    }

    std::vector<Connection> connections;
    {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        connections.swap(connections_);
    }
    for (auto& c : connections) {
        if (c.thread.joinable()) c.thread.join();
    }

    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
        ::unlink(config_.socket_path.c_str());
    }
    if (was_running) {
        LogUtils::info("Automation server stopped");
    }
}

void RpcServer::request_stop() {
    stop_source_.cancel();
}

size_t RpcServer::retained_threads() {
    std::lock_guard<std::mutex> lock(threads_mutex_);
    return connections_.size();
}

void RpcServer::reap_finished() {
    std::vector<Connection> finished;
    {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        auto split = std::stable_partition(connections_.begin(), connections_.end(),
                                           [](const Connection& c) { return !c.done->load(); });
        std::move(split, connections_.end(), std::back_inserter(finished));
        connections_.erase(split, connections_.end());
    }
    for (auto& c : finished) {
        if (c.thread.joinable()) c.thread.join();
    }
}

void RpcServer::reject(int fd) {
    LogUtils::warn("Rejecting connection: {} connections already open", config_.max_connections);
    LineChannel channel(fd);
    try {
        channel.write_line(RpcProtocol::encode(RpcProtocol::error(
            "Server busy: maximum of " + std::to_string(config_.max_connections) + " connections reached")));
    } catch (const TransportError& e) {
        LogUtils::debug("Rejected client went away: {}", e.what());
    }
}

void RpcServer::accept_loop() {
    const CancellationToken stop_token = stop_source_.token();
    while (running_ && !stop_token.is_cancelled()) {
        reap_finished();

        pollfd pfd{listen_fd_, POLLIN, 0};
        int ready = ::poll(&pfd, 1, kAcceptPollMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            LogUtils::error("Accept poll failed: {}", std::strerror(errno));
            break;
        }

        if (ready == 0) {
            if (config_.idle_timeout_sec > 0 && active_connections_ == 0) {
                std::lock_guard<std::mutex> lock(activity_mutex_);
                auto idle = std::chrono::steady_clock::now() - last_activity_;
                if (idle >= std::chrono::seconds(config_.idle_timeout_sec)) {
                    LogUtils::info("No connections for {}s, shutting down", config_.idle_timeout_sec);
                    running_ = false;
                    break;
                }
            }
            continue;
        }

        int fd = ::accept(listen_fd_, nullptr, nullptr);
        if (fd < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED) continue;
            LogUtils::error("Accept failed: {}", std::strerror(errno));
            continue;
        }

        if (active_connections_ >= static_cast<size_t>(config_.max_connections)) {
            reject(fd);
            continue;
        }

        active_connections_++;
        auto done = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard<std::mutex> lock(threads_mutex_);
        connections_.push_back(Connection{std::thread([this, fd, done]() {
            serve_connection(fd);
            {
                std::lock_guard<std::mutex> activity_lock(activity_mutex_);
                last_activity_ = std::chrono::steady_clock::now();
            }
            active_connections_--;
            done->store(true);
        }), done});
    }
}

void RpcServer::serve_connection(int fd) {
    LineChannel channel(fd);
    const CancellationToken stop_token = stop_source_.token();
    LogUtils::info("Connection {} opened", fd);

    try {
        while (true) {
            std::optional<std::string> line = channel.read_line(stop_token);
            if (!line) break;
            if (line->empty()) continue;
            channel.write_line(handle_line(*line));
        }
    } catch (const OperationCancelled&) {
        LogUtils::debug("Connection {} closed by server shutdown", fd);
    } catch (const TransportError& e) {
        LogUtils::warn("Connection {} failed: {}", fd, e.what());
    }

    LogUtils::info("Connection {} closed", fd);
}

std::string RpcServer::handle_line(const std::string& line) {
    RpcProtocol::Request request;
    try {
        request = RpcProtocol::parse_request(line);
    } catch (const std::exception& e) {
        LogUtils::warn("Invalid request: {}", e.what());
        return RpcProtocol::encode(RpcProtocol::error(std::string("Invalid request: ") + e.what()));
    }

    if (!handler_.supports(request.method)) {
        LogUtils::warn("Unknown method: {}", request.method);
        return RpcProtocol::encode(RpcProtocol::error("Unknown method: " + request.method));
    }

    nlohmann::json response;
    try {
        std::lock_guard<std::mutex> lock(command_mutex_);
        response = handler_.handle(request.method, request.args);
    } catch (const std::exception& e) {
        LogUtils::error("Dispatch of {} failed: {}", request.method, e.what());
        response = RpcProtocol::error(e.what());
    }
    return RpcProtocol::encode(response);
}
