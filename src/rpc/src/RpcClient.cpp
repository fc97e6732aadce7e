#include "RpcClient.hpp"
#include "RpcProtocol.hpp"
#include "TransportError.hpp"
#include "LogUtils.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <functional>
#include <optional>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>

namespace {

constexpr auto kGateSlice = std::chrono::milliseconds(50);
constexpr auto kConnectRetry = std::chrono::milliseconds(100);

struct GateGuard {
    std::function<void()> release;
    ~GateGuard() { release(); }
};

}

RpcClient::RpcClient(int connected_fd)
    : channel_(std::make_shared<LineChannel>(connected_fd)) {}

void RpcClient::connect(const std::string& socket_path, int timeout_ms) {
    sockaddr_un addr{};
    if (socket_path.size() >= sizeof(addr.sun_path)) {
        throw TransportError("Socket path too long: " + socket_path);
    }
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    int last_errno = 0;
    while (true) {
        int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
        if (fd < 0) {
            throw TransportError(std::string("socket failed: ") + std::strerror(errno));
        }
        if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
            std::lock_guard<std::mutex> lock(channel_mutex_);
            channel_ = std::make_shared<LineChannel>(fd);
            stale_responses_ = 0;
            LogUtils::debug("Connected to automation server at {}", socket_path);
            return;
        }
        last_errno = errno;
        ::close(fd);

        if (std::chrono::steady_clock::now() + kConnectRetry > deadline) break;
        std::this_thread::sleep_for(kConnectRetry);
    }
    throw TransportError("Cannot connect to automation server at " + socket_path + ": " +
                         std::strerror(last_errno));
}

void RpcClient::disconnect() {
    std::lock_guard<std::mutex> lock(channel_mutex_);
    if (channel_) {
        channel_->shutdown();
        channel_.reset();
    }
}

bool RpcClient::is_connected() const {
    std::lock_guard<std::mutex> lock(channel_mutex_);
    return channel_ != nullptr;
}

void RpcClient::acquire_gate(const CancellationToken& cancel) {
    std::unique_lock<std::mutex> lock(gate_mutex_);
    while (busy_) {
        if (cancel.is_cancellation_requested()) {
            throw OperationCancelled("Cancelled while waiting for the connection");
        }
        gate_cond_.wait_for(lock, kGateSlice);
    }
    busy_ = true;
}

void RpcClient::release_gate() {
    {
        std::lock_guard<std::mutex> lock(gate_mutex_);
        busy_ = false;
    }
    gate_cond_.notify_one();
}

nlohmann::json RpcClient::call(const std::string& method,
                               const nlohmann::json& args,
                               const CancellationToken& cancel) {
    std::shared_ptr<LineChannel> channel;
    {
        std::lock_guard<std::mutex> lock(channel_mutex_);
        channel = channel_;
    }
    if (!channel) {
        throw TransportError("Not connected to automation server");
    }

    acquire_gate(cancel);
    GateGuard guard{[this]() { release_gate(); }};

    while (stale_responses_ > 0) {
        if (!channel->read_line(cancel)) {
            throw TransportError("connection closed");
        }
        --stale_responses_;
    }

    channel->write_line(RpcProtocol::encode(RpcProtocol::make_request(method, args)));

    std::optional<std::string> line;
    try {
        line = channel->read_line(cancel);
    } catch (const OperationCancelled&) {
        ++stale_responses_;
        throw;
    }
    if (!line) {
        throw TransportError("connection closed");
    }

    nlohmann::json response;
    try {
        response = nlohmann::json::parse(*line);
    } catch (const nlohmann::json::parse_error&) {
        throw TransportError("Malformed response from server");
    }
    auto ok = response.is_object() ? response.find("ok") : response.end();
    if (!response.is_object() || ok == response.end() || !ok->is_boolean()) {
        throw TransportError("Malformed response from server");
    }
    return response;
}
