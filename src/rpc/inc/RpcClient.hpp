#pragma once

#include "CancellationToken.hpp"
#include "LineChannel.hpp"
#include <condition_variable>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

// Request/response client with one call in flight per connection.
//
// The gate is held from writing a request until its response is read. A call
// made without a deadline keeps the gate for as long as the server takes to
// answer, and any later call on the same connection waits for it; that later
// call's deadline only bounds its own wait for the gate. A deadline-bearing
// call that gives up after sending its request leaves a response behind, which
// the next holder of the gate reads and discards before sending its own.
class RpcClient {
public:
    RpcClient() = default;
    explicit RpcClient(int connected_fd);
    ~RpcClient() = default;

    RpcClient(const RpcClient&) = delete;
    RpcClient& operator=(const RpcClient&) = delete;

    // Connect to a Unix socket, retrying until timeout_ms elapses.
    // Throws TransportError when no connection could be made.
    void connect(const std::string& socket_path, int timeout_ms);
    void disconnect();
    bool is_connected() const;

    // Returns the response envelope. Throws TransportError on connection
    // failures and OperationCancelled when the token fires first.
    nlohmann::json call(const std::string& method,
                        const nlohmann::json& args = nlohmann::json::object(),
                        const CancellationToken& cancel = {});

private:
    void acquire_gate(const CancellationToken& cancel);
    void release_gate();

    std::shared_ptr<LineChannel> channel_;
    mutable std::mutex channel_mutex_;

    std::mutex gate_mutex_;
    std::condition_variable gate_cond_;
    bool busy_ = false;

    // Responses owed to callers that stopped waiting; guarded by the gate
    size_t stale_responses_ = 0;
};
