#include "LineChannel.hpp"
#include "RpcClient.hpp"
#include "RpcProtocol.hpp"
#include "RpcServer.hpp"
#include "TransportError.hpp"
#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>
#include <vector>

using nlohmann::json;
using namespace std::chrono_literals;

// echo returns args.n; slow does the same after a delay; boom throws
struct FakeHandler : public RequestHandler {
    std::chrono::milliseconds slow_delay{300};
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};
    std::atomic<int> handled{0};

    bool supports(const std::string& method) const override {
        return method == "echo" || method == "slow" || method == "boom";
    }

    json handle(const std::string& method, const json& args) override {
        int now = ++in_flight;
        int seen = max_in_flight.load();
        while (now > seen && !max_in_flight.compare_exchange_weak(seen, now)) {}

        if (method == "slow") std::this_thread::sleep_for(slow_delay);
        --in_flight;
        ++handled;

        if (method == "boom") throw std::runtime_error("backend exploded");
        return RpcProtocol::ok(args.value("n", 0));
    }
};

struct SocketPair {
    int client = -1;
    int server = -1;

    SocketPair() {
        int fds[2];
        if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
            throw std::runtime_error("socketpair failed");
        }
        client = fds[0];
        server = fds[1];
    }
};

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

void test_calls_complete_in_order() {
    FakeHandler handler;
    ServerConfig config;
    RpcServer server(config, handler);
    SocketPair pair;

    std::thread serving([&]() { server.serve_connection(pair.server); });
    {
        RpcClient client(pair.client);
        json first = client.call("echo", {{"n", 1}});
        json second = client.call("echo", {{"n", 2}});
        assert(RpcProtocol::is_ok(first) && first["result"] == 1);
        assert(RpcProtocol::is_ok(second) && second["result"] == 2);

        // Concurrent callers on one connection each get their own answer
        std::vector<std::thread> callers;
        std::atomic<int> matched{0};
        for (int i = 10; i < 20; ++i) {
            callers.emplace_back([&client, &matched, i]() {
                json r = client.call("echo", {{"n", i}});
                if (r["result"] == i) matched++;
            });
        }
        for (auto& t : callers) t.join();
        assert(matched == 10);
    }
    serving.join();
    std::cout << "test_calls_complete_in_order passed" << std::endl;
}

void test_deadline_call_queued_behind_deadline_less_call() {
    FakeHandler handler;
    handler.slow_delay = 600ms;
    RpcServer server(ServerConfig{}, handler);
    SocketPair pair;

    std::thread serving([&]() { server.serve_connection(pair.server); });
    {
        RpcClient client(pair.client);

        json slow_response;
        std::thread first([&]() { slow_response = client.call("slow", {{"n", 1}}); });
        std::this_thread::sleep_for(50ms);

        CancellationSource deadline(200ms);
        auto start = std::chrono::steady_clock::now();
        bool cancelled = false;
        try {
            client.call("echo", {{"n", 2}}, deadline.token());
        } catch (const OperationCancelled&) {
            cancelled = true;
        }
        auto waited = std::chrono::steady_clock::now() - start;

        // The queued call gives up on its own deadline while the first is still running
        assert(cancelled);
        assert(waited >= 150ms && waited < 500ms);
        assert(handler.handled == 0);

        first.join();
        assert(RpcProtocol::is_ok(slow_response) && slow_response["result"] == 1);

        json after = client.call("echo", {{"n", 3}});
        assert(after["result"] == 3);
        (void)cancelled;
        (void)waited;
    }
    serving.join();
    std::cout << "test_deadline_call_queued_behind_deadline_less_call passed" << std::endl;
}

void test_abandoned_response_is_discarded() {
    FakeHandler handler;
    handler.slow_delay = 300ms;
    RpcServer server(ServerConfig{}, handler);
    SocketPair pair;

    std::thread serving([&]() { server.serve_connection(pair.server); });
    {
        RpcClient client(pair.client);

        CancellationSource deadline(100ms);
        bool cancelled = false;
        try {
            client.call("slow", {{"n", 1}}, deadline.token());
        } catch (const OperationCancelled&) {
            cancelled = true;
        }
        assert(cancelled);
        (void)cancelled;

        // The late answer to "slow" must not be mistaken for this one
        json next = client.call("echo", {{"n", 7}});
        assert(next["result"] == 7);
    }
    serving.join();
    std::cout << "test_abandoned_response_is_discarded passed" << std::endl;
}

void test_peer_disconnect_fails_call() {
    SocketPair pair;
    std::thread peer([&]() {
        LineChannel channel(pair.server);
        auto request = channel.read_line();
        assert(request && contains(*request, "\"method\":\"focus\""));
        // Channel goes out of scope and closes without answering
    });

    RpcClient client(pair.client);
    std::string error;
    try {
        client.call("focus");
    } catch (const TransportError& e) {
        error = e.what();
    }
    peer.join();
    assert(error == "connection closed");
    std::cout << "test_peer_disconnect_fails_call passed" << std::endl;
}

void test_malformed_response() {
    SocketPair pair;
    std::thread peer([&]() {
        LineChannel channel(pair.server);
        auto first = channel.read_line();
        channel.write_line("this is not json");
        auto second = channel.read_line();
        channel.write_line("{\"result\": 1}");
        (void)first;
        (void)second;
    });

    RpcClient client(pair.client);
    std::vector<std::string> errors;
    for (int i = 0; i < 2; ++i) {
        try {
            client.call("focus");
        } catch (const TransportError& e) {
            errors.push_back(e.what());
        }
    }
    peer.join();
    assert(errors.size() == 2);
    assert(errors[0] == "Malformed response from server");
    assert(errors[1] == "Malformed response from server");
    std::cout << "test_malformed_response passed" << std::endl;
}

void test_not_connected() {
    RpcClient client;
    assert(!client.is_connected());
    std::string error;
    try {
        client.call("status");
    } catch (const TransportError& e) {
        error = e.what();
    }
    assert(error == "Not connected to automation server");

    bool failed = false;
    try {
        client.connect("/tmp/automacro_no_such_server.sock", 150);
    } catch (const TransportError& e) {
        failed = contains(e.what(), "Cannot connect");
    }
    assert(failed);
    (void)failed;
    std::cout << "test_not_connected passed" << std::endl;
}

void test_server_error_responses() {
    FakeHandler handler;
    RpcServer server(ServerConfig{}, handler);

    json invalid = json::parse(server.handle_line("{not json"));
    assert(invalid["ok"] == false);
    assert(contains(invalid["error"].get<std::string>(), "Invalid request: "));

    json no_method = json::parse(server.handle_line("{\"args\": {}}"));
    assert(no_method["ok"] == false);
    assert(contains(no_method["error"].get<std::string>(), "missing 'method'"));

    json unknown = json::parse(server.handle_line("{\"method\": \"dance\", \"args\": {}}"));
    assert(unknown["ok"] == false);
    assert(unknown["error"] == "Unknown method: dance");

    json thrown = json::parse(server.handle_line("{\"method\": \"boom\"}"));
    assert(thrown["ok"] == false);
    assert(thrown["error"] == "backend exploded");

    json fine = json::parse(server.handle_line("{\"method\": \"echo\", \"args\": {\"n\": 5}}"));
    assert(fine["ok"] == true);
    assert(fine["result"] == 5);
    std::cout << "test_server_error_responses passed" << std::endl;
}

void test_malformed_line_keeps_connection() {
    FakeHandler handler;
    RpcServer server(ServerConfig{}, handler);
    SocketPair pair;

    std::thread serving([&]() { server.serve_connection(pair.server); });
    {
        LineChannel raw(pair.client);
        raw.write_line("garbage");
        auto first = raw.read_line();
        assert(first && contains(*first, "Invalid request"));

        raw.write_line(RpcProtocol::encode(RpcProtocol::make_request("echo", {{"n", 9}})));
        auto second = raw.read_line();
        assert(second && json::parse(*second)["result"] == 9);
        (void)first;
        (void)second;
    }
    serving.join();
    std::cout << "test_malformed_line_keeps_connection passed" << std::endl;
}

static std::string test_socket_path(const std::string& tag) {
    return "/tmp/automacro_test_" + tag + "_" + std::to_string(::getpid()) + ".sock";
}

void test_server_serializes_connections() {
    FakeHandler handler;
    handler.slow_delay = 150ms;
    ServerConfig config;
    config.socket_path = test_socket_path("gate");
    config.max_connections = 3;
    RpcServer server(config, handler);
    server.start();

    std::vector<std::thread> clients;
    std::atomic<int> succeeded{0};
    for (int i = 0; i < 3; ++i) {
        clients.emplace_back([&config, &succeeded, i]() {
            RpcClient client;
            client.connect(config.socket_path, 2000);
            json r = client.call("slow", {{"n", i}});
            if (RpcProtocol::is_ok(r) && r["result"] == i) succeeded++;
        });
    }
    for (auto& t : clients) t.join();
    server.stop();

    assert(succeeded == 3);
    assert(handler.max_in_flight == 1);
    std::cout << "test_server_serializes_connections passed" << std::endl;
}

void test_connection_limit() {
    FakeHandler handler;
    ServerConfig config;
    config.socket_path = test_socket_path("limit");
    config.max_connections = 1;
    RpcServer server(config, handler);
    server.start();

    RpcClient first;
    first.connect(config.socket_path, 2000);
    assert(first.call("echo", {{"n", 1}})["result"] == 1);

    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", config.socket_path.c_str());
    int rc = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    assert(rc == 0);
    (void)rc;

    LineChannel second(fd);
    auto line = second.read_line();
    assert(line);
    json rejected = json::parse(*line);
    assert(rejected["ok"] == false);
    assert(contains(rejected["error"].get<std::string>(), "Server busy"));

    first.disconnect();
    server.stop();
    std::cout << "test_connection_limit passed" << std::endl;
}

void test_finished_connections_are_reaped() {
    FakeHandler handler;
    ServerConfig config;
    config.socket_path = test_socket_path("reap");
    config.max_connections = 3;
    RpcServer server(config, handler);
    server.start();

    int answered = 0;
    for (int i = 0; i < 8; ++i) {
        RpcClient client;
        client.connect(config.socket_path, 2000);
        if (client.call("echo", {{"n", i}})["result"] == i) answered++;
        client.disconnect();
        assert(server.retained_threads() <= static_cast<size_t>(config.max_connections) + 1);
    }

    for (int i = 0; i < 50 && server.retained_threads() > 0; ++i) {
        std::this_thread::sleep_for(20ms);
    }
    assert(answered == 8);
    assert(server.retained_threads() == 0);
    assert(server.active_connections() == 0);
    (void)answered;

    server.stop();
    std::cout << "test_finished_connections_are_reaped passed" << std::endl;
}

void test_idle_shutdown() {
    FakeHandler handler;
    ServerConfig config;
    config.socket_path = test_socket_path("idle");
    config.idle_timeout_sec = 1;
    RpcServer server(config, handler);

    auto start = std::chrono::steady_clock::now();
    server.run();
    auto elapsed = std::chrono::steady_clock::now() - start;

    assert(!server.is_running());
    assert(elapsed >= 900ms && elapsed < 5s);
    (void)elapsed;
    std::cout << "test_idle_shutdown passed" << std::endl;
}

int main() {
    test_calls_complete_in_order();
    test_deadline_call_queued_behind_deadline_less_call();
    test_abandoned_response_is_discarded();
    test_peer_disconnect_fails_call();
    test_malformed_response();
    test_not_connected();
    test_server_error_responses();
    test_malformed_line_keeps_connection();
    test_server_serializes_connections();
    test_connection_limit();
    test_finished_connections_are_reaped();
    test_idle_shutdown();
    std::cout << "All RPC transport tests passed!" << std::endl;
    return 0;
}
