#include "ConfigParser.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

static std::string decode_error(const std::string& yaml) {
    AppConfig config;
    try {
        YAML::convert<AppConfig>::decode(YAML::Load(yaml), config);
    } catch (const std::exception& e) {
        return e.what();
    }
    return "";
}

void test_full_config() {
    YAML::Node node = YAML::Load(R"(
macros_dir: /opt/automacro/macros
socket_path: /run/automacro.sock
backend: remote
log:
  level: debug
  file: /var/log/automacro.log
execution:
  macro_timeout_sec: 120
  step_timeout_sec: 10
  retry_interval_ms: 250
  launch_timeout_sec: 45
  window_poll_ms: 200
  snapshot_depth: 5
server:
  max_connections: 2
  idle_timeout_sec: 0
rpc:
  connect_timeout_ms: 3000
  call_timeout_ms: 15000
  upstream_socket: /run/session.sock
)");

    AppConfig config = node.as<AppConfig>();
    assert(config.macros_dir == "/opt/automacro/macros");
    assert(config.socket_path == "/run/automacro.sock");
    assert(config.log.level == LogUtils::Level::Debug);
    assert(config.log.file == "/var/log/automacro.log");
    assert(config.execution.macro_timeout_sec == 120);
    assert(config.execution.step_timeout_sec == 10);
    assert(config.execution.retry_interval_ms == 250);
    assert(config.execution.launch_timeout_sec == 45);
    assert(config.execution.window_poll_ms == 200);
    assert(config.execution.snapshot_depth == 5);
    assert(config.server.max_connections == 2);
    assert(config.server.idle_timeout_sec == 0);
    assert(config.rpc.connect_timeout_ms == 3000);
    assert(config.rpc.call_timeout_ms == 15000);
    assert(config.rpc.upstream_socket == "/run/session.sock");
    (void)config;
    std::cout << "test_full_config passed" << std::endl;
}

void test_partial_sections_keep_defaults() {
    AppConfig config;
    config.execution.step_timeout_sec = 7;
    YAML::convert<AppConfig>::decode(YAML::Load("execution:\n  retry_interval_ms: 100\n"), config);

    assert(config.execution.retry_interval_ms == 100);
    assert(config.execution.step_timeout_sec == 7);
    assert(config.execution.macro_timeout_sec == 60);
    assert(config.macros_dir == "macros");
    assert(config.socket_path == "/tmp/automacro.sock");
    assert(config.backend == "remote");
    assert(config.server.max_connections == 5);
    assert(config.server.idle_timeout_sec == 300);
    std::cout << "test_partial_sections_keep_defaults passed" << std::endl;
}

void test_unknown_keys_rejected() {
    assert(decode_error("colour: blue\n") == "Unknown configuration key in config: colour");
    assert(decode_error("log:\n  levle: debug\n") == "Unknown configuration key in log: levle");
    assert(decode_error("execution:\n  step_timeout: 5\n") == "Unknown configuration key in execution: step_timeout");
    assert(decode_error("server:\n  port: 80\n") == "Unknown configuration key in server: port");
    assert(decode_error("rpc:\n  retries: 3\n") == "Unknown configuration key in rpc: retries");
    std::cout << "test_unknown_keys_rejected passed" << std::endl;
}

void test_invalid_values() {
    assert(decode_error("execution:\n  step_timeout_sec: 0\n")
           == "execution::step_timeout_sec must be greater than 0, got 0");
    assert(decode_error("server:\n  idle_timeout_sec: -1\n")
           == "server::idle_timeout_sec must not be negative, got -1");
    assert(decode_error("log:\n  level: chatty\n") == "Invalid log level: chatty");
    assert(decode_error("macros_dir: \"\"\n") == "macros_dir must not be empty");
    assert(decode_error("- just\n- a list\n") == "Configuration root must be a mapping");
    assert(!decode_error("execution:\n  macro_timeout_sec: soon\n").empty());
    std::cout << "test_invalid_values passed" << std::endl;
}

int main() {
    test_full_config();
    test_partial_sections_keep_defaults();
    test_unknown_keys_rejected();
    test_invalid_values();
    std::cout << "All ConfigParser tests passed!" << std::endl;
    return 0;
}
