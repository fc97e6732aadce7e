#pragma once

#include "ExecutorConfig.hpp"
#include "LogUtils.hpp"
#include "RpcServer.hpp"
#include <string>

struct LogConfig {
    LogUtils::Level level = LogUtils::Level::Info;
    std::string file = "log/automacro.log";
};

struct RpcSettings {
    int connect_timeout_ms = 10000;
    int call_timeout_ms = 0;        // 0 = no per-call deadline
    std::string upstream_socket;    // Session server used by --serve with the remote backend
};

// Top-level config
struct AppConfig {
    std::string macros_dir = "macros";
    std::string socket_path = "/tmp/automacro.sock";
    std::string backend = "remote";
    LogConfig log;
    ExecutorConfig execution;
    ServerConfig server;
    RpcSettings rpc;
};
