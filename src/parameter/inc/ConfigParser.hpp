#pragma once

#include "AppConfig.hpp"

#include <set>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>


namespace YAML {

    inline void check_unknown_keys(const YAML::Node& node, const std::set<std::string>& valid_keys, const std::string& context) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            if (valid_keys.find(key) == valid_keys.end()) {
                throw std::runtime_error("Unknown configuration key in " + context + ": " + key);
            }
        }
    }

    inline int positive_int(const YAML::Node& node, const std::string& key, const std::string& context) {
        int value = node[key].as<int>();
        if (value <= 0) {
            throw std::runtime_error(context + "::" + key + " must be greater than 0, got " + std::to_string(value));
        }
        return value;
    }

    inline int non_negative_int(const YAML::Node& node, const std::string& key, const std::string& context) {
        int value = node[key].as<int>();
        if (value < 0) {
            throw std::runtime_error(context + "::" + key + " must not be negative, got " + std::to_string(value));
        }
        return value;
    }

    template<>
    struct convert<LogConfig> {
        static bool decode(const Node& node, LogConfig& rhs) {
            static const std::set<std::string> valid_keys = {"level", "file"};
            check_unknown_keys(node, valid_keys, "log");

            if (node["level"]) {
                rhs.level = LogUtils::parse_level(node["level"].as<std::string>());
            }
            if (node["file"]) {
                rhs.file = node["file"].as<std::string>();
                if (rhs.file.empty()) {
                    throw std::runtime_error("log::file must not be empty");
                }
            }
            return true;
        }
    };

    template<>
    struct convert<ExecutorConfig> {
        static bool decode(const Node& node, ExecutorConfig& rhs) {
            static const std::set<std::string> valid_keys = {
                "macro_timeout_sec", "step_timeout_sec", "retry_interval_ms",
                "launch_timeout_sec", "window_poll_ms", "snapshot_depth"
            };
            check_unknown_keys(node, valid_keys, "execution");

            if (node["macro_timeout_sec"]) rhs.macro_timeout_sec = positive_int(node, "macro_timeout_sec", "execution");
            if (node["step_timeout_sec"]) rhs.step_timeout_sec = positive_int(node, "step_timeout_sec", "execution");
            if (node["retry_interval_ms"]) rhs.retry_interval_ms = positive_int(node, "retry_interval_ms", "execution");
            if (node["launch_timeout_sec"]) rhs.launch_timeout_sec = positive_int(node, "launch_timeout_sec", "execution");
            if (node["window_poll_ms"]) rhs.window_poll_ms = positive_int(node, "window_poll_ms", "execution");
            if (node["snapshot_depth"]) rhs.snapshot_depth = positive_int(node, "snapshot_depth", "execution");
            return true;
        }
    };

    template<>
    struct convert<ServerConfig> {
        static bool decode(const Node& node, ServerConfig& rhs) {
            static const std::set<std::string> valid_keys = {"max_connections", "idle_timeout_sec"};
            check_unknown_keys(node, valid_keys, "server");

            if (node["max_connections"]) rhs.max_connections = positive_int(node, "max_connections", "server");
            if (node["idle_timeout_sec"]) rhs.idle_timeout_sec = non_negative_int(node, "idle_timeout_sec", "server");
            return true;
        }
    };

    template<>
    struct convert<RpcSettings> {
        static bool decode(const Node& node, RpcSettings& rhs) {
            static const std::set<std::string> valid_keys = {
                "connect_timeout_ms", "call_timeout_ms", "upstream_socket"
            };
            check_unknown_keys(node, valid_keys, "rpc");

            if (node["connect_timeout_ms"]) rhs.connect_timeout_ms = positive_int(node, "connect_timeout_ms", "rpc");
            if (node["call_timeout_ms"]) rhs.call_timeout_ms = non_negative_int(node, "call_timeout_ms", "rpc");
            if (node["upstream_socket"]) rhs.upstream_socket = node["upstream_socket"].as<std::string>();
            return true;
        }
    };

    template<>
    struct convert<AppConfig> {
        static bool decode(const Node& node, AppConfig& rhs) {
            if (!node.IsMap()) {
                throw std::runtime_error("Configuration root must be a mapping");
            }

            // Detect unknown configuration keys
            static const std::set<std::string> valid_keys = {
                "macros_dir", "socket_path", "backend", "log", "execution", "server", "rpc"
            };
            check_unknown_keys(node, valid_keys, "config");

            if (node["macros_dir"]) rhs.macros_dir = node["macros_dir"].as<std::string>();
            if (node["socket_path"]) rhs.socket_path = node["socket_path"].as<std::string>();
            if (node["backend"]) rhs.backend = node["backend"].as<std::string>();

            // Sections decode onto the current values so omitted keys keep their defaults
            if (node["log"]) convert<LogConfig>::decode(node["log"], rhs.log);
            if (node["execution"]) convert<ExecutorConfig>::decode(node["execution"], rhs.execution);
            if (node["server"]) convert<ServerConfig>::decode(node["server"], rhs.server);
            if (node["rpc"]) convert<RpcSettings>::decode(node["rpc"], rhs.rpc);

            if (rhs.macros_dir.empty()) throw std::runtime_error("macros_dir must not be empty");
            if (rhs.socket_path.empty()) throw std::runtime_error("socket_path must not be empty");
            if (rhs.backend.empty()) throw std::runtime_error("backend must not be empty");
            return true;
        }
    };

}
