#pragma once

#include "AutomationBackend.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

struct BackendOptions {
    std::string socket_path = "/tmp/automacro.sock";
    int connect_timeout_ms = 10000;
    int call_timeout_ms = 0;
};

class BackendFactory {
public:
    using Builder = std::function<std::unique_ptr<AutomationBackend>(const BackendOptions&)>;

    static BackendFactory& instance() {
        static BackendFactory inst;
        return inst;
    }

    static void register_backend(const std::string& name, Builder builder) {
        auto& inst = instance();
        std::lock_guard<std::mutex> lock(inst.mutex_);
        inst.builders_[name] = std::move(builder);
    }

    static std::unique_ptr<AutomationBackend> create_backend(const std::string& name, const BackendOptions& options) {
        Builder builder;
        {
            auto& inst = instance();
            std::lock_guard<std::mutex> lock(inst.mutex_);
            auto it = inst.builders_.find(name);
            if (it == inst.builders_.end()) {
                throw std::invalid_argument("Unsupported backend type: " + name);
            }
            builder = it->second;
        }
        return builder(options);
    }

    static bool is_registered(const std::string& name) {
        auto& inst = instance();
        std::lock_guard<std::mutex> lock(inst.mutex_);
        return inst.builders_.count(name) > 0;
    }

private:
    // Registers the built-in "remote" backend
    BackendFactory();

    std::unordered_map<std::string, Builder> builders_;
    std::mutex mutex_;
};
