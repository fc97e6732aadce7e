#pragma once

#include "AutomationBackend.hpp"
#include "MacroExecutor.hpp"
#include "MacroRegistry.hpp"
#include "RequestHandler.hpp"
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <string>

// Maps wire methods onto a backend session. The macro methods are available
// only when a registry and an executor are supplied.
class BackendDispatcher : public RequestHandler {
public:
    explicit BackendDispatcher(AutomationBackend& backend,
                               MacroRegistry* registry = nullptr,
                               MacroExecutor* executor = nullptr);

    bool supports(const std::string& method) const override;
    nlohmann::json handle(const std::string& method, const nlohmann::json& args) override;

    std::vector<std::string> methods() const;

private:
    using Method = std::function<nlohmann::json(const nlohmann::json&)>;

    void register_backend_methods();
    void register_macro_methods();

    nlohmann::json run_macro(const nlohmann::json& args);
    nlohmann::json run_macro_yaml(const nlohmann::json& args);

    AutomationBackend& backend_;
    MacroRegistry* registry_;
    MacroExecutor* executor_;
    std::map<std::string, Method> methods_;
};
