#include "BackendDispatcher.hpp"
#include "MacroLoader.hpp"
#include "RpcProtocol.hpp"
#include "StringUtils.hpp"
#include "LogUtils.hpp"
#include <chrono>
#include <stdexcept>

using nlohmann::json;

namespace {

std::string required_string(const json& args, const char* key) {
    auto it = args.find(key);
    if (it == args.end() || !it->is_string()) {
        throw std::invalid_argument(std::string("missing '") + key + "' argument");
    }
    return it->get<std::string>();
}

std::optional<std::string> optional_string(const json& args, const char* key) {
    auto it = args.find(key);
    if (it == args.end() || it->is_null()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

int int_or(const json& args, const char* key, int fallback) {
    auto it = args.find(key);
    if (it == args.end() || !it->is_number()) return fallback;
    return it->get<int>();
}

ElementCriteria criteria_from(const json& args) {
    ElementCriteria criteria;
    criteria.automation_id = optional_string(args, "automation_id");
    criteria.name = optional_string(args, "name");
    criteria.class_name = optional_string(args, "class_name");
    criteria.control_type = optional_string(args, "control_type");
    return criteria;
}

ParamMap params_from(const json& args) {
    ParamMap params;
    auto it = args.find("params");
    if (it == args.end() || !it->is_object()) return params;
    for (const auto& [key, value] : it->items()) {
        params[key] = value.is_string() ? value.get<std::string>() : value.dump();
    }
    return params;
}

json respond(const BackendResult& r) {
    return r.success ? RpcProtocol::ok(r.message) : RpcProtocol::error(r.message);
}

json respond(const ValueResult& r) {
    return r.success ? RpcProtocol::ok(r.value) : RpcProtocol::error(r.message);
}

json respond(const ElementResult& r) {
    if (!r.success) return RpcProtocol::error(r.message);
    json response = RpcProtocol::ok(r.message);
    response["refKey"] = r.ref;
    response["description"] = r.description;
    return response;
}

json respond(const ExecutionResult& r) {
    json response = r.success ? RpcProtocol::ok(r.message) : RpcProtocol::error(r.message);
    response["stepsExecuted"] = r.steps_executed;
    response["totalSteps"] = r.total_steps;
    if (!r.success) {
        response["failedStep"] = r.failed_step ? json(*r.failed_step) : json(nullptr);
        response["failedAction"] = r.failed_action;
        response["stepError"] = r.error;
    }
    return response;
}

}

BackendDispatcher::BackendDispatcher(AutomationBackend& backend, MacroRegistry* registry, MacroExecutor* executor)
    : backend_(backend), registry_(registry), executor_(executor) {
    register_backend_methods();
    if (registry_ && executor_) {
        register_macro_methods();
    }
}

bool BackendDispatcher::supports(const std::string& method) const {
    return methods_.count(method) > 0;
}

std::vector<std::string> BackendDispatcher::methods() const {
    std::vector<std::string> names;
    for (const auto& [name, method] : methods_) names.push_back(name);
    return names;
}

json BackendDispatcher::handle(const std::string& method, const json& args) {
    auto it = methods_.find(method);
    if (it == methods_.end()) {
        return RpcProtocol::error("Unknown method: " + method);
    }
    LogUtils::debug("Dispatching {}", method);
    return it->second(args);
}

void BackendDispatcher::register_backend_methods() {
    methods_[RpcMethods::kAttach] = [this](const json& args) {
        if (auto pid = args.find("pid"); pid != args.end() && pid->is_number_integer()) {
            return respond(backend_.attach(pid->get<int>()));
        }
        return respond(backend_.attach(required_string(args, "process_name")));
    };
    methods_[RpcMethods::kFind] = [this](const json& args) {
        return respond(backend_.find(criteria_from(args)));
    };
    methods_[RpcMethods::kFindByPath] = [this](const json& args) {
        auto it = args.find("path");
        if (it == args.end() || !it->is_array()) {
            throw std::invalid_argument("missing 'path' argument");
        }
        return respond(backend_.find_by_path(it->get<std::vector<std::string>>()));
    };
    methods_[RpcMethods::kClick] = [this](const json& args) {
        return respond(backend_.click(required_string(args, "ref")));
    };
    methods_[RpcMethods::kRightClick] = [this](const json& args) {
        return respond(backend_.right_click(required_string(args, "ref")));
    };
    methods_[RpcMethods::kType] = [this](const json& args) {
        return respond(backend_.type_text(required_string(args, "text")));
    };
    methods_[RpcMethods::kSendKeys] = [this](const json& args) {
        return respond(backend_.send_keys(required_string(args, "keys")));
    };
    methods_[RpcMethods::kSetValue] = [this](const json& args) {
        return respond(backend_.set_value(required_string(args, "ref"), required_string(args, "value")));
    };
    methods_[RpcMethods::kGetValue] = [this](const json& args) {
        return respond(backend_.get_value(required_string(args, "ref")));
    };
    methods_[RpcMethods::kReadProperty] = [this](const json& args) {
        return respond(backend_.read_property(required_string(args, "ref"), required_string(args, "property")));
    };
    methods_[RpcMethods::kChildren] = [this](const json& args) {
        ChildrenResult r = backend_.get_children(optional_string(args, "ref"));
        return r.success ? RpcProtocol::ok(r.refs) : RpcProtocol::error(r.message);
    };
    methods_[RpcMethods::kProperties] = [this](const json& args) {
        PropertiesResult r = backend_.get_properties(required_string(args, "ref"));
        return r.success ? RpcProtocol::ok(r.properties) : RpcProtocol::error(r.message);
    };
    methods_[RpcMethods::kFocus] = [this](const json&) {
        return respond(backend_.focus());
    };
    methods_[RpcMethods::kSnapshot] = [this](const json& args) {
        return respond(backend_.snapshot(int_or(args, "max_depth", 3)));
    };
    methods_[RpcMethods::kScreenshot] = [this](const json&) {
        ScreenshotResult r = backend_.screenshot();
        if (!r.success) return RpcProtocol::error(r.message);
        json response = RpcProtocol::ok(r.message);
        response["data"] = StringUtils::base64_encode(r.png);
        return response;
    };
    methods_[RpcMethods::kLaunch] = [this](const json& args) {
        LaunchOptions options;
        options.exe_path = required_string(args, "exe_path");
        options.arguments = optional_string(args, "arguments");
        options.working_directory = optional_string(args, "working_directory");
        options.if_not_running = args.value("if_not_running", true);
        options.timeout_sec = int_or(args, "timeout", options.timeout_sec);
        CancellationSource scope(std::chrono::seconds(options.timeout_sec));
        return respond(backend_.launch_and_attach(options, scope.token()));
    };
    methods_[RpcMethods::kWaitForWindow] = [this](const json& args) {
        WindowCriteria criteria;
        criteria.title_contains = args.value("title_contains", std::string());
        criteria.element = criteria_from(args);
        criteria.timeout_sec = int_or(args, "timeout", criteria.timeout_sec);
        criteria.poll_ms = int_or(args, "poll_ms", criteria.poll_ms);
        CancellationSource scope(std::chrono::seconds(criteria.timeout_sec));
        return respond(backend_.wait_for_window_ready(criteria, scope.token()));
    };
    methods_[RpcMethods::kIsEnabled] = [this](const json& args) {
        const std::string ref = required_string(args, "ref");
        std::optional<bool> enabled = backend_.is_enabled(ref);
        if (!enabled) return RpcProtocol::error("Unknown ref '" + ref + "'");
        return RpcProtocol::ok(*enabled);
    };
    methods_[RpcMethods::kFileDialog] = [this](const json& args) {
        return respond(backend_.file_dialog(required_string(args, "text")));
    };
    methods_[RpcMethods::kStatus] = [this](const json&) {
        SessionStatus status = backend_.status();
        json response = RpcProtocol::ok(status.attached ? "attached" : "not attached");
        response["attached"] = status.attached;
        response["windowTitle"] = status.window_title;
        response["pid"] = status.pid;
        return response;
    };
}

void BackendDispatcher::register_macro_methods() {
    methods_[RpcMethods::kMacroList] = [this](const json&) {
        json macros = json::array();
        for (const auto& summary : registry_->list()) {
            json parameters = json::array();
            for (const auto& p : summary.parameters) {
                json param{{"name", p.name}, {"description", p.description}, {"required", p.required}};
                if (p.default_value) param["default"] = *p.default_value;
                parameters.push_back(std::move(param));
            }
            macros.push_back({{"name", summary.key},
                              {"displayName", summary.name},
                              {"description", summary.description},
                              {"parameters", std::move(parameters)},
                              {"steps", summary.step_count}});
        }

        json errors = json::array();
        for (const auto& e : registry_->load_errors()) {
            errors.push_back({{"file", e.file_path}, {"macro", e.macro_name}, {"message", e.message}});
        }

        json knowledge_bases = json::array();
        for (const auto& kb : registry_->knowledge_bases()) {
            knowledge_bases.push_back({{"productName", kb.product_name},
                                       {"filePath", kb.file_path},
                                       {"summary", kb.summary}});
        }

        json response = RpcProtocol::ok(std::move(macros));
        response["errors"] = std::move(errors);
        response["knowledgeBases"] = std::move(knowledge_bases);
        return response;
    };
    methods_[RpcMethods::kMacro] = [this](const json& args) {
        return run_macro(args);
    };
    methods_[RpcMethods::kExecuteMacroYaml] = [this](const json& args) {
        return run_macro_yaml(args);
    };
    methods_[RpcMethods::kReloadMacros] = [this](const json&) {
        registry_->reload();
        auto catalog = registry_->snapshot();
        json response = RpcProtocol::ok("Reloaded " + std::to_string(catalog->macros.size()) + " macros");
        response["macros"] = catalog->macros.size();
        response["errors"] = catalog->errors.size();
        return response;
    };
}

json BackendDispatcher::run_macro(const json& args) {
    const std::string name = required_string(args, "name");
    ExecutionResult result = executor_->execute(name, params_from(args));
    return respond(result);
}

json BackendDispatcher::run_macro_yaml(const json& args) {
    const std::string yaml = required_string(args, "yaml");

    MacroDefinition definition;
    try {
        definition = MacroLoader::parse_document(yaml, "inline");
    } catch (const std::exception& e) {
        return RpcProtocol::error(std::string("Invalid macro document: ") + e.what());
    }
    return respond(executor_->execute_definition(definition, params_from(args)));
}
