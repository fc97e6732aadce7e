#include "RemoteBackend.hpp"
#include "RpcProtocol.hpp"
#include "StringUtils.hpp"
#include <chrono>

using nlohmann::json;

namespace {

std::string result_text(const json& response) {
    auto it = response.find("result");
    if (it == response.end() || it->is_null()) return "";
    return it->is_string() ? it->get<std::string>() : it->dump();
}

void put(json& args, const char* key, const std::optional<std::string>& value) {
    if (value) args[key] = *value;
}

json criteria_args(const ElementCriteria& criteria) {
    json args = json::object();
    put(args, "automation_id", criteria.automation_id);
    put(args, "name", criteria.name);
    put(args, "class_name", criteria.class_name);
    put(args, "control_type", criteria.control_type);
    return args;
}

}

RemoteBackend::RemoteBackend(std::shared_ptr<RpcClient> client, int call_timeout_ms)
    : client_(std::move(client)), call_timeout_ms_(call_timeout_ms) {}

json RemoteBackend::invoke(const std::string& method, const json& args, const CancellationToken& cancel) {
    if (call_timeout_ms_ <= 0) {
        return client_->call(method, args, cancel);
    }
    CancellationSource scope(cancel, std::chrono::milliseconds(call_timeout_ms_));
    return client_->call(method, args, scope.token());
}

BackendResult RemoteBackend::simple(const std::string& method, const json& args) {
    json response = invoke(method, args);
    if (!RpcProtocol::is_ok(response)) return {false, RpcProtocol::error_message(response)};
    return {true, result_text(response)};
}

ValueResult RemoteBackend::value(const std::string& method, const json& args) {
    json response = invoke(method, args);
    if (!RpcProtocol::is_ok(response)) return {false, "", RpcProtocol::error_message(response)};
    return {true, result_text(response), ""};
}

ElementResult RemoteBackend::element(const std::string& method, const json& args) {
    json response = invoke(method, args);
    if (!RpcProtocol::is_ok(response)) return {false, "", "", RpcProtocol::error_message(response)};
    return {true, response.value("refKey", std::string()), response.value("description", std::string()),
            result_text(response)};
}

BackendResult RemoteBackend::attach(const std::string& process_name) {
    return simple(RpcMethods::kAttach, {{"process_name", process_name}});
}

BackendResult RemoteBackend::attach(int pid) {
    return simple(RpcMethods::kAttach, {{"pid", pid}});
}

bool RemoteBackend::is_attached() {
    return status().attached;
}

SessionStatus RemoteBackend::status() {
    json response = invoke(RpcMethods::kStatus, json::object());
    SessionStatus status;
    if (!RpcProtocol::is_ok(response)) return status;
    status.attached = response.value("attached", false);
    status.window_title = response.value("windowTitle", std::string());
    status.pid = response.value("pid", 0);
    return status;
}

BackendResult RemoteBackend::launch_and_attach(const LaunchOptions& options, const CancellationToken& cancel) {
    json args{{"exe_path", options.exe_path},
              {"if_not_running", options.if_not_running},
              {"timeout", options.timeout_sec}};
    put(args, "arguments", options.arguments);
    put(args, "working_directory", options.working_directory);

    json response = invoke(RpcMethods::kLaunch, args, cancel);
    if (!RpcProtocol::is_ok(response)) return {false, RpcProtocol::error_message(response)};
    return {true, result_text(response)};
}

BackendResult RemoteBackend::wait_for_window_ready(const WindowCriteria& criteria, const CancellationToken& cancel) {
    json args = criteria_args(criteria.element);
    args["title_contains"] = criteria.title_contains;
    args["timeout"] = criteria.timeout_sec;
    args["poll_ms"] = criteria.poll_ms;

    json response = invoke(RpcMethods::kWaitForWindow, args, cancel);
    if (!RpcProtocol::is_ok(response)) return {false, RpcProtocol::error_message(response)};
    return {true, result_text(response)};
}

BackendResult RemoteBackend::focus() {
    return simple(RpcMethods::kFocus, json::object());
}

ElementResult RemoteBackend::find(const ElementCriteria& criteria) {
    return element(RpcMethods::kFind, criteria_args(criteria));
}

ElementResult RemoteBackend::find_by_path(const std::vector<std::string>& path) {
    return element(RpcMethods::kFindByPath, {{"path", path}});
}

ChildrenResult RemoteBackend::get_children(const std::optional<std::string>& ref) {
    json args = json::object();
    put(args, "ref", ref);
    json response = invoke(RpcMethods::kChildren, args);
    if (!RpcProtocol::is_ok(response)) return {false, {}, RpcProtocol::error_message(response)};

    ChildrenResult result{true, {}, ""};
    if (auto it = response.find("result"); it != response.end() && it->is_array()) {
        result.refs = it->get<std::vector<std::string>>();
    }
    result.message = std::to_string(result.refs.size()) + " children";
    return result;
}

BackendResult RemoteBackend::click(const std::string& ref) {
    return simple(RpcMethods::kClick, {{"ref", ref}});
}

BackendResult RemoteBackend::right_click(const std::string& ref) {
    return simple(RpcMethods::kRightClick, {{"ref", ref}});
}

BackendResult RemoteBackend::type_text(const std::string& text) {
    return simple(RpcMethods::kType, {{"text", text}});
}

BackendResult RemoteBackend::send_keys(const std::string& keys) {
    return simple(RpcMethods::kSendKeys, {{"keys", keys}});
}

BackendResult RemoteBackend::set_value(const std::string& ref, const std::string& value) {
    return simple(RpcMethods::kSetValue, {{"ref", ref}, {"value", value}});
}

ValueResult RemoteBackend::get_value(const std::string& ref) {
    return value(RpcMethods::kGetValue, {{"ref", ref}});
}

ValueResult RemoteBackend::read_property(const std::string& ref, const std::string& property) {
    return value(RpcMethods::kReadProperty, {{"ref", ref}, {"property", property}});
}

PropertiesResult RemoteBackend::get_properties(const std::string& ref) {
    json response = invoke(RpcMethods::kProperties, {{"ref", ref}});
    if (!RpcProtocol::is_ok(response)) return {false, {}, RpcProtocol::error_message(response)};

    PropertiesResult result{true, {}, ""};
    if (auto it = response.find("result"); it != response.end() && it->is_object()) {
        for (const auto& [key, v] : it->items()) {
            result.properties[key] = v.is_string() ? v.get<std::string>() : v.dump();
        }
    }
    return result;
}

BackendResult RemoteBackend::file_dialog(const std::string& path) {
    return simple(RpcMethods::kFileDialog, {{"text", path}});
}

std::optional<bool> RemoteBackend::is_enabled(const std::string& ref) {
    json response = invoke(RpcMethods::kIsEnabled, {{"ref", ref}});
    if (!RpcProtocol::is_ok(response)) return std::nullopt;
    auto it = response.find("result");
    if (it == response.end() || !it->is_boolean()) return std::nullopt;
    return it->get<bool>();
}

ValueResult RemoteBackend::snapshot(int max_depth) {
    return value(RpcMethods::kSnapshot, {{"max_depth", max_depth}});
}

ScreenshotResult RemoteBackend::screenshot() {
    json response = invoke(RpcMethods::kScreenshot, json::object());
    if (!RpcProtocol::is_ok(response)) return {false, {}, RpcProtocol::error_message(response)};
    return {true, StringUtils::base64_decode(response.value("data", std::string())), result_text(response)};
}
