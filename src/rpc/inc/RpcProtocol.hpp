#pragma once

#include <nlohmann/json.hpp>
#include <string>

// Wire format: one JSON document per line.
//   request  {"method": "...", "args": {...}}
//   response {"ok": true, "result": ...} or {"ok": false, "error": "..."}
// Responses may carry extra top-level fields for particular methods.
namespace RpcProtocol {

struct Request {
    std::string method;
    nlohmann::json args = nlohmann::json::object();
};

nlohmann::json make_request(const std::string& method, const nlohmann::json& args);

// Throws std::invalid_argument (or nlohmann::json::parse_error) describing the defect
Request parse_request(const std::string& line);

nlohmann::json ok(nlohmann::json result = nullptr);
nlohmann::json error(const std::string& message);

bool is_ok(const nlohmann::json& response);
std::string error_message(const nlohmann::json& response);

// Serialize for the wire; invalid UTF-8 is replaced rather than thrown
std::string encode(const nlohmann::json& document);

}

namespace RpcMethods {

// Backend capability calls
inline constexpr const char* kAttach = "attach";
inline constexpr const char* kFind = "find";
inline constexpr const char* kFindByPath = "find_by_path";
inline constexpr const char* kClick = "click";
inline constexpr const char* kRightClick = "right_click";
inline constexpr const char* kType = "type";
inline constexpr const char* kSendKeys = "send_keys";
inline constexpr const char* kSetValue = "set_value";
inline constexpr const char* kGetValue = "get_value";
inline constexpr const char* kReadProperty = "read_property";
inline constexpr const char* kChildren = "children";
inline constexpr const char* kProperties = "properties";
inline constexpr const char* kFocus = "focus";
inline constexpr const char* kSnapshot = "snapshot";
inline constexpr const char* kScreenshot = "screenshot";
inline constexpr const char* kLaunch = "launch";
inline constexpr const char* kWaitForWindow = "wait_for_window";
inline constexpr const char* kIsEnabled = "is_enabled";
inline constexpr const char* kFileDialog = "file_dialog";
inline constexpr const char* kStatus = "status";

// Macro calls served from the server's own registry
inline constexpr const char* kMacroList = "macro_list";
inline constexpr const char* kMacro = "macro";
inline constexpr const char* kExecuteMacroYaml = "execute_macro_yaml";
inline constexpr const char* kReloadMacros = "reload_macros";

}
