#include "RpcProtocol.hpp"
#include <stdexcept>

namespace RpcProtocol {

nlohmann::json make_request(const std::string& method, const nlohmann::json& args) {
    return nlohmann::json{{"method", method}, {"args", args.is_null() ? nlohmann::json::object() : args}};
}

Request parse_request(const std::string& line) {
    nlohmann::json document = nlohmann::json::parse(line);
    if (!document.is_object()) {
        throw std::invalid_argument("request must be a JSON object");
    }

    auto method = document.find("method");
    if (method == document.end() || !method->is_string() || method->get<std::string>().empty()) {
        throw std::invalid_argument("missing 'method' field");
    }

    Request request;
    request.method = method->get<std::string>();
    if (auto args = document.find("args"); args != document.end() && !args->is_null()) {
        if (!args->is_object()) {
            throw std::invalid_argument("'args' must be an object");
        }
        request.args = *args;
    }
    return request;
}

nlohmann::json ok(nlohmann::json result) {
    return nlohmann::json{{"ok", true}, {"result", std::move(result)}};
}

nlohmann::json error(const std::string& message) {
    return nlohmann::json{{"ok", false}, {"error", message}};
}

bool is_ok(const nlohmann::json& response) {
    auto it = response.find("ok");
    return it != response.end() && it->is_boolean() && it->get<bool>();
}

std::string error_message(const nlohmann::json& response) {
    auto it = response.find("error");
    if (it != response.end() && it->is_string()) return it->get<std::string>();
    return "Unknown error";
}

std::string encode(const nlohmann::json& document) {
    return document.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}
