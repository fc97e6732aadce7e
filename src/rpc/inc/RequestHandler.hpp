#pragma once

#include <nlohmann/json.hpp>
#include <string>

// Server-side method table. handle() returns a full response envelope and
// may throw; the server turns exceptions into error responses.
class RequestHandler {
public:
    virtual ~RequestHandler() = default;

    virtual bool supports(const std::string& method) const = 0;
    virtual nlohmann::json handle(const std::string& method, const nlohmann::json& args) = 0;
};
