#pragma once

#include <optional>
#include <string>

// What the rate-limit middleware needs to know about an incoming request.
struct RequestContext {
    std::string endpoint = "*";
    bool authenticated = false;
    std::optional<std::string> user_id;
    std::optional<std::string> client_address;
};
