#pragma once

#include <string>

class IHealthCheck {
public:
    virtual ~IHealthCheck() = default;

    // May throw; a throwing probe counts as unhealthy.
    virtual bool probe(const std::string& address) = 0;
};
