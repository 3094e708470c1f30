#pragma once

class IClock {
public:
    virtual ~IClock() = default;

    // Seconds since the Unix epoch.
    virtual double now() = 0;
};
