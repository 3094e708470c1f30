#ifndef SYSTEMCLOCK_HPP
#define SYSTEMCLOCK_HPP

#include "../interfaces/IClock.hpp"

// Wall clock backed by std::chrono::system_clock.
class SystemClock : public IClock {
public:
    double now() override;
};

#endif // SYSTEMCLOCK_HPP
