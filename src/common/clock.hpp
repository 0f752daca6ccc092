// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>

namespace royale {

// Monotonic time source injected into every timed component so tests can drive
// phase and zone timers deterministically.
class IClock
{
public:
    using time_point = std::chrono::steady_clock::time_point;
    virtual ~IClock() = default;
    virtual time_point now() const = 0;
};

class SteadyClock final : public IClock
{
public:
    time_point now() const override
    {
        return std::chrono::steady_clock::now();
    }
};

inline double seconds_between(IClock::time_point from, IClock::time_point to)
{
    return std::chrono::duration<double>(to - from).count();
}

} // namespace royale
