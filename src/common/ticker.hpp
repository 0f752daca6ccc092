// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace royale {

// Periodic activity scheduler. A registered step first runs on the scheduler (never
// inside every() itself) and then once per interval until it returns false. Steps must
// do bounded work and return.
class ITicker
{
public:
    using step_fn = std::function<bool()>;
    virtual ~ITicker() = default;
    virtual void every(std::string name, std::chrono::milliseconds interval, step_fn step) = 0;
};

} // namespace royale
