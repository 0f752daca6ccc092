// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/ticker.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <memory>

namespace royale::runtime {

// ITicker backed by libcoro: every registered step becomes its own coroutine on the
// shared io_scheduler, resumed at a fixed cadence (deadline based, no drift).
class CoroTicker final : public ITicker
{
public:
    explicit CoroTicker(std::shared_ptr<coro::io_scheduler> scheduler) : m_scheduler(std::move(scheduler)) {}

    void every(std::string name, std::chrono::milliseconds interval, step_fn step) override;

private:
    std::shared_ptr<coro::io_scheduler> m_scheduler;
};

} // namespace royale::runtime
