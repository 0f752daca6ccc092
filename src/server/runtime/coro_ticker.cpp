// SPDX-License-Identifier: Apache-2.0
#include "server/runtime/coro_ticker.hpp"

#include "common/logger.hpp"

#include <chrono>
#include <exception>

namespace royale::runtime {

static coro::task<void> run_periodic(
    std::shared_ptr<coro::io_scheduler> scheduler,
    std::string name,
    std::chrono::milliseconds interval,
    ITicker::step_fn step)
{
    co_await scheduler->schedule();
    royale::log::debug("[ticker] start {} interval={}ms", name, interval.count());
    using clock = std::chrono::steady_clock;
    auto next = clock::now();
    while (true) {
        bool keep = true;
        try {
            keep = step();
        } catch (const std::exception &ex) {
            // A failing step is retried on the next interval.
            royale::log::error("[ticker] {} step failed: {}", name, ex.what());
        }
        if (!keep)
            break;
        next += interval;
        auto now = clock::now();
        if (next > now) {
            co_await scheduler->yield_for(std::chrono::duration_cast<std::chrono::milliseconds>(next - now));
        } else {
            // Overran the deadline; resynchronise instead of bursting to catch up.
            next = now;
            co_await scheduler->yield();
        }
    }
    royale::log::debug("[ticker] stop {}", name);
    co_return;
}

void CoroTicker::every(std::string name, std::chrono::milliseconds interval, step_fn step)
{
    if (interval.count() <= 0)
        interval = std::chrono::milliseconds(1);
    m_scheduler->spawn(run_periodic(m_scheduler, std::move(name), interval, std::move(step)));
}

} // namespace royale::runtime
