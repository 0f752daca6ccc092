// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/game/match_coordinator.hpp"
#include "server/game/roster.hpp"
#include "server/net/session_manager.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>

namespace royale::net {

struct ListenerDeps
{
    SessionManager *sessions{nullptr};
    game::MatchCoordinator *match{nullptr};
    game::Roster *roster{nullptr};
    const std::atomic<bool> *stop{nullptr}; // accept and connection loops exit once set
};

// Applies one decoded client message to the match core. Replies (JoinAck, ModeAck,
// HeartbeatResp) are queued on the session. Returns false when the message is invalid
// for the session state and the connection should be dropped.
bool handle_client_message(const ListenerDeps &deps, const std::shared_ptr<Session> &session, const royale::ClientMessage &msg);

// Starts the TCP accept loop on the given port. Each connection polls reads with a timeout
// of one driver tick so queued broadcasts are flushed at the driver cadence.
coro::task<void> run_listener(
    std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port, uint32_t tick_interval_ms, ListenerDeps deps);

} // namespace royale::net
