// SPDX-License-Identifier: Apache-2.0
#include "server/net/session_broadcast.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/game/events.hpp"

namespace royale::net {

void SessionBroadcastChannel::publish(const royale::ServerMessage &msg)
{
    size_t n = m_sessions.broadcast(msg);
    royale::metrics::runtime().broadcasts_published.fetch_add(1, std::memory_order_relaxed);
    if (royale::log::enabled(royale::log::level::trace))
        royale::log::trace("[bcast] {} -> {} sessions", game::events::name(msg), n);
}

void SessionBroadcastChannel::send_to(game::PlayerId player, const royale::ServerMessage &msg)
{
    if (m_sessions.send_to_player(player, msg))
        royale::metrics::runtime().direct_messages.fetch_add(1, std::memory_order_relaxed);
    else
        royale::log::debug("[bcast] {} dropped: player {} not connected", game::events::name(msg), player);
}

} // namespace royale::net
