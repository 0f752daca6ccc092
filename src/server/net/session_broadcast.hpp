// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/game/broadcast_channel.hpp"
#include "server/net/session_manager.hpp"

namespace royale::net {

// IBroadcastChannel over the session outgoing queues.
class SessionBroadcastChannel final : public game::IBroadcastChannel
{
public:
    explicit SessionBroadcastChannel(SessionManager &sessions) : m_sessions(sessions) {}

    void publish(const royale::ServerMessage &msg) override;
    void send_to(game::PlayerId player, const royale::ServerMessage &msg) override;

private:
    SessionManager &m_sessions;
};

} // namespace royale::net
