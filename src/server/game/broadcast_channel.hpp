// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "royale.pb.h"
#include "server/game/types.hpp"

namespace royale::game {

// Delivery boundary between the match core and its observers.
// publish(): fire-and-forget to every observer connected right now; nothing is
// retained for observers that connect later (they reconcile via the pull queries).
// send_to(): same semantics for a single player.
class IBroadcastChannel
{
public:
    virtual ~IBroadcastChannel() = default;
    virtual void publish(const royale::ServerMessage &msg) = 0;
    virtual void send_to(PlayerId player, const royale::ServerMessage &msg) = 0;
};

} // namespace royale::game
