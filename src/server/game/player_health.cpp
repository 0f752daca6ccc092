// SPDX-License-Identifier: Apache-2.0
#include "server/game/player_health.hpp"

#include "common/logger.hpp"

namespace royale::game {

void PlayerHealthSink::apply_damage(PlayerId player, float amount)
{
    auto left = m_roster.apply_damage(player, amount);
    if (!left)
        return;
    royale::log::trace("[health] player {} took {} (left {})", player, amount, *left);
    if (*left > 0.f)
        return;
    royale::log::debug("[health] player {} died in the zone", player);
    if (m_on_death)
        m_on_death(player);
}

} // namespace royale::game
