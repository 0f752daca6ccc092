// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/game/collaborators.hpp"
#include "server/game/roster.hpp"

#include <functional>

namespace royale::game {

// Zone damage lands on roster health; a hit that takes health to zero reports a death.
class PlayerHealthSink final : public IDamageSink
{
public:
    using death_fn = std::function<void(PlayerId)>;

    explicit PlayerHealthSink(Roster &roster) : m_roster(roster) {}

    // Set once during wiring, before any damage is applied.
    void set_death_handler(death_fn fn)
    {
        m_on_death = std::move(fn);
    }

    void apply_damage(PlayerId player, float amount) override;

private:
    Roster &m_roster;
    death_fn m_on_death;
};

} // namespace royale::game
