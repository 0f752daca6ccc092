// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/game/mode_config.hpp"
#include "server/game/roster.hpp"
#include "server/game/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace royale::game {

struct TeamMember
{
    PlayerId id{0};
    std::weak_ptr<const PlayerRecord> record; // non-owning; expires when the player disconnects
};

struct Team
{
    std::string key; // player id (solo) or "team_<n>"
    std::vector<TeamMember> members;

    std::vector<PlayerId> member_ids() const;
    bool contains(PlayerId id) const;
    // Reads the members' alive flags through the weak references.
    bool has_alive_member() const;
};

using TeamSet = std::vector<Team>; // formation order

// Solo: one singleton team per player keyed by the player's id. Grouped modes: players
// packed in roster order into team_1, team_2, ... of at most team_size members.
TeamSet form_teams(const ModeConfig &mode, const std::vector<std::shared_ptr<PlayerRecord>> &roster);

// Holds the partition of the current match. Not synchronised: owned and driven by the
// MatchCoordinator under its own lock.
class TeamRegistry
{
public:
    const TeamSet &form(const ModeConfig &mode, const std::vector<std::shared_ptr<PlayerRecord>> &roster);

    const TeamSet &teams() const noexcept
    {
        return m_teams;
    }

    const Team *team_of(PlayerId id) const;
    void clear();

private:
    TeamSet m_teams;
};

} // namespace royale::game
