// SPDX-License-Identifier: Apache-2.0
#include "server/game/victory.hpp"

namespace royale::game {

namespace {
bool is_alive(const AliveMap &alive, PlayerId id)
{
    auto it = alive.find(id);
    return it != alive.end() && it->second;
}

bool team_alive(const AliveMap &alive, const Team &team)
{
    for (auto &m : team.members)
        if (is_alive(alive, m.id))
            return true;
    return false;
}
} // namespace

AliveCounts count_alive(const AliveMap &alive, const TeamSet &teams)
{
    AliveCounts c;
    for (auto &[id, a] : alive)
        if (a)
            ++c.players;
    for (auto &t : teams)
        if (team_alive(alive, t))
            ++c.teams;
    return c;
}

std::optional<Winner> evaluate_victory(
    const ModeConfig &mode, const AliveCounts &counts, const TeamSet &teams, const AliveMap &alive)
{
    if (mode.is_solo()) {
        if (counts.players != 1)
            return std::nullopt;
        for (auto &[id, a] : alive) {
            if (a)
                return Winner{Winner::Kind::player, id, {}};
        }
        return std::nullopt;
    }
    if (counts.teams != 1)
        return std::nullopt;
    for (auto &t : teams) {
        if (team_alive(alive, t))
            return Winner{Winner::Kind::team, 0, t.key};
    }
    return std::nullopt;
}

} // namespace royale::game
