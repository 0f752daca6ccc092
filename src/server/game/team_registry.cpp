// SPDX-License-Identifier: Apache-2.0
#include "server/game/team_registry.hpp"

#include "common/logger.hpp"

#include <algorithm>

namespace royale::game {

std::vector<PlayerId> Team::member_ids() const
{
    std::vector<PlayerId> ids;
    ids.reserve(members.size());
    for (auto &m : members)
        ids.push_back(m.id);
    return ids;
}

bool Team::contains(PlayerId id) const
{
    return std::any_of(members.begin(), members.end(), [&](auto &m) { return m.id == id; });
}

bool Team::has_alive_member() const
{
    for (auto &m : members) {
        if (auto rec = m.record.lock(); rec && rec->alive.load(std::memory_order_acquire))
            return true;
    }
    return false;
}

TeamSet form_teams(const ModeConfig &mode, const std::vector<std::shared_ptr<PlayerRecord>> &roster)
{
    TeamSet teams;
    if (mode.is_solo()) {
        teams.reserve(roster.size());
        for (auto &p : roster)
            teams.push_back(Team{std::to_string(p->id), {TeamMember{p->id, p}}});
        return teams;
    }
    const size_t team_size = mode.team_size;
    teams.reserve((roster.size() + team_size - 1) / team_size);
    for (auto &p : roster) {
        if (teams.empty() || teams.back().members.size() >= team_size)
            teams.push_back(Team{"team_" + std::to_string(teams.size() + 1), {}});
        teams.back().members.push_back(TeamMember{p->id, p});
    }
    return teams;
}

const TeamSet &TeamRegistry::form(const ModeConfig &mode, const std::vector<std::shared_ptr<PlayerRecord>> &roster)
{
    m_teams = form_teams(mode, roster);
    royale::log::info("[teams] formed {} teams for mode {} (team_size={})", m_teams.size(), mode.name, mode.team_size);
    for (auto &t : m_teams)
        royale::log::debug("[teams] {} members={}", t.key, t.members.size());
    return m_teams;
}

const Team *TeamRegistry::team_of(PlayerId id) const
{
    for (auto &t : m_teams)
        if (t.contains(id))
            return &t;
    return nullptr;
}

void TeamRegistry::clear()
{
    m_teams.clear();
}

} // namespace royale::game
