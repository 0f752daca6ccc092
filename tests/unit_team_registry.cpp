// SPDX-License-Identifier: Apache-2.0
#include "server/game/mode_config.hpp"
#include "server/game/roster.hpp"
#include "server/game/team_registry.hpp"

#include <cassert>
#include <iostream>
#include <set>

using namespace royale::game;

static void check_partition(const TeamSet &teams, const std::vector<std::shared_ptr<PlayerRecord>> &roster, size_t k)
{
    std::set<PlayerId> seen;
    for (auto &t : teams) {
        assert(!t.members.empty());
        assert(t.members.size() <= k);
        for (auto id : t.member_ids())
            assert(seen.insert(id).second); // disjoint
    }
    assert(seen.size() == roster.size()); // cover
}

int main()
{
    Roster roster;
    for (int i = 0; i < 7; ++i)
        roster.add_player("p" + std::to_string(i));
    auto members = roster.members();
    auto modes = ModeTable::defaults();

    // Solo: one singleton per player keyed by the player's id, roster order.
    auto solo = form_teams(*modes.find("solo"), members);
    assert(solo.size() == 7);
    for (size_t i = 0; i < solo.size(); ++i) {
        assert(solo[i].members.size() == 1);
        assert(solo[i].members[0].id == members[i]->id);
        assert(solo[i].key == std::to_string(members[i]->id));
    }

    // Duos over 7 players: ceil(7/2) = 4 teams, the last one short.
    auto duos = form_teams(*modes.find("duos"), members);
    assert(duos.size() == 4);
    check_partition(duos, members, 2);
    assert(duos[0].key == "team_1" && duos[3].key == "team_4");
    assert(duos[0].member_ids() == (std::vector<PlayerId>{members[0]->id, members[1]->id}));
    assert(duos[3].members.size() == 1);

    // Trios over 7 players: 3 teams (3, 3, 1).
    auto trios = form_teams(*modes.find("trios"), members);
    assert(trios.size() == 3);
    check_partition(trios, members, 3);
    assert(trios[2].members.size() == 1);

    // Empty roster forms no teams.
    assert(form_teams(*modes.find("duos"), {}).empty());

    // Registry lookup and alive tracking through weak references.
    TeamRegistry reg;
    reg.form(*modes.find("duos"), members);
    const Team *t = reg.team_of(members[2]->id);
    assert(t && t->key == "team_2");
    assert(reg.team_of(999) == nullptr);
    assert(!t->has_alive_member());
    roster.revive_all();
    assert(t->has_alive_member());
    roster.mark_eliminated(members[2]->id);
    assert(t->has_alive_member());
    roster.mark_eliminated(members[3]->id);
    assert(!t->has_alive_member());

    // Membership is frozen: removing a player does not reshuffle, the weak ref expires.
    roster.remove_player(members[0]->id);
    members.clear();
    const Team *first = reg.team_of(1);
    assert(first && first->members.size() == 2);
    assert(first->members[0].record.expired());
    assert(first->has_alive_member()); // player 2 still alive

    reg.clear();
    assert(reg.teams().empty());
    std::cout << "unit_team_registry OK" << std::endl;
    return 0;
}
