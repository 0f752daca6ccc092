// SPDX-License-Identifier: Apache-2.0
#include "server/game/victory.hpp"

#include <cassert>
#include <iostream>

using namespace royale::game;

static Team team(std::string key, std::vector<PlayerId> ids)
{
    Team t{std::move(key), {}};
    for (auto id : ids)
        t.members.push_back(TeamMember{id, {}});
    return t;
}

int main()
{
    const ModeConfig solo{"Solo", 1, 20};
    const ModeConfig duos{"Duos", 2, 20};

    // Solo, exactly one alive -> that player wins.
    {
        AliveMap alive{{1, false}, {2, true}, {3, false}};
        TeamSet teams{team("1", {1}), team("2", {2}), team("3", {3})};
        auto counts = count_alive(alive, teams);
        assert(counts.players == 1 && counts.teams == 1);
        auto w = evaluate_victory(solo, counts, teams, alive);
        assert(w && w->kind == Winner::Kind::player && w->player == 2);
    }
    // Solo, nobody alive -> no winner.
    {
        AliveMap alive{{1, false}, {2, false}};
        TeamSet teams{team("1", {1}), team("2", {2})};
        assert(!evaluate_victory(solo, count_alive(alive, teams), teams, alive));
    }
    // Solo, two alive -> no winner.
    {
        AliveMap alive{{1, true}, {2, true}, {3, false}};
        TeamSet teams{team("1", {1}), team("2", {2}), team("3", {3})};
        assert(!evaluate_victory(solo, count_alive(alive, teams), teams, alive));
    }
    // Duos, one team left with a single survivor -> team wins.
    {
        AliveMap alive{{1, false}, {2, false}, {3, false}, {4, true}};
        TeamSet teams{team("team_1", {1, 2}), team("team_2", {3, 4})};
        auto counts = count_alive(alive, teams);
        assert(counts.players == 1 && counts.teams == 1);
        auto w = evaluate_victory(duos, counts, teams, alive);
        assert(w && w->kind == Winner::Kind::team && w->team_key == "team_2");
        assert(w->describe() == "team team_2");
    }
    // Duos, two teams alive or a simultaneous wipe -> no winner.
    {
        AliveMap alive{{1, true}, {2, false}, {3, true}, {4, false}};
        TeamSet teams{team("team_1", {1, 2}), team("team_2", {3, 4})};
        assert(!evaluate_victory(duos, count_alive(alive, teams), teams, alive));
        AliveMap wiped{{1, false}, {2, false}, {3, false}, {4, false}};
        assert(!evaluate_victory(duos, count_alive(wiped, teams), teams, wiped));
    }
    std::cout << "unit_victory OK" << std::endl;
    return 0;
}
