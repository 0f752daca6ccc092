// SPDX-License-Identifier: Apache-2.0
#include "test_support.hpp"

#include <cassert>
#include <iostream>

using namespace royale::game;
using namespace royale::test;

int main()
{
    auto ms = fast_match_settings();
    MatchHarness h(ms);
    auto ids = h.join(4);

    // In the Lobby nobody is alive yet: eliminating is a no-op.
    assert(!h.match->eliminate_player(ids[0]));
    assert(h.channel.count("PlayerEliminated") == 0);

    assert(h.match->request_mode_change("duos"));
    assert(h.run_until(MatchPhase::Match));
    h.channel.clear();

    // First call eliminates and emits; the second is a silent no-op.
    assert(h.match->eliminate_player(ids[0], ids[2]));
    assert(!h.match->eliminate_player(ids[0], ids[2]));
    assert(!h.match->eliminate_player(ids[0]));
    auto events = h.channel.of("PlayerEliminated");
    assert(events.size() == 1);
    assert(events[0].player_eliminated().victim_id() == ids[0]);
    assert(events[0].player_eliminated().has_killer_id());
    assert(events[0].player_eliminated().killer_id() == ids[2]);

    // Unknown players are ignored.
    assert(!h.match->eliminate_player(4242));
    assert(h.channel.count("PlayerEliminated") == 1);

    // No killer: the optional field stays unset.
    assert(h.match->eliminate_player(ids[1]));
    auto last = h.channel.of("PlayerEliminated").back();
    assert(!last.player_eliminated().has_killer_id());

    // team_1 (ids 0, 1) is gone, team_2 remains: the next tick declares team_2.
    h.match->tick();
    auto wins = h.channel.of("VictoryDeclared");
    assert(wins.size() == 1);
    assert(wins[0].victory().team_key() == "team_2");
    assert(h.match->phase() == MatchPhase::Ending);

    // Disconnecting an alive player eliminates first, then removes.
    MatchHarness h2;
    auto ids2 = h2.join(3);
    assert(h2.run_until(MatchPhase::Match));
    h2.channel.clear();
    h2.match->remove_player(ids2[1]);
    assert(h2.channel.count("PlayerEliminated") == 1);
    assert(!h2.roster.contains(ids2[1]));
    h2.match->remove_player(ids2[1]);
    assert(h2.channel.count("PlayerEliminated") == 1);
    std::cout << "unit_elimination OK" << std::endl;
    return 0;
}
