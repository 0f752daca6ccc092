// SPDX-License-Identifier: Apache-2.0
#include "test_support.hpp"

#include <cassert>
#include <iostream>

using namespace royale::game;
using namespace royale::test;

int main()
{
    MatchHarness h;
    assert(h.match->phase() == MatchPhase::Lobby);
    assert(h.match->mode() == "solo");

    // Known mode in Lobby is accepted.
    assert(h.match->request_mode_change("duos"));
    assert(h.match->mode() == "duos");
    assert(h.match->mode_config().team_size == 2);
    // Re-selecting the current mode is fine.
    assert(h.match->request_mode_change("duos"));

    // Unknown mode is rejected and leaves the mode unchanged.
    assert(!h.match->request_mode_change("squads"));
    assert(!h.match->request_mode_change(""));
    assert(h.match->mode() == "duos");

    // Outside Lobby every request is rejected, including known modes.
    h.join(4);
    assert(h.run_until(MatchPhase::Starting));
    assert(!h.match->request_mode_change("solo"));
    assert(!h.match->request_mode_change("trios"));
    assert(h.match->mode() == "duos");

    // The mode chosen at Lobby exit drives team formation (Starting entry).
    h.match->tick();
    auto teams = h.match->teams();
    assert(teams.size() == 2);
    assert(teams[0].key == "team_1" && teams[0].members.size() == 2);

    assert(h.run_until(MatchPhase::Match));
    assert(!h.match->request_mode_change("solo"));
    assert(h.match->mode() == "duos");
    std::cout << "unit_mode_change OK" << std::endl;
    return 0;
}
