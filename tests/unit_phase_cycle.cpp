// SPDX-License-Identifier: Apache-2.0
// One full match cycle with collaborators attached: every transition goes to the adjacent
// successor and each phase performs its entry work exactly once.
#include "test_support.hpp"

#include <cassert>
#include <iostream>

using namespace royale::game;
using namespace royale::test;

int main()
{
    FakeSpawns spawns;
    spawns.points = {Vec3{10.f, 0.f, 10.f}, Vec3{-10.f, 0.f, -10.f}};
    spawns.lobby = Vec3{1.f, 50.f, 2.f};
    FakeDinosaurs dinos;
    FakeLoot loot;
    MatchHarness h(fast_match_settings(), quiet_zone_settings(), MatchCollaborators{&spawns, &dinos, &loot});
    auto ids = h.join(3);

    assert(h.run_until(MatchPhase::Starting));
    assert(h.run_until(MatchPhase::Dropping));
    std::vector<uint32_t> countdown;
    for (auto &m : h.channel.of("Countdown"))
        countdown.push_back(m.countdown().seconds_remaining());
    assert((countdown == std::vector<uint32_t>{5, 4, 3, 2, 1}));
    assert(h.roster.alive_count() == 3);
    assert(h.match->teams().size() == 3);

    // Drop entry: loot once, round-robin over the two provider points lifted to drop height.
    h.match->tick();
    assert(loot.spawned == 1);
    auto drops = h.channel.of("DropAssigned");
    assert(drops.size() == 3);
    assert(drops[0].drop_assigned().player_id() == ids[0]);
    assert(drops[0].drop_assigned().position().x() == 10.f);
    assert(drops[0].drop_assigned().position().y() == 500.f);
    assert(drops[1].drop_assigned().position().x() == -10.f);
    assert(drops[2].drop_assigned().position().x() == 10.f);
    for (auto &v : h.roster.snapshot())
        assert(v.position && v.position->y == 500.f);

    assert(h.run_until(MatchPhase::Match));
    h.match->tick();
    assert(dinos.started == 1);
    assert(h.zone->state().active);
    assert(h.channel.count("AliveCountUpdate") >= 1);
    auto alive = h.channel.of("AliveCountUpdate").back().alive_count();
    assert(alive.players() == 3 && alive.teams() == 3);

    h.match->eliminate_player(ids[0], ids[2]);
    h.match->eliminate_player(ids[1], ids[2]);
    h.match->tick();
    assert(h.match->phase() == MatchPhase::Ending);
    auto wins = h.channel.of("VictoryDeclared");
    assert(wins.size() == 1 && wins[0].victory().player_id() == ids[2]);

    h.match->tick();
    assert(dinos.stopped == 1);
    assert(!h.zone->state().active);

    assert(h.run_until(MatchPhase::Cleanup));
    h.match->tick();
    assert(dinos.despawned == 1 && loot.reset == 1);
    auto back = h.channel.of("LobbyReturn");
    assert(back.size() == 1);
    assert(back[0].lobby_return().position().y() == 50.f);
    assert(h.roster.alive_count() == 0);
    assert(h.match->teams().empty());
    auto z = h.zone->state();
    assert(!z.active && z.phase == 0 && z.current_radius == h.zone->settings().initial_radius);

    assert(h.run_until(MatchPhase::Lobby));

    // Phase changes walk the cycle without skipping.
    auto changes = h.channel.of("PhaseChanged");
    assert(changes.size() == 6);
    MatchPhase expected = MatchPhase::Lobby;
    for (auto &c : changes) {
        assert(c.phase_changed().old_phase() == to_proto(expected));
        expected = next_phase(expected);
        assert(c.phase_changed().new_phase() == to_proto(expected));
    }
    assert(expected == MatchPhase::Lobby);
    // Entry work ran once per phase.
    assert(loot.spawned == 1 && dinos.started == 1 && dinos.stopped == 1);
    std::cout << "unit_phase_cycle OK" << std::endl;
    return 0;
}
