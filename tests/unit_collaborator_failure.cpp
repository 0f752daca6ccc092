// SPDX-License-Identifier: Apache-2.0
#include "test_support.hpp"

#include "common/metrics.hpp"

#include <cassert>
#include <iostream>

using namespace royale::game;
using namespace royale::test;

int main()
{
    FakeSpawns spawns;
    FakeDinosaurs dinos;
    FakeLoot loot;
    spawns.throw_all = true;
    dinos.throw_all = true;
    loot.throw_all = true;

    auto &rt = royale::metrics::runtime();
    MatchHarness h{fast_match_settings(), quiet_zone_settings(), MatchCollaborators{&spawns, &dinos, &loot}};

    // A channel failure aborts the tick; the handler runs again on the next one.
    auto failures_before = rt.handler_failures.load();
    h.channel.fail_publishes = 1;
    h.match->tick();
    assert(rt.handler_failures.load() == failures_before + 1);
    assert(h.match->phase() == MatchPhase::Lobby);
    h.match->tick();
    assert(h.channel.count("LobbyStatus") == 1);
    assert(rt.handler_failures.load() == failures_before + 1);

    auto collab_before = rt.collaborator_failures.load();
    auto ids = h.join(2);
    assert(h.run_until(MatchPhase::Match, 60s));
    h.match->tick();
    assert(loot.spawned == 1);
    assert(dinos.started == 1);
    assert(h.channel.count("DropAssigned") == 2);
    assert(h.zone->state().active);
    assert(h.zone->state().current_center == (Vec3{}));
    assert(rt.collaborator_failures.load() > collab_before);

    assert(h.match->eliminate_player(ids[1], ids[0]));
    assert(h.run_until(MatchPhase::Ending, 5s));
    assert(h.channel.count("VictoryDeclared") == 1);
    assert(h.run_until(MatchPhase::Lobby, 60s));
    assert(dinos.stopped == 1);
    assert(dinos.despawned == 1);
    assert(loot.reset == 1);
    auto returns = h.channel.of("LobbyReturn");
    assert(returns.size() == 1);
    assert(returns[0].lobby_return().position().x() == 0.f);
    assert(returns[0].lobby_return().position().y() == 10.f);
    assert(!h.zone->state().active);

    // Failing collaborators never block the next round either.
    h.channel.clear();
    assert(h.run_until(MatchPhase::Match, 60s));
    h.match->tick();
    assert(dinos.started == 2);

    // A rejected zone event on Match entry still leaves the zone fully running.
    {
        MatchHarness m;
        m.join(3);
        assert(m.run_until(MatchPhase::Match, 60s));
        auto broadcast_before = rt.broadcast_failures.load();
        auto handler_before = rt.handler_failures.load();
        m.channel.fail_publishes = 1; // the zone's opening ZoneUpdate
        m.match->tick();
        m.match->tick();
        assert(rt.broadcast_failures.load() == broadcast_before + 1);
        assert(rt.handler_failures.load() == handler_before);
        assert(m.zone->state().active);
        m.ticker.advance(60s);
        assert(m.ticker.active("zone-progress") == 1);
        assert(m.ticker.active("zone-damage") == 1);
        assert(m.zone->state().current_radius < 500.f);
        assert(m.channel.count("ZoneUpdate") >= 1);
    }

    // A rejected PlayerEliminated is delivered once, on the next tick, ahead of phase events.
    {
        MatchHarness m;
        auto p = m.join(3);
        assert(m.run_until(MatchPhase::Match, 60s));
        m.match->tick();
        m.channel.clear();

        m.channel.fail_publishes = 1;
        assert(m.match->eliminate_player(p[0], p[1]));
        assert(!m.match->eliminate_player(p[0], p[1]));
        assert(m.channel.count("PlayerEliminated") == 0);
        m.match->tick();
        auto elim = m.channel.of("PlayerEliminated");
        assert(elim.size() == 1);
        assert(elim[0].player_eliminated().victim_id() == p[0]);
        assert(elim[0].player_eliminated().killer_id() == p[1]);
        assert(royale::game::events::name(m.channel.published.front()) == "PlayerEliminated");
        m.match->tick();
        assert(m.channel.count("PlayerEliminated") == 1);

        // Disconnect while the channel keeps failing: the roster entry still goes, and the
        // victory waits until the elimination is out.
        m.channel.clear();
        m.channel.fail_publishes = 2;
        m.match->remove_player(p[1]);
        assert(!m.roster.contains(p[1]));
        assert(m.roster.size() == 2);
        m.match->tick(); // queue still blocked
        assert(m.match->phase() == MatchPhase::Match);
        assert(m.channel.count("VictoryDeclared") == 0);
        m.match->tick();
        assert(m.match->phase() == MatchPhase::Ending);
        assert(m.channel.published.size() >= 3);
        assert(royale::game::events::name(m.channel.published[0]) == "PlayerEliminated");
        assert(m.channel.published[0].player_eliminated().victim_id() == p[1]);
        auto v = m.channel.of("VictoryDeclared");
        assert(v.size() == 1 && v[0].victory().player_id() == p[2]);
    }
    std::cout << "unit_collaborator_failure OK" << std::endl;
    return 0;
}
