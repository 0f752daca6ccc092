// SPDX-License-Identifier: Apache-2.0
#include "server/net/session_manager.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>

using namespace royale;
using namespace royale::test;

int main()
{
    MatchHarness h;
    net::SessionManager mgr;
    mgr.set_disconnect_handler([&](game::PlayerId id) { h.match->remove_player(id); });

    auto ids = h.join(3);
    std::vector<std::shared_ptr<net::Session>> sessions;
    for (auto id : ids) {
        auto s = mgr.add_detached();
        mgr.bind_player(s, id, "p");
        sessions.push_back(s);
    }
    assert(h.run_until(game::MatchPhase::Match, 60s));
    h.match->tick();
    assert(h.roster.alive_count() == 3);

    // Rewind one heartbeat; only that session is stale.
    auto now = std::chrono::steady_clock::now();
    sessions[1]->last_heartbeat -= std::chrono::hours(1);
    auto stale = mgr.stale_sessions(now, std::chrono::seconds(15));
    assert(stale.size() == 1 && stale[0].session == sessions[1]);
    assert(stale[0].player_id == ids[1]);
    assert(stale[0].idle >= std::chrono::hours(1));

    // As the monitor does: disconnect eliminates the player and drops them from the roster.
    for (auto &s : stale)
        mgr.disconnect_session(s.session);
    assert(mgr.stale_sessions(now, std::chrono::seconds(15)).empty());
    assert(!h.roster.contains(ids[1]));
    assert(h.roster.alive_count() == 2);
    auto elim = h.channel.of("PlayerEliminated");
    assert(elim.size() == 1 && elim[0].player_eliminated().victim_id() == ids[1]);
    assert(!elim[0].player_eliminated().has_killer_id());
    for (auto &s : mgr.snapshot_all_sessions())
        assert(s->connection_id != sessions[1]->connection_id);

    // A fresh heartbeat keeps a session alive.
    sessions[0]->last_heartbeat -= std::chrono::hours(1);
    mgr.update_heartbeat(sessions[0]);
    assert(mgr.stale_sessions(std::chrono::steady_clock::now(), std::chrono::seconds(15)).empty());

    // Losing the second-to-last player ends the round.
    mgr.disconnect_session(sessions[2]);
    assert(h.run_until(game::MatchPhase::Ending, 5s));
    auto v = h.channel.of("VictoryDeclared");
    assert(v.size() == 1 && v[0].victory().player_id() == ids[0]);
    std::cout << "unit_heartbeat_timeout OK" << std::endl;
    return 0;
}
