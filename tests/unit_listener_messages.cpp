// SPDX-License-Identifier: Apache-2.0
#include "server/net/listener.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>

using namespace royale;
using namespace royale::test;

int main()
{
    MatchHarness h;
    net::SessionManager mgr;
    net::ListenerDeps deps{&mgr, h.match.get(), &h.roster};
    auto s = mgr.add_detached();

    // Only joins are accepted before the session has joined.
    royale::ClientMessage mode;
    mode.mutable_mode_request()->set_mode("duos");
    assert(!net::handle_client_message(deps, s, mode));
    royale::ClientMessage empty;
    assert(!net::handle_client_message(deps, s, empty));

    royale::ClientMessage join;
    join.mutable_join()->set_name("rex");
    assert(net::handle_client_message(deps, s, join));
    assert(s->joined && s->player_id != 0);
    assert(h.roster.size() == 1);
    auto out = mgr.drain_messages(s);
    assert(out.size() == 1 && out[0].has_join_ack());
    assert(out[0].join_ack().player_id() == s->player_id);
    assert(out[0].join_ack().phase() == royale::PHASE_LOBBY);
    assert(out[0].join_ack().mode() == "solo");
    assert(out[0].join_ack().zone().current_radius() == 500.f);
    assert(!out[0].join_ack().spectator());

    // A repeated join re-acknowledges without a second roster entry.
    auto first_id = s->player_id;
    assert(net::handle_client_message(deps, s, join));
    assert(h.roster.size() == 1);
    out = mgr.drain_messages(s);
    assert(out.size() == 1 && out[0].join_ack().player_id() == first_id);

    assert(net::handle_client_message(deps, s, mode));
    out = mgr.drain_messages(s);
    assert(out.size() == 1 && out[0].mode_ack().accepted() && out[0].mode_ack().mode() == "duos");
    mode.mutable_mode_request()->set_mode("octets");
    assert(net::handle_client_message(deps, s, mode));
    out = mgr.drain_messages(s);
    assert(!out[0].mode_ack().accepted() && out[0].mode_ack().mode() == "duos");

    royale::ClientMessage pos;
    pos.mutable_position()->set_has_body(true);
    pos.mutable_position()->mutable_position()->set_x(12.f);
    pos.mutable_position()->mutable_position()->set_z(-4.f);
    assert(net::handle_client_message(deps, s, pos));
    auto views = h.roster.snapshot();
    assert(views[0].position && views[0].position->x == 12.f && views[0].position->z == -4.f);
    pos.mutable_position()->set_has_body(false);
    assert(net::handle_client_message(deps, s, pos));
    assert(!h.roster.snapshot()[0].position);

    royale::ClientMessage hb;
    hb.mutable_heartbeat()->set_time_ms(1234);
    assert(net::handle_client_message(deps, s, hb));
    out = mgr.drain_messages(s);
    assert(out.size() == 1 && out[0].heartbeat_resp().client_time_ms() == 1234);

    // Joining while a round runs: acknowledged as a spectator, not alive.
    assert(h.match->request_mode_change("solo"));
    h.join(1);
    assert(h.run_until(royale::game::MatchPhase::Match, 60s));
    h.match->tick();
    auto late = mgr.add_detached();
    join.mutable_join()->set_name("late");
    assert(net::handle_client_message(deps, late, join));
    out = mgr.drain_messages(late);
    assert(out.size() == 1 && out[0].join_ack().spectator());
    assert(out[0].join_ack().phase() == royale::PHASE_MATCH);
    assert(out[0].join_ack().zone().active());
    for (auto &v : h.roster.snapshot())
        if (v.id == late->player_id)
            assert(!v.alive);
    std::cout << "unit_listener_messages OK" << std::endl;
    return 0;
}
