// SPDX-License-Identifier: Apache-2.0
#include "common/metrics.hpp"
#include "server/net/metrics_http.hpp"

#include <cassert>
#include <iostream>
#include <string>

int main()
{
    auto &rt = royale::metrics::runtime();
    rt.matches_started.fetch_add(2);
    rt.alive_players.store(7);
    royale::metrics::add_tick_duration(1500);
    royale::metrics::add_zone_damage(2.5f);

    auto body = royale::net::build_metrics_body();
    assert(body.find("# TYPE royale_matches_started_total counter\n") != std::string::npos);
    assert(body.find("royale_matches_started_total 2\n") != std::string::npos);
    assert(body.find("royale_alive_players 7\n") != std::string::npos);
    assert(body.find("royale_zone_damage_total 2.5\n") != std::string::npos);
    assert(body.find("royale_zone_damage_events_total 1\n") != std::string::npos);
    assert(body.find("royale_tick_duration_ns_bucket{le=\"+Inf\"} 1\n") != std::string::npos);
    assert(body.find("royale_tick_duration_ns_count 1\n") != std::string::npos);
    assert(body.find("# TYPE royale_current_phase gauge\n") != std::string::npos);
    std::cout << "unit_metrics_http OK" << std::endl;
    return 0;
}
