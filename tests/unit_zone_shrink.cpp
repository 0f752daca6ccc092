// SPDX-License-Identifier: Apache-2.0
#include "test_support.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace royale::game;
using namespace royale::test;

static ZoneSettings two_phase_settings()
{
    ZoneSettings z;
    z.initial_radius = 500.f;
    z.grace_period_seconds = 0.f;
    z.phases = {
        {2.f, 4.f, 300.f, 0.2f, 1.f},
        {1.f, 2.f, 100.f, 0.f, 3.f},
    };
    return z;
}

int main()
{
    // Phase table validation.
    assert(!validate_zone_phases(default_zone_phases(), 500.f));
    assert(validate_zone_phases({}, 500.f));
    assert(validate_zone_phases({{-1.f, 1.f, 100.f, 0.f, 1.f}}, 500.f));
    assert(validate_zone_phases({{1.f, 1.f, 100.f, 0.f, -1.f}}, 500.f));
    assert(validate_zone_phases({{1.f, 1.f, 100.f, 1.5f, 1.f}}, 500.f));
    assert(validate_zone_phases({{1.f, 1.f, 600.f, 0.f, 1.f}}, 500.f));
    assert(validate_zone_phases({{1.f, 1.f, 100.f, 0.f, 1.f}, {1.f, 1.f, 200.f, 0.f, 1.f}}, 500.f));

    // Smooth, monotonic shrink that lands exactly on each target.
    {
        ManualClock clock;
        ManualTicker ticker{clock};
        RecordingChannel channel;
        ZoneController zone{two_phase_settings(), ZoneController::Deps{channel, clock, &ticker}, 11u};
        assert(zone.start());
        assert(!zone.start()); // idempotent
        auto s = zone.state();
        assert(s.active && s.phase == 1 && s.current_radius == 500.f && s.damage == 1.f);

        float prev = 500.f;
        bool saw_partial = false;
        for (int i = 0; i < 1000; ++i) {
            ticker.advance(10ms);
            auto st = zone.state();
            assert(st.current_radius <= prev); // never grows
            assert(st.current_radius >= st.target_radius); // never undershoots
            if (st.current_radius < 500.f && st.current_radius > 300.f)
                saw_partial = true;
            prev = st.current_radius;
            if (i == 599) { // t = 6 s: end of the first shrink
                assert(st.current_radius == 300.f);
                assert(st.phase == 2 && st.damage == 3.f);
                // Center moved by at most offset * radius on each planar axis.
                assert(std::fabs(st.current_center.x) <= 100.f && std::fabs(st.current_center.z) <= 100.f);
            }
        }
        assert(saw_partial);
        auto end = zone.state();
        assert(end.current_radius == 100.f && end.target_radius == 100.f);
        assert(end.active && end.phase == 2);
        // Progression is finished; the damage loop keeps running.
        assert(ticker.active("zone-progress") == 0);
        assert(ticker.active("zone-damage") == 1);

        // Event order: live marker, warnings, one update per shrink.
        auto updates = channel.of("ZoneUpdate");
        assert(updates.size() == 3);
        assert(updates[0].zone_update().phase() == 0);
        assert(updates[1].zone_update().phase() == 1 && updates[1].zone_update().target_radius() == 300.f);
        assert(updates[2].zone_update().phase() == 2 && updates[2].zone_update().damage() == 3.f);
        auto warnings = channel.of("ZoneWarning");
        assert(warnings.size() == 3); // (2,1) (1,1) (1,2)
        assert(warnings[0].zone_warning().delay_seconds() == 2 && warnings[0].zone_warning().upcoming_phase() == 1);
        assert(warnings[1].zone_warning().delay_seconds() == 1 && warnings[1].zone_warning().upcoming_phase() == 1);
        assert(warnings[2].zone_warning().upcoming_phase() == 2);
    }

    // A single late step crosses several boundaries at their scheduled times.
    {
        ManualClock clock;
        RecordingChannel channel;
        auto z = two_phase_settings();
        z.phases[0].center_offset = 0.f;
        ZoneController zone{z, ZoneController::Deps{channel, clock}, 3u};
        assert(zone.start());
        clock.advance(7500ms);
        assert(zone.advance());
        auto st = zone.state();
        assert(st.phase == 2);
        assert(st.target_radius == 100.f);
        assert(st.current_radius == 250.f); // 25% into the 300 -> 100 shrink that began at t = 7 s
        clock.advance(10s);
        assert(!zone.advance());
        assert(zone.state().current_radius == 100.f);
    }

    // Planar geometry queries.
    {
        ManualClock clock;
        RecordingChannel channel;
        ZoneController zone{two_phase_settings(), ZoneController::Deps{channel, clock}};
        assert(zone.is_inside_zone(Vec3{300.f, 0.f, 400.f}));
        assert(zone.is_inside_zone(Vec3{0.f, 1000.f, 0.f}));
        assert(!zone.is_inside_zone(Vec3{600.f, 0.f, 0.f}));
        assert(zone.distance_to_zone(Vec3{600.f, 0.f, 0.f}) == -100.f);
        assert(zone.distance_to_zone(Vec3{}) == 500.f);
    }
    // A controller cannot be built over an invalid phase table.
    {
        ManualClock clock;
        RecordingChannel channel;
        auto bad = two_phase_settings();
        bad.phases.clear();
        bool rejected = false;
        try {
            ZoneController zone{bad, ZoneController::Deps{channel, clock}};
        } catch (const std::invalid_argument &) {
            rejected = true;
        }
        assert(rejected);
        bad = two_phase_settings();
        bad.interpolation_hz = 0;
        rejected = false;
        try {
            ZoneController zone{bad, ZoneController::Deps{channel, clock}};
        } catch (const std::invalid_argument &) {
            rejected = true;
        }
        assert(rejected);
    }
    std::cout << "unit_zone_shrink OK" << std::endl;
    return 0;
}
