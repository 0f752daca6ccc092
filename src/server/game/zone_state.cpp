// SPDX-License-Identifier: Apache-2.0
#include "server/game/zone_state.hpp"

#include <cmath>

namespace royale::game {

std::vector<ZonePhaseConfig> default_zone_phases()
{
    return {
        {30.f, 20.f, 200.f, 0.10f, 1.f},
        {20.f, 15.f, 120.f, 0.15f, 2.f},
        {15.f, 12.f, 60.f, 0.20f, 4.f},
        {10.f, 10.f, 25.f, 0.15f, 8.f},
        {5.f, 8.f, 0.f, 0.f, 16.f},
    };
}

static bool finite_non_negative(float v)
{
    return std::isfinite(v) && v >= 0.f;
}

std::optional<std::string> validate_zone_phases(const std::vector<ZonePhaseConfig> &phases, float initial_radius)
{
    if (phases.empty())
        return std::string("zone phase table is empty");
    if (!std::isfinite(initial_radius) || initial_radius <= 0.f)
        return "initial radius must be positive, got " + std::to_string(initial_radius);
    float prev_radius = initial_radius;
    for (size_t i = 0; i < phases.size(); ++i) {
        const auto &p = phases[i];
        std::string where = "zone phase " + std::to_string(i + 1) + ": ";
        if (!finite_non_negative(p.delay_sec))
            return where + "negative delay";
        if (!finite_non_negative(p.shrink_sec))
            return where + "negative shrink duration";
        if (!finite_non_negative(p.end_radius))
            return where + "negative end radius";
        if (!finite_non_negative(p.damage))
            return where + "negative damage";
        if (!std::isfinite(p.center_offset) || p.center_offset < 0.f || p.center_offset > 1.f)
            return where + "center offset outside [0, 1]";
        if (p.end_radius > prev_radius)
            return where + "end radius " + std::to_string(p.end_radius) + " grows past previous radius "
                + std::to_string(prev_radius);
        prev_radius = p.end_radius;
    }
    return std::nullopt;
}

std::optional<std::string> validate_zone_settings(const ZoneSettings &settings)
{
    if (!finite_non_negative(settings.warning_seconds))
        return std::string("zone warning_seconds must be >= 0");
    if (!std::isfinite(settings.damage_interval_seconds) || settings.damage_interval_seconds <= 0.f)
        return std::string("zone damage_interval_seconds must be > 0");
    if (!finite_non_negative(settings.grace_period_seconds))
        return std::string("zone grace_period_seconds must be >= 0");
    if (settings.interpolation_hz == 0 || settings.interpolation_hz > 1000)
        return std::string("zone interpolation_hz must be in [1, 1000]");
    if (!finite_non_negative(settings.damage_scale))
        return std::string("zone damage_scale must be >= 0");
    return validate_zone_phases(settings.phases, settings.initial_radius);
}

} // namespace royale::game
