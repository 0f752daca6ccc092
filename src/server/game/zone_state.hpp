// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/game/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace royale::game {

struct ZonePhaseConfig
{
    float delay_sec{0.f}; // wait before the shrink starts
    float shrink_sec{0.f};
    float end_radius{0.f};
    float center_offset{0.f}; // fraction of the current radius the center may move by
    float damage{0.f}; // per damage tick, before damage_scale
};

// Five-stage shrink: 500 -> 200 -> 120 -> 60 -> 25 -> 0.
std::vector<ZonePhaseConfig> default_zone_phases();

struct ZoneSettings
{
    float initial_radius{500.f};
    float warning_seconds{10.f};
    float damage_interval_seconds{1.f};
    float grace_period_seconds{30.f};
    uint32_t interpolation_hz{20};
    float damage_scale{1.f};
    std::vector<ZonePhaseConfig> phases{default_zone_phases()};
};

// Empty on success, otherwise a human readable reason naming the offending phase.
std::optional<std::string> validate_zone_phases(const std::vector<ZonePhaseConfig> &phases, float initial_radius);
std::optional<std::string> validate_zone_settings(const ZoneSettings &settings);

struct ZoneState
{
    uint32_t phase{0}; // 1-based index of the current/upcoming phase, 0 = inactive or grace
    float current_radius{0.f};
    float target_radius{0.f};
    Vec3 current_center;
    Vec3 target_center;
    bool active{false};
    float damage{0.f};
    bool in_grace{false};
    float grace_remaining{0.f};
};

} // namespace royale::game
