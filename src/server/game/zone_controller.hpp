// SPDX-License-Identifier: Apache-2.0
// zone_controller.hpp
// Shrinking safe zone: grace period, per-phase delay / shrink progression and periodic
// out-of-zone damage. Progression and damage are plain step functions; start() hands
// them to an ITicker (libcoro in the server, a manual pump in tests).
#pragma once

#include "common/clock.hpp"
#include "common/ticker.hpp"
#include "server/game/broadcast_channel.hpp"
#include "server/game/collaborators.hpp"
#include "server/game/zone_state.hpp"

#include <cstdint>
#include <mutex>
#include <random>
#include <vector>

namespace royale::game {

class ZoneController
{
public:
    struct Deps
    {
        IBroadcastChannel &channel;
        IClock &clock;
        ITicker *ticker{nullptr}; // null: caller drives advance()/apply_damage_tick() itself
        IPlayerPositionSource *players{nullptr};
        IDamageSink *damage{nullptr};
        ISpawnPointProvider *map{nullptr};
    };

    // Throws std::invalid_argument when the settings fail validate_zone_settings().
    ZoneController(ZoneSettings settings, Deps deps, uint32_t seed = std::random_device{}());

    // Returns false (and logs a warning) when the zone is already active.
    bool start();
    // Deactivates; radius and center keep their last values. Running loops exit on
    // their next step.
    void stop();
    // Inactive, phase 0, initial radius around the map center.
    void reset();

    ZoneState state() const;
    bool is_inside_zone(const Vec3 &pos) const;
    // Planar; positive inside the zone, negative outside.
    float distance_to_zone(const Vec3 &pos) const;

    // One progression step. Returns false once there is nothing left to progress.
    bool advance();
    // One damage step. Returns false when the zone is inactive.
    bool apply_damage_tick();

    const ZoneSettings &settings() const noexcept
    {
        return m_settings;
    }

private:
    enum class Stage
    {
        idle,
        grace,
        delay,
        shrinking,
        complete
    };

    bool progress_step(uint64_t generation);
    bool damage_step(uint64_t generation);
    bool is_generation(uint64_t generation) const;

    // The *_locked helpers run under m_mutex and queue outgoing events in `out`.
    void begin_phase_locked(size_t index, IClock::time_point at, std::vector<royale::ServerMessage> &out);
    void begin_shrink_locked(IClock::time_point at, std::vector<royale::ServerMessage> &out);
    void finish_shrink_locked(IClock::time_point at, std::vector<royale::ServerMessage> &out);
    void publish_all(const std::vector<royale::ServerMessage> &out);
    Vec3 query_map_center();

    const ZoneSettings m_settings;
    IBroadcastChannel &m_channel;
    IClock &m_clock;
    ITicker *m_ticker;
    IPlayerPositionSource *m_players;
    IDamageSink *m_damage;
    ISpawnPointProvider *m_map;

    mutable std::mutex m_mutex;
    ZoneState m_state;
    Stage m_stage{Stage::idle};
    size_t m_phase_index{0}; // 0-based index into m_settings.phases
    IClock::time_point m_stage_start{};
    IClock::time_point m_stage_end{};
    float m_shrink_from_radius{0.f};
    Vec3 m_shrink_from_center;
    int64_t m_last_warned{-1}; // last whole second announced in the current wait
    uint64_t m_generation{0};
    std::mt19937 m_rng;
};

} // namespace royale::game
