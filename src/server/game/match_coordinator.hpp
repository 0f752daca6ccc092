// SPDX-License-Identifier: Apache-2.0
// match_coordinator.hpp
// Top-level match state machine: Lobby -> Starting -> Dropping -> Match -> Ending ->
// Cleanup -> Lobby. One tick() runs the current phase handler once; run() hands tick()
// to an ITicker at the configured cadence.
#pragma once

#include "common/clock.hpp"
#include "common/ticker.hpp"
#include "server/game/broadcast_channel.hpp"
#include "server/game/collaborators.hpp"
#include "server/game/mode_config.hpp"
#include "server/game/phase.hpp"
#include "server/game/roster.hpp"
#include "server/game/team_registry.hpp"
#include "server/game/zone_controller.hpp"

#include <atomic>
#include <deque>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace royale::game {

struct MatchSettings
{
    uint32_t tick_interval_ms{100};
    uint32_t min_players{4};
    float lobby_wait_seconds{60.f};
    uint32_t countdown_seconds{5};
    float drop_settle_seconds{3.f};
    float drop_height{500.f};
    float match_max_seconds{600.f};
    float results_seconds{10.f};
    float intermission_seconds{15.f};
    std::string default_mode{"solo"};
    bool skip_victory{false}; // test mode: matches only end by timeout
    float default_map_size{2048.f};
    float lobby_spawn_height{10.f};
};

// Optional collaborators; any of them may be null.
struct MatchCollaborators
{
    ISpawnPointProvider *spawns{nullptr};
    IDinosaurSpawnController *dinosaurs{nullptr};
    ILootController *loot{nullptr};
};

// Drop points: the provider's spawn points lifted to drop_height, or a ring of 20 points
// at 0.15 * map size around the map center when the provider has none.
std::vector<Vec3> compute_drop_positions(ISpawnPointProvider *spawns, const MatchSettings &settings);
// Provider lobby spawn, else map center at lobby height, else (0, lobby height, 0).
Vec3 compute_lobby_spawn(ISpawnPointProvider *spawns, const MatchSettings &settings);

class MatchCoordinator
{
public:
    MatchCoordinator(
        MatchSettings settings,
        ModeTable modes,
        Roster &roster,
        ZoneController &zone,
        IBroadcastChannel &channel,
        IClock &clock,
        MatchCollaborators collaborators = {});

    MatchPhase phase() const;
    std::string mode() const;
    ModeConfig mode_config() const;
    TeamSet teams() const;
    ZoneState zone_state() const;

    // Lobby only, known mode keys only. Never throws.
    bool request_mode_change(const std::string &mode);
    // Returns false when the player is unknown or already eliminated (nothing emitted).
    // Never throws; a PlayerEliminated the channel rejects is resent on the next tick.
    bool eliminate_player(PlayerId victim, std::optional<PlayerId> killer = std::nullopt);
    // Disconnect: an alive player is eliminated first, then dropped from the roster.
    void remove_player(PlayerId id);

    void tick();
    void run(ITicker &ticker);
    // Makes the driver loop registered by run() exit and stops the zone.
    void shutdown();

    const MatchSettings &settings() const noexcept
    {
        return m_settings;
    }

private:
    void run_phase_locked(IClock::time_point now);
    void transition_locked(MatchPhase next, IClock::time_point now);
    double phase_elapsed(IClock::time_point now) const;

    void handle_lobby(IClock::time_point now);
    void handle_starting(IClock::time_point now);
    void handle_dropping(IClock::time_point now);
    void handle_match(IClock::time_point now);
    void handle_ending(IClock::time_point now);
    void handle_cleanup(IClock::time_point now);

    bool eliminate_locked(PlayerId victim, std::optional<PlayerId> killer);
    // Returns false while events are still queued.
    bool flush_pending_locked();

    const MatchSettings m_settings;
    const ModeTable m_modes;
    Roster &m_roster;
    ZoneController &m_zone;
    IBroadcastChannel &m_channel;
    IClock &m_clock;
    MatchCollaborators m_collab;

    mutable std::mutex m_mutex;
    MatchPhase m_phase{MatchPhase::Lobby};
    IClock::time_point m_phase_started{};
    bool m_entry_done{false}; // entry action of m_phase completed
    std::string m_mode;
    TeamRegistry m_teams;
    std::optional<IClock::time_point> m_lobby_ready_since;
    int64_t m_last_countdown{-1};
    std::deque<royale::ServerMessage> m_pending; // eliminations awaiting delivery, in order
    std::atomic<bool> m_shutdown{false};
};

} // namespace royale::game
