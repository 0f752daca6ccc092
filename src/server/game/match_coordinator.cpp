// SPDX-License-Identifier: Apache-2.0
#include "server/game/match_coordinator.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/game/events.hpp"
#include "server/game/victory.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <stdexcept>

namespace royale::game {

namespace {
constexpr int kDropRingPoints = 20;
constexpr float kDropRingFraction = 0.15f;
constexpr double kTwoPi = 6.283185307179586;

// Missing collaborators are skipped; a throwing one is contained here so phase
// progression never depends on it.
template <typename T, typename Fn>
void call_collaborator(T *target, const char *what, Fn &&fn)
{
    if (!target) {
        royale::log::debug("[match] {} skipped: collaborator unavailable", what);
        return;
    }
    try {
        fn(*target);
    } catch (const std::exception &ex) {
        royale::metrics::runtime().collaborator_failures.fetch_add(1, std::memory_order_relaxed);
        royale::log::error("[match] {} failed: {}", what, ex.what());
    }
}

uint32_t ceil_seconds(double s)
{
    return s <= 0.0 ? 0u : static_cast<uint32_t>(std::ceil(s));
}
} // namespace

std::vector<Vec3> compute_drop_positions(ISpawnPointProvider *spawns, const MatchSettings &settings)
{
    std::vector<Vec3> points;
    Vec3 center{};
    float map_size = settings.default_map_size;
    call_collaborator(spawns, "spawn points", [&](ISpawnPointProvider &p) { points = p.player_spawn_points(); });
    for (auto &pt : points)
        pt.y = settings.drop_height;
    if (!points.empty())
        return points;

    call_collaborator(spawns, "map bounds", [&](ISpawnPointProvider &p) {
        Vec3 c = p.map_center();
        float s = p.map_size();
        center = c;
        if (s > 0.f)
            map_size = s;
    });
    royale::log::warn("[match] no spawn points, using fallback ring (map size {})", map_size);
    const float radius = map_size * kDropRingFraction;
    points.reserve(kDropRingPoints);
    for (int i = 1; i <= kDropRingPoints; ++i) {
        double angle = (static_cast<double>(i) / kDropRingPoints) * kTwoPi;
        points.push_back(Vec3{
            center.x + static_cast<float>(std::cos(angle)) * radius,
            settings.drop_height,
            center.z + static_cast<float>(std::sin(angle)) * radius});
    }
    return points;
}

Vec3 compute_lobby_spawn(ISpawnPointProvider *spawns, const MatchSettings &settings)
{
    std::optional<Vec3> spawn;
    call_collaborator(spawns, "lobby spawn", [&](ISpawnPointProvider &p) { spawn = p.lobby_spawn(); });
    if (spawn)
        return *spawn;
    Vec3 fallback{0.f, settings.lobby_spawn_height, 0.f};
    call_collaborator(spawns, "map center", [&](ISpawnPointProvider &p) {
        Vec3 c = p.map_center();
        fallback = Vec3{c.x, settings.lobby_spawn_height, c.z};
    });
    return fallback;
}

MatchCoordinator::MatchCoordinator(
    MatchSettings settings,
    ModeTable modes,
    Roster &roster,
    ZoneController &zone,
    IBroadcastChannel &channel,
    IClock &clock,
    MatchCollaborators collaborators)
    : m_settings(std::move(settings))
    , m_modes(std::move(modes))
    , m_roster(roster)
    , m_zone(zone)
    , m_channel(channel)
    , m_clock(clock)
    , m_collab(collaborators)
{
    if (m_modes.all().empty())
        throw std::invalid_argument("mode table is empty");
    m_mode = m_settings.default_mode;
    if (!m_modes.contains(m_mode)) {
        m_mode = m_modes.contains("solo") ? "solo" : m_modes.all().begin()->first;
        royale::log::warn("[match] unknown default mode '{}', using '{}'", m_settings.default_mode, m_mode);
    }
    m_phase_started = m_clock.now();
    royale::metrics::runtime().current_phase.store(static_cast<uint64_t>(m_phase), std::memory_order_relaxed);
}

MatchPhase MatchCoordinator::phase() const
{
    std::scoped_lock lk{m_mutex};
    return m_phase;
}

std::string MatchCoordinator::mode() const
{
    std::scoped_lock lk{m_mutex};
    return m_mode;
}

ModeConfig MatchCoordinator::mode_config() const
{
    std::scoped_lock lk{m_mutex};
    return m_modes.find(m_mode).value_or(ModeConfig{m_mode, 1, 0});
}

TeamSet MatchCoordinator::teams() const
{
    std::scoped_lock lk{m_mutex};
    return m_teams.teams();
}

ZoneState MatchCoordinator::zone_state() const
{
    return m_zone.state();
}

bool MatchCoordinator::request_mode_change(const std::string &mode)
{
    std::scoped_lock lk{m_mutex};
    if (m_phase != MatchPhase::Lobby) {
        royale::metrics::runtime().mode_change_rejected.fetch_add(1, std::memory_order_relaxed);
        royale::log::debug("[match] mode change to '{}' rejected in phase {}", mode, phase_name(m_phase));
        return false;
    }
    if (!m_modes.contains(mode)) {
        royale::metrics::runtime().mode_change_rejected.fetch_add(1, std::memory_order_relaxed);
        royale::log::warn("[match] unknown mode '{}'", mode);
        return false;
    }
    if (m_mode != mode)
        royale::log::info("[match] mode changed: {} -> {}", m_mode, mode);
    m_mode = mode;
    return true;
}

bool MatchCoordinator::eliminate_player(PlayerId victim, std::optional<PlayerId> killer)
{
    std::scoped_lock lk{m_mutex};
    return eliminate_locked(victim, killer);
}

bool MatchCoordinator::eliminate_locked(PlayerId victim, std::optional<PlayerId> killer)
{
    if (!m_roster.mark_eliminated(victim))
        return false;
    auto &rt = royale::metrics::runtime();
    rt.eliminations.fetch_add(1, std::memory_order_relaxed);
    royale::metrics::gauge_dec(rt.alive_players);
    if (killer)
        royale::log::info("[match] player {} eliminated by {}", victim, *killer);
    else
        royale::log::info("[match] player {} eliminated", victim);
    auto msg = events::player_eliminated(victim, killer);
    if (!m_pending.empty()) {
        m_pending.push_back(std::move(msg));
    } else {
        try {
            m_channel.publish(msg);
        } catch (const std::exception &ex) {
            rt.broadcast_failures.fetch_add(1, std::memory_order_relaxed);
            royale::log::warn("[match] PlayerEliminated for {} deferred: {}", victim, ex.what());
            m_pending.push_back(std::move(msg));
        }
    }

    auto cfg = m_modes.find(m_mode);
    if (cfg && !cfg->is_solo()) {
        if (const Team *team = m_teams.team_of(victim); team && !team->has_alive_member())
            royale::log::info("[teams] team {} eliminated", team->key);
    }
    return true;
}

void MatchCoordinator::remove_player(PlayerId id)
{
    std::scoped_lock lk{m_mutex};
    eliminate_locked(id, std::nullopt);
    if (!m_roster.remove_player(id))
        royale::log::debug("[match] remove of unknown player {}", id);
}

bool MatchCoordinator::flush_pending_locked()
{
    while (!m_pending.empty()) {
        try {
            m_channel.publish(m_pending.front());
        } catch (const std::exception &ex) {
            royale::metrics::runtime().broadcast_failures.fetch_add(1, std::memory_order_relaxed);
            royale::log::warn("[match] {} pending event(s) still undelivered: {}", m_pending.size(), ex.what());
            return false;
        }
        m_pending.pop_front();
    }
    return true;
}

void MatchCoordinator::tick()
{
    auto t0 = std::chrono::steady_clock::now();
    {
        std::scoped_lock lk{m_mutex};
        // Phase events never overtake a queued elimination.
        try {
            if (flush_pending_locked())
                run_phase_locked(m_clock.now());
        } catch (const std::exception &ex) {
            // Entry actions are only marked done after they succeed, so the same
            // phase handler runs again next tick.
            royale::metrics::runtime().handler_failures.fetch_add(1, std::memory_order_relaxed);
            royale::log::error("[match] {} handler failed: {}", phase_name(m_phase), ex.what());
        }
    }
    auto dt = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - t0);
    royale::metrics::add_tick_duration(static_cast<uint64_t>(dt.count()));
}

void MatchCoordinator::run(ITicker &ticker)
{
    royale::log::info(
        "[match] driver start tick={}ms mode={} min_players={}", m_settings.tick_interval_ms, mode(), m_settings.min_players);
    ticker.every("match-driver", std::chrono::milliseconds(m_settings.tick_interval_ms), [this] {
        if (m_shutdown.load(std::memory_order_acquire))
            return false;
        tick();
        return true;
    });
}

void MatchCoordinator::shutdown()
{
    m_shutdown.store(true, std::memory_order_release);
    m_zone.stop();
    royale::log::info("[match] shutdown in phase {}", phase_name(phase()));
}

double MatchCoordinator::phase_elapsed(IClock::time_point now) const
{
    return seconds_between(m_phase_started, now);
}

void MatchCoordinator::transition_locked(MatchPhase next, IClock::time_point now)
{
    MatchPhase old = m_phase;
    m_phase = next;
    m_phase_started = now;
    m_entry_done = false;
    m_lobby_ready_since.reset();
    m_last_countdown = -1;
    auto &rt = royale::metrics::runtime();
    rt.phase_transitions.fetch_add(1, std::memory_order_relaxed);
    rt.current_phase.store(static_cast<uint64_t>(next), std::memory_order_relaxed);
    royale::log::info("[match] State changed: {} -> {}", phase_name(old), phase_name(next));
    m_channel.publish(events::phase_changed(next, old));
}

void MatchCoordinator::run_phase_locked(IClock::time_point now)
{
    switch (m_phase) {
        case MatchPhase::Lobby:
            handle_lobby(now);
            break;
        case MatchPhase::Starting:
            handle_starting(now);
            break;
        case MatchPhase::Dropping:
            handle_dropping(now);
            break;
        case MatchPhase::Match:
            handle_match(now);
            break;
        case MatchPhase::Ending:
            handle_ending(now);
            break;
        case MatchPhase::Cleanup:
            handle_cleanup(now);
            break;
    }
}

void MatchCoordinator::handle_lobby(IClock::time_point now)
{
    const auto current = static_cast<uint32_t>(m_roster.size());
    const bool can_start = current >= m_settings.min_players;
    double remaining = m_settings.lobby_wait_seconds;
    if (!can_start) {
        if (m_lobby_ready_since)
            royale::log::info("[match] lobby countdown reset ({}/{} players)", current, m_settings.min_players);
        m_lobby_ready_since.reset();
    } else {
        if (!m_lobby_ready_since) {
            m_lobby_ready_since = now;
            royale::log::info("[match] lobby countdown started ({}s)", m_settings.lobby_wait_seconds);
        }
        remaining = std::max(0.0, m_settings.lobby_wait_seconds - seconds_between(*m_lobby_ready_since, now));
    }
    m_channel.publish(events::lobby_status(current, m_settings.min_players, ceil_seconds(remaining), can_start));
    if (can_start && remaining <= 0.0)
        transition_locked(MatchPhase::Starting, now);
}

void MatchCoordinator::handle_starting(IClock::time_point now)
{
    if (!m_entry_done) {
        auto cfg = m_modes.find(m_mode);
        m_teams.form(cfg.value_or(ModeConfig{m_mode, 1, 0}), m_roster.members());
        m_entry_done = true;
    }
    const double elapsed = phase_elapsed(now);
    if (elapsed >= static_cast<double>(m_settings.countdown_seconds)) {
        m_roster.revive_all();
        royale::metrics::runtime().alive_players.store(m_roster.alive_count(), std::memory_order_relaxed);
        transition_locked(MatchPhase::Dropping, now);
        return;
    }
    const auto value = static_cast<int64_t>(m_settings.countdown_seconds) - static_cast<int64_t>(std::floor(elapsed));
    if (value >= 1 && value != m_last_countdown) {
        m_channel.publish(events::countdown(static_cast<uint32_t>(value)));
        m_last_countdown = value;
    }
}

void MatchCoordinator::handle_dropping(IClock::time_point now)
{
    if (!m_entry_done) {
        call_collaborator(m_collab.loot, "loot spawn", [](ILootController &l) { l.spawn_all_loot(); });
        auto points = compute_drop_positions(m_collab.spawns, m_settings);
        auto members = m_roster.members();
        for (size_t i = 0; i < members.size(); ++i) {
            const Vec3 &pos = points[i % points.size()];
            m_roster.set_position(members[i]->id, pos);
            m_channel.publish(events::drop_assigned(members[i]->id, pos));
        }
        royale::log::info("[match] dropped {} players over {} points", members.size(), points.size());
        m_entry_done = true;
    }
    if (phase_elapsed(now) >= m_settings.drop_settle_seconds) {
        royale::metrics::runtime().matches_started.fetch_add(1, std::memory_order_relaxed);
        transition_locked(MatchPhase::Match, now);
    }
}

void MatchCoordinator::handle_match(IClock::time_point now)
{
    if (!m_entry_done) {
        m_zone.start();
        call_collaborator(m_collab.dinosaurs, "dinosaur spawning", [](IDinosaurSpawnController &d) { d.start_spawning(); });
        royale::log::info("[match] started mode={} players={} teams={}", m_mode, m_roster.alive_count(), m_teams.teams().size());
        m_entry_done = true;
    }

    auto alive = m_roster.alive_map();
    auto counts = count_alive(alive, m_teams.teams());
    royale::metrics::runtime().alive_players.store(counts.players, std::memory_order_relaxed);

    if (!m_settings.skip_victory) {
        auto cfg = m_modes.find(m_mode).value_or(ModeConfig{m_mode, 1, 0});
        if (auto winner = evaluate_victory(cfg, counts, m_teams.teams(), alive)) {
            royale::log::info("[match] winner: {}", winner->describe());
            m_channel.publish(events::victory(*winner));
            royale::metrics::runtime().matches_won.fetch_add(1, std::memory_order_relaxed);
            transition_locked(MatchPhase::Ending, now);
            return;
        }
    }
    if (phase_elapsed(now) >= m_settings.match_max_seconds) {
        royale::log::info("[match] time limit reached ({}s), no winner", m_settings.match_max_seconds);
        royale::metrics::runtime().matches_timed_out.fetch_add(1, std::memory_order_relaxed);
        transition_locked(MatchPhase::Ending, now);
        return;
    }
    m_channel.publish(events::alive_count(counts.players, counts.teams));
}

void MatchCoordinator::handle_ending(IClock::time_point now)
{
    if (!m_entry_done) {
        m_zone.stop();
        call_collaborator(m_collab.dinosaurs, "dinosaur stop", [](IDinosaurSpawnController &d) { d.stop_spawning(); });
        m_entry_done = true;
    }
    if (phase_elapsed(now) >= m_settings.results_seconds)
        transition_locked(MatchPhase::Cleanup, now);
}

void MatchCoordinator::handle_cleanup(IClock::time_point now)
{
    if (!m_entry_done) {
        call_collaborator(m_collab.dinosaurs, "dinosaur despawn", [](IDinosaurSpawnController &d) { d.despawn_all(); });
        call_collaborator(m_collab.loot, "loot reset", [](ILootController &l) { l.reset_loot(); });
        Vec3 spawn = compute_lobby_spawn(m_collab.spawns, m_settings);
        for (auto &p : m_roster.members())
            m_roster.set_position(p->id, spawn);
        m_channel.publish(events::lobby_return(spawn));
        m_roster.clear_alive();
        m_teams.clear();
        m_zone.reset();
        royale::metrics::runtime().alive_players.store(0, std::memory_order_relaxed);
        m_entry_done = true;
    }
    if (phase_elapsed(now) >= m_settings.intermission_seconds)
        transition_locked(MatchPhase::Lobby, now);
}

} // namespace royale::game
