// SPDX-License-Identifier: Apache-2.0
#include "server/game/zone_controller.hpp"

#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/game/events.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <stdexcept>

namespace royale::game {

namespace {
IClock::time_point::duration to_duration(float seconds)
{
    return std::chrono::duration_cast<IClock::time_point::duration>(std::chrono::duration<double>(seconds));
}

int64_t whole_seconds_left(IClock::time_point now, IClock::time_point end)
{
    double left = seconds_between(now, end);
    return left <= 0.0 ? 0 : static_cast<int64_t>(std::ceil(left));
}
} // namespace

ZoneController::ZoneController(ZoneSettings settings, Deps deps, uint32_t seed)
    : m_settings(std::move(settings))
    , m_channel(deps.channel)
    , m_clock(deps.clock)
    , m_ticker(deps.ticker)
    , m_players(deps.players)
    , m_damage(deps.damage)
    , m_map(deps.map)
    , m_rng(seed)
{
    if (auto err = validate_zone_settings(m_settings))
        throw std::invalid_argument(*err);
    m_state.current_radius = m_settings.initial_radius;
    m_state.target_radius = m_settings.initial_radius;
}

Vec3 ZoneController::query_map_center()
{
    if (!m_map)
        return Vec3{};
    try {
        return m_map->map_center();
    } catch (const std::exception &ex) {
        royale::metrics::runtime().collaborator_failures.fetch_add(1, std::memory_order_relaxed);
        royale::log::warn("[zone] map center unavailable: {}", ex.what());
        return Vec3{};
    }
}

bool ZoneController::start()
{
    Vec3 center = query_map_center();
    uint64_t gen;
    std::vector<royale::ServerMessage> out;
    {
        std::scoped_lock lk{m_mutex};
        if (m_state.active) {
            royale::log::warn("[zone] start ignored: already active (phase {})", m_state.phase);
            return false;
        }
        gen = ++m_generation;
        m_state = ZoneState{};
        m_state.active = true;
        m_state.current_radius = m_settings.initial_radius;
        m_state.target_radius = m_settings.initial_radius;
        m_state.current_center = center;
        m_state.target_center = center;
        m_phase_index = 0;
        auto now = m_clock.now();
        if (m_settings.grace_period_seconds > 0.f) {
            m_stage = Stage::grace;
            m_state.in_grace = true;
            m_state.grace_remaining = m_settings.grace_period_seconds;
            m_stage_start = now;
            m_stage_end = now + to_duration(m_settings.grace_period_seconds);
            m_last_warned = whole_seconds_left(now, m_stage_end);
            out.push_back(events::zone_warning(static_cast<uint32_t>(m_last_warned), 0));
        } else {
            out.push_back(events::zone_update(0, m_state.current_radius, m_state.current_center, 0.f));
            begin_phase_locked(0, now, out);
        }
    }
    royale::log::info(
        "[zone] started radius={} center=({}, {}) grace={}s phases={}",
        m_settings.initial_radius,
        center.x,
        center.z,
        m_settings.grace_period_seconds,
        m_settings.phases.size());

    if (m_ticker) {
        auto progress_ms = std::chrono::milliseconds(std::max<uint32_t>(1, 1000 / m_settings.interpolation_hz));
        auto damage_ms = std::chrono::milliseconds(
            std::max<int64_t>(1, static_cast<int64_t>(m_settings.damage_interval_seconds * 1000.f)));
        m_ticker->every("zone-progress", progress_ms, [this, gen] { return progress_step(gen); });
        m_ticker->every("zone-damage", damage_ms, [this, gen] { return damage_step(gen); });
    }
    publish_all(out);
    return true;
}

void ZoneController::stop()
{
    std::scoped_lock lk{m_mutex};
    if (!m_state.active)
        return;
    m_state.active = false;
    m_state.in_grace = false;
    m_stage = Stage::idle;
    ++m_generation;
    royale::log::info("[zone] stopped at phase {} radius={}", m_state.phase, m_state.current_radius);
}

void ZoneController::reset()
{
    Vec3 center = query_map_center();
    std::scoped_lock lk{m_mutex};
    ++m_generation;
    m_state = ZoneState{};
    m_state.current_radius = m_settings.initial_radius;
    m_state.target_radius = m_settings.initial_radius;
    m_state.current_center = center;
    m_state.target_center = center;
    m_stage = Stage::idle;
    m_phase_index = 0;
    m_last_warned = -1;
    royale::metrics::runtime().zone_phase.store(0, std::memory_order_relaxed);
    royale::log::debug("[zone] reset");
}

ZoneState ZoneController::state() const
{
    std::scoped_lock lk{m_mutex};
    return m_state;
}

float ZoneController::distance_to_zone(const Vec3 &pos) const
{
    float radius;
    Vec3 center;
    {
        std::scoped_lock lk{m_mutex};
        radius = m_state.current_radius;
        center = m_state.current_center;
    }
    return radius - planar_distance(pos, center);
}

bool ZoneController::is_inside_zone(const Vec3 &pos) const
{
    return distance_to_zone(pos) >= 0.f;
}

bool ZoneController::is_generation(uint64_t generation) const
{
    std::scoped_lock lk{m_mutex};
    return m_generation == generation && m_state.active;
}

bool ZoneController::advance()
{
    uint64_t gen;
    {
        std::scoped_lock lk{m_mutex};
        gen = m_generation;
    }
    return progress_step(gen);
}

bool ZoneController::apply_damage_tick()
{
    uint64_t gen;
    {
        std::scoped_lock lk{m_mutex};
        gen = m_generation;
    }
    return damage_step(gen);
}

void ZoneController::begin_phase_locked(size_t index, IClock::time_point at, std::vector<royale::ServerMessage> &out)
{
    const auto &cfg = m_settings.phases[index];
    m_phase_index = index;
    m_state.phase = static_cast<uint32_t>(index + 1);
    m_state.damage = cfg.damage;
    m_stage = Stage::delay;
    m_stage_start = at;
    m_stage_end = at + to_duration(cfg.delay_sec);
    m_last_warned = static_cast<int64_t>(std::ceil(cfg.delay_sec));
    out.push_back(events::zone_warning(static_cast<uint32_t>(m_last_warned), m_state.phase));
    royale::metrics::runtime().zone_phase.store(m_state.phase, std::memory_order_relaxed);
    royale::log::info("[zone] phase {} in {}s (damage={})", m_state.phase, cfg.delay_sec, cfg.damage);
}

void ZoneController::begin_shrink_locked(IClock::time_point at, std::vector<royale::ServerMessage> &out)
{
    const auto &cfg = m_settings.phases[m_phase_index];
    m_shrink_from_radius = m_state.current_radius;
    m_shrink_from_center = m_state.current_center;

    std::uniform_real_distribution<float> dist(-1.f, 1.f);
    float max_offset = cfg.center_offset * m_state.current_radius;
    Vec3 target = m_state.current_center;
    target.x += dist(m_rng) * max_offset;
    target.z += dist(m_rng) * max_offset;

    m_state.target_radius = std::min(cfg.end_radius, m_state.current_radius);
    m_state.target_center = target;
    m_stage = Stage::shrinking;
    m_stage_start = at;
    m_stage_end = at + to_duration(cfg.shrink_sec);
    out.push_back(events::zone_update(m_state.phase, m_state.target_radius, target, m_state.damage));
    royale::log::info(
        "[zone] phase {} shrinking {} -> {} over {}s center=({}, {})",
        m_state.phase,
        m_shrink_from_radius,
        m_state.target_radius,
        cfg.shrink_sec,
        target.x,
        target.z);
}

void ZoneController::finish_shrink_locked(IClock::time_point at, std::vector<royale::ServerMessage> &out)
{
    m_state.current_radius = m_state.target_radius;
    m_state.current_center = m_state.target_center;
    if (m_phase_index + 1 < m_settings.phases.size()) {
        begin_phase_locked(m_phase_index + 1, at, out);
        return;
    }
    m_stage = Stage::complete;
    royale::log::info("[zone] final size reached radius={} damage={}", m_state.current_radius, m_state.damage);
}

bool ZoneController::progress_step(uint64_t generation)
{
    std::vector<royale::ServerMessage> out;
    bool keep = true;
    {
        std::scoped_lock lk{m_mutex};
        if (m_generation != generation || !m_state.active)
            return false;
        royale::metrics::runtime().zone_steps.fetch_add(1, std::memory_order_relaxed);
        auto now = m_clock.now();
        // A late step may cross several stage boundaries; each boundary is taken at its
        // scheduled time so later stages do not inherit the lateness.
        bool again = true;
        while (again) {
            again = false;
            switch (m_stage) {
                case Stage::grace: {
                    if (now >= m_stage_end) {
                        m_state.in_grace = false;
                        m_state.grace_remaining = 0.f;
                        out.push_back(events::zone_update(0, m_state.current_radius, m_state.current_center, 0.f));
                        royale::log::info("[zone] grace period over");
                        begin_phase_locked(0, m_stage_end, out);
                        again = true;
                        break;
                    }
                    m_state.grace_remaining = static_cast<float>(seconds_between(now, m_stage_end));
                    int64_t left = whole_seconds_left(now, m_stage_end);
                    if (left != m_last_warned && (left == 30 || left == 10 || left <= 5)) {
                        m_last_warned = left;
                        out.push_back(events::zone_warning(static_cast<uint32_t>(left), 0));
                    }
                    break;
                }
                case Stage::delay: {
                    if (now >= m_stage_end) {
                        begin_shrink_locked(m_stage_end, out);
                        again = true;
                        break;
                    }
                    int64_t left = whole_seconds_left(now, m_stage_end);
                    if (left != m_last_warned && static_cast<float>(left) <= m_settings.warning_seconds) {
                        m_last_warned = left;
                        out.push_back(events::zone_warning(static_cast<uint32_t>(left), m_state.phase));
                    }
                    break;
                }
                case Stage::shrinking: {
                    if (now >= m_stage_end) {
                        finish_shrink_locked(m_stage_end, out);
                        again = true;
                        break;
                    }
                    double total = seconds_between(m_stage_start, m_stage_end);
                    float alpha = static_cast<float>(std::clamp(seconds_between(m_stage_start, now) / total, 0.0, 1.0));
                    float r = lerp(m_shrink_from_radius, m_state.target_radius, alpha);
                    m_state.current_radius = std::min(m_state.current_radius, std::max(r, m_state.target_radius));
                    m_state.current_center = lerp(m_shrink_from_center, m_state.target_center, alpha);
                    ROYALE_LOG_EVERY_N(
                        trace, 20, "[zone] phase {} radius={} alpha={}", m_state.phase, m_state.current_radius, alpha);
                    break;
                }
                case Stage::complete:
                case Stage::idle:
                    keep = false;
                    break;
            }
        }
    }
    publish_all(out);
    return keep;
}

bool ZoneController::damage_step(uint64_t generation)
{
    float damage;
    float radius;
    Vec3 center;
    {
        std::scoped_lock lk{m_mutex};
        if (m_generation != generation || !m_state.active)
            return false;
        if (m_state.in_grace || m_state.damage <= 0.f)
            return true;
        damage = m_state.damage * m_settings.damage_scale;
        radius = m_state.current_radius;
        center = m_state.current_center;
    }
    if (damage <= 0.f)
        return true;
    if (!m_players || !m_damage) {
        ROYALE_LOG_EVERY_N(warn, 30, "[zone] damage skipped: no player source or damage sink");
        return true;
    }

    std::vector<PlayerSample> samples;
    try {
        samples = m_players->sample_players();
    } catch (const std::exception &ex) {
        royale::metrics::runtime().collaborator_failures.fetch_add(1, std::memory_order_relaxed);
        royale::log::warn("[zone] player sampling failed: {}", ex.what());
        return true;
    }

    for (auto &s : samples) {
        if (!s.connected || !s.alive || !s.position)
            continue;
        if (planar_distance(*s.position, center) <= radius)
            continue;
        // Stop between samples ends the tick early.
        if (!is_generation(generation))
            return false;
        try {
            m_damage->apply_damage(s.id, damage);
        } catch (const std::exception &ex) {
            royale::metrics::runtime().collaborator_failures.fetch_add(1, std::memory_order_relaxed);
            royale::log::warn("[zone] damage to player {} failed: {}", s.id, ex.what());
            continue;
        }
        royale::metrics::add_zone_damage(damage);
        m_channel.send_to(s.id, events::zone_damage(s.id, damage));
    }
    return true;
}

// Failed publishes are logged and counted; later updates supersede a lost event.
void ZoneController::publish_all(const std::vector<royale::ServerMessage> &out)
{
    for (auto &msg : out) {
        try {
            m_channel.publish(msg);
        } catch (const std::exception &ex) {
            royale::metrics::runtime().broadcast_failures.fetch_add(1, std::memory_order_relaxed);
            royale::log::warn("[zone] {} not delivered: {}", events::name(msg), ex.what());
        }
    }
}

} // namespace royale::game
