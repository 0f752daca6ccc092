// SPDX-License-Identifier: Apache-2.0
#include "server/game/roster.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <algorithm>

namespace royale::game {

std::shared_ptr<PlayerRecord> Roster::find_locked(PlayerId id)
{
    auto it = std::find_if(m_players.begin(), m_players.end(), [&](auto &p) { return p->id == id; });
    return it == m_players.end() ? nullptr : *it;
}

PlayerId Roster::add_player(std::string name)
{
    std::scoped_lock lk{m_mutex};
    PlayerId id = ++m_last_id;
    if (name.empty())
        name = "player_" + std::to_string(id);
    auto rec = std::make_shared<PlayerRecord>(id, std::move(name));
    royale::log::info("[roster] join id={} name={} count={}", id, rec->name, m_players.size() + 1);
    m_players.push_back(std::move(rec));
    royale::metrics::runtime().connected_players.fetch_add(1, std::memory_order_relaxed);
    return id;
}

bool Roster::remove_player(PlayerId id)
{
    std::scoped_lock lk{m_mutex};
    auto it = std::find_if(m_players.begin(), m_players.end(), [&](auto &p) { return p->id == id; });
    if (it == m_players.end())
        return false;
    royale::log::info("[roster] leave id={} name={}", id, (*it)->name);
    m_players.erase(it);
    royale::metrics::gauge_dec(royale::metrics::runtime().connected_players);
    return true;
}

bool Roster::contains(PlayerId id)
{
    std::scoped_lock lk{m_mutex};
    return find_locked(id) != nullptr;
}

size_t Roster::size()
{
    std::scoped_lock lk{m_mutex};
    return m_players.size();
}

std::vector<std::shared_ptr<PlayerRecord>> Roster::members()
{
    std::scoped_lock lk{m_mutex};
    return m_players;
}

std::vector<PlayerView> Roster::snapshot()
{
    std::scoped_lock lk{m_mutex};
    std::vector<PlayerView> out;
    out.reserve(m_players.size());
    for (auto &p : m_players)
        out.push_back(PlayerView{p->id, p->name, p->alive.load(std::memory_order_relaxed), p->health, p->position});
    return out;
}

std::unordered_map<PlayerId, bool> Roster::alive_map()
{
    std::scoped_lock lk{m_mutex};
    std::unordered_map<PlayerId, bool> out;
    out.reserve(m_players.size());
    for (auto &p : m_players)
        out.emplace(p->id, p->alive.load(std::memory_order_relaxed));
    return out;
}

uint32_t Roster::alive_count()
{
    std::scoped_lock lk{m_mutex};
    uint32_t n = 0;
    for (auto &p : m_players)
        if (p->alive.load(std::memory_order_relaxed))
            ++n;
    return n;
}

bool Roster::mark_eliminated(PlayerId id)
{
    std::scoped_lock lk{m_mutex};
    auto rec = find_locked(id);
    if (!rec)
        return false;
    return rec->alive.exchange(false, std::memory_order_acq_rel);
}

void Roster::revive_all()
{
    std::scoped_lock lk{m_mutex};
    for (auto &p : m_players) {
        p->alive.store(true, std::memory_order_release);
        p->health = m_max_health;
    }
}

void Roster::clear_alive()
{
    std::scoped_lock lk{m_mutex};
    for (auto &p : m_players)
        p->alive.store(false, std::memory_order_release);
}

void Roster::set_position(PlayerId id, std::optional<Vec3> position)
{
    std::scoped_lock lk{m_mutex};
    if (auto rec = find_locked(id))
        rec->position = position;
}

std::optional<float> Roster::apply_damage(PlayerId id, float amount)
{
    std::scoped_lock lk{m_mutex};
    auto rec = find_locked(id);
    if (!rec || !rec->alive.load(std::memory_order_acquire))
        return std::nullopt;
    rec->health = std::max(0.f, rec->health - amount);
    return rec->health;
}

std::vector<PlayerSample> Roster::sample_players()
{
    std::scoped_lock lk{m_mutex};
    std::vector<PlayerSample> out;
    out.reserve(m_players.size());
    for (auto &p : m_players)
        out.push_back(PlayerSample{p->id, p->position, p->alive.load(std::memory_order_relaxed), true});
    return out;
}

} // namespace royale::game
