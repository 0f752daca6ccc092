// SPDX-License-Identifier: Apache-2.0
#include "server/net/session_manager.hpp"

#include "common/logger.hpp"

namespace royale::net {

std::shared_ptr<Session> SessionManager::add_connection(coro::net::tcp::client client)
{
    std::scoped_lock lk{m_mutex};
    std::string cid = "conn_" + std::to_string(++m_connection_counter);
    auto s = std::make_shared<Session>(cid, std::move(client));
    s->last_heartbeat = std::chrono::steady_clock::now();
    m_by_connection.emplace(cid, s);
    return s;
}

std::shared_ptr<Session> SessionManager::add_detached()
{
    std::scoped_lock lk{m_mutex};
    std::string cid = "detached_" + std::to_string(++m_connection_counter);
    auto s = std::make_shared<Session>(cid);
    s->last_heartbeat = std::chrono::steady_clock::now();
    m_by_connection.emplace(cid, s);
    return s;
}

void SessionManager::bind_player(const std::shared_ptr<Session> &s, game::PlayerId id, std::string name)
{
    std::scoped_lock lk{m_mutex};
    s->player_id = id;
    s->name = std::move(name);
    s->joined = true;
    s->last_heartbeat = std::chrono::steady_clock::now();
    m_by_player[id] = s;
}

std::shared_ptr<Session> SessionManager::find_by_player(game::PlayerId id)
{
    std::scoped_lock lk{m_mutex};
    auto it = m_by_player.find(id);
    return it == m_by_player.end() ? nullptr : it->second;
}

void SessionManager::push_message(const std::shared_ptr<Session> &s, const royale::ServerMessage &msg)
{
    std::scoped_lock lk{m_mutex};
    if (s->closed)
        return;
    s->outgoing.push_back(msg);
}

size_t SessionManager::broadcast(const royale::ServerMessage &msg)
{
    std::scoped_lock lk{m_mutex};
    size_t n = 0;
    for (auto &[id, s] : m_by_player) {
        if (s->closed)
            continue;
        s->outgoing.push_back(msg);
        ++n;
    }
    return n;
}

bool SessionManager::send_to_player(game::PlayerId id, const royale::ServerMessage &msg)
{
    std::scoped_lock lk{m_mutex};
    auto it = m_by_player.find(id);
    if (it == m_by_player.end() || it->second->closed)
        return false;
    it->second->outgoing.push_back(msg);
    return true;
}

std::vector<royale::ServerMessage> SessionManager::drain_messages(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    std::vector<royale::ServerMessage> out;
    out.swap(s->outgoing);
    return out;
}

void SessionManager::update_heartbeat(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    s->last_heartbeat = std::chrono::steady_clock::now();
}

std::vector<std::shared_ptr<Session>> SessionManager::snapshot_all_sessions()
{
    std::scoped_lock lk{m_mutex};
    std::vector<std::shared_ptr<Session>> res;
    res.reserve(m_by_connection.size());
    for (auto &kv : m_by_connection)
        res.push_back(kv.second);
    return res;
}

std::vector<StaleSession> SessionManager::stale_sessions(std::chrono::steady_clock::time_point now, std::chrono::seconds timeout)
{
    std::scoped_lock lk{m_mutex};
    std::vector<StaleSession> res;
    for (auto &[cid, s] : m_by_connection) {
        if (s->closed || s->last_heartbeat.time_since_epoch().count() == 0)
            continue;
        auto idle = now - s->last_heartbeat;
        if (idle > timeout)
            res.push_back(StaleSession{s, s->player_id, std::chrono::duration_cast<std::chrono::seconds>(idle)});
    }
    return res;
}

void SessionManager::disconnect_all()
{
    for (auto &s : snapshot_all_sessions())
        disconnect_session(s);
}

size_t SessionManager::joined_count()
{
    std::scoped_lock lk{m_mutex};
    return m_by_player.size();
}

void SessionManager::disconnect_session(const std::shared_ptr<Session> &s)
{
    disconnect_fn handler;
    game::PlayerId player = 0;
    {
        std::scoped_lock lk{m_mutex};
        if (s->closed)
            return;
        s->closed = true;
        s->outgoing.clear();
        m_by_connection.erase(s->connection_id);
        if (s->joined) {
            m_by_player.erase(s->player_id);
            player = s->player_id;
            handler = m_on_disconnect;
        }
    }
    royale::log::info("[conn] disconnect {} player={}", s->connection_id, player);
    if (handler)
        handler(player);
}

void SessionManager::set_disconnect_handler(disconnect_fn fn)
{
    std::scoped_lock lk{m_mutex};
    m_on_disconnect = std::move(fn);
}

} // namespace royale::net
