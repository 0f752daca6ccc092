// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "royale.pb.h"
#include "server/game/types.hpp"

#include <coro/net/tcp/client.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace royale::net {

struct Session
{
    std::string connection_id;
    game::PlayerId player_id{0}; // 0 until the JoinRequest is accepted
    std::string name;
    // Read by the connection loop without the manager lock.
    std::atomic<bool> joined{false};
    std::atomic<bool> closed{false}; // set by disconnect_session; the connection loop exits on its next pass
    std::chrono::steady_clock::time_point last_heartbeat{}; // guarded by the SessionManager mutex

    std::unique_ptr<coro::net::tcp::client> client; // nullptr for detached sessions
    std::vector<royale::ServerMessage> outgoing; // pending outbound messages

    Session(std::string cid, coro::net::tcp::client c)
        : connection_id(std::move(cid)), client(std::make_unique<coro::net::tcp::client>(std::move(c)))
    {}

    explicit Session(std::string cid) : connection_id(std::move(cid)) {} // detached (no socket)
};

// Snapshot taken under the manager lock by stale_sessions().
struct StaleSession
{
    std::shared_ptr<Session> session;
    game::PlayerId player_id{0};
    std::chrono::seconds idle{0};
};

// Connected clients. Messages are queued per session and flushed by each connection loop.
class SessionManager
{
public:
    using disconnect_fn = std::function<void(game::PlayerId)>;

    std::shared_ptr<Session> add_connection(coro::net::tcp::client client);
    // Session without a socket: messages queue up until drained by the owner.
    std::shared_ptr<Session> add_detached();

    void bind_player(const std::shared_ptr<Session> &s, game::PlayerId id, std::string name);
    std::shared_ptr<Session> find_by_player(game::PlayerId id);

    void push_message(const std::shared_ptr<Session> &s, const royale::ServerMessage &msg);
    // Queues msg on every joined session; returns the number of recipients.
    size_t broadcast(const royale::ServerMessage &msg);
    // Returns false when no joined session belongs to the player.
    bool send_to_player(game::PlayerId id, const royale::ServerMessage &msg);
    std::vector<royale::ServerMessage> drain_messages(const std::shared_ptr<Session> &s);

    void update_heartbeat(const std::shared_ptr<Session> &s);
    std::vector<std::shared_ptr<Session>> snapshot_all_sessions();
    // Open sessions whose last heartbeat is more than `timeout` before `now`.
    std::vector<StaleSession> stale_sessions(std::chrono::steady_clock::time_point now, std::chrono::seconds timeout);
    // Disconnects every open session; used at shutdown.
    void disconnect_all();
    size_t joined_count();

    // Idempotent. The disconnect handler runs (outside the lock) for joined sessions only.
    void disconnect_session(const std::shared_ptr<Session> &s);
    void set_disconnect_handler(disconnect_fn fn);

private:
    std::mutex m_mutex;
    uint64_t m_connection_counter{0};
    std::unordered_map<std::string, std::shared_ptr<Session>> m_by_connection;
    std::unordered_map<game::PlayerId, std::shared_ptr<Session>> m_by_player; // joined only
    disconnect_fn m_on_disconnect;
};

} // namespace royale::net
