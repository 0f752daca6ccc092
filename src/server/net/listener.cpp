// SPDX-License-Identifier: Apache-2.0
#include "server/net/listener.hpp"

#include "common/framing.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "royale.pb.h"
#include "server/game/events.hpp"

#include <coro/coro.hpp>
#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <algorithm>
#include <chrono>
#include <span>
#include <string>
#include <vector>

namespace royale::net {

static bool stopping(const ListenerDeps &deps)
{
    return deps.stop && deps.stop->load(std::memory_order_acquire);
}

static coro::task<void> connection_loop(
    std::shared_ptr<coro::io_scheduler> scheduler,
    std::shared_ptr<Session> session,
    uint32_t tick_interval_ms,
    ListenerDeps deps);

coro::task<void> run_listener(
    std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port, uint32_t tick_interval_ms, ListenerDeps deps)
{
    co_await scheduler->schedule();
    royale::log::info("[listener] TCP listener on port {}", port);
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    while (!stopping(deps)) {
        auto status = co_await server.poll(std::chrono::milliseconds(250));
        if (status == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid()) {
                auto session = deps.sessions->add_connection(std::move(client));
                scheduler->spawn(connection_loop(scheduler, session, tick_interval_ms, deps));
            }
        } else if (status == coro::poll_status::error || status == coro::poll_status::closed) {
            royale::log::error("[listener] poll error/closed, exiting listener loop");
            co_return;
        }
    }
    royale::log::info("[listener] stopped");
}

bool handle_client_message(const ListenerDeps &deps, const std::shared_ptr<Session> &session, const royale::ClientMessage &msg)
{
    switch (msg.payload_case()) {
        case royale::ClientMessage::kJoin: {
            if (!session->joined) {
                auto id = deps.roster->add_player(msg.join().name());
                deps.sessions->bind_player(session, id, msg.join().name());
                royale::log::info("[conn] {} joined as player {}", session->connection_id, id);
            }
            auto ack = game::events::join_ack(
                session->player_id, deps.match->phase(), deps.match->mode(), deps.match->zone_state());
            if (ack.join_ack().spectator())
                royale::log::info("[conn] player {} spectates until the next lobby", session->player_id);
            deps.sessions->push_message(session, ack);
            return true;
        }
        case royale::ClientMessage::kModeRequest: {
            if (!session->joined)
                return false;
            bool accepted = deps.match->request_mode_change(msg.mode_request().mode());
            deps.sessions->push_message(session, game::events::mode_ack(accepted, deps.match->mode()));
            return true;
        }
        case royale::ClientMessage::kPosition: {
            if (!session->joined)
                return false;
            const auto &p = msg.position();
            std::optional<game::Vec3> pos;
            if (p.has_body())
                pos = game::events::from_proto(p.position());
            deps.roster->set_position(session->player_id, pos);
            return true;
        }
        case royale::ClientMessage::kHeartbeat: {
            deps.sessions->update_heartbeat(session);
            auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now().time_since_epoch())
                              .count();
            royale::ServerMessage hb;
            auto *hbr = hb.mutable_heartbeat_resp();
            hbr->set_client_time_ms(msg.heartbeat().time_ms());
            hbr->set_server_time_ms(static_cast<uint64_t>(now_ms));
            deps.sessions->push_message(session, hb);
            return true;
        }
        case royale::ClientMessage::PAYLOAD_NOT_SET:
            break;
    }
    return false;
}

static coro::task<bool> send_all(coro::net::tcp::client &client, std::span<const char> data)
{
    std::span<const char> rest = data;
    while (!rest.empty()) {
        co_await client.poll(coro::poll_op::write);
        auto [s, remaining] = client.send(rest);
        if (s == coro::net::send_status::ok || s == coro::net::send_status::would_block) {
            rest = remaining;
            continue;
        }
        co_return false;
    }
    co_return true;
}

static coro::task<void> connection_loop(
    std::shared_ptr<coro::io_scheduler> scheduler,
    std::shared_ptr<Session> session,
    uint32_t tick_interval_ms,
    ListenerDeps deps)
{
    co_await scheduler->schedule();
    royale::log::info("[conn] new connection {}", session->connection_id);
    auto poll_timeout = std::chrono::milliseconds(std::max<uint32_t>(10, tick_interval_ms / 2));
    royale::netutil::FrameParseState fps;
    std::string scratch;
    while (!session->closed && !stopping(deps)) {
        auto pending = deps.sessions->drain_messages(session);
        if (!pending.empty()) {
            std::string batch;
            batch.reserve(pending.size() * 32);
            for (auto &msg : pending) {
                if (!msg.SerializeToString(&scratch)) {
                    royale::log::warn("[conn] failed to serialize {}", game::events::name(msg));
                    continue;
                }
                royale::netutil::append_frame(batch, scratch);
            }
            if (!co_await send_all(*session->client, std::span<const char>(batch.data(), batch.size()))) {
                royale::log::warn("[conn] send failed on {}", session->connection_id);
                break;
            }
        }
        auto pstat = co_await session->client->poll(coro::poll_op::read, poll_timeout);
        if (pstat == coro::poll_status::timeout)
            continue;
        if (pstat != coro::poll_status::event)
            break;
        std::string tmp(4096, '\0');
        auto [rstatus, span] = session->client->recv(tmp);
        if (rstatus == coro::net::recv_status::closed) {
            royale::log::info("[conn] {} closed by peer", session->connection_id);
            break;
        }
        if (rstatus != coro::net::recv_status::ok && rstatus != coro::net::recv_status::would_block) {
            royale::log::warn("[conn] {} recv error", session->connection_id);
            break;
        }
        if (rstatus == coro::net::recv_status::ok)
            fps.buffer.insert(fps.buffer.end(), span.begin(), span.end());

        bool drop = false;
        std::string payload;
        while (royale::netutil::try_extract(fps, payload)) {
            royale::ClientMessage cmsg;
            if (!cmsg.ParseFromString(payload) || !handle_client_message(deps, session, cmsg)) {
                royale::metrics::runtime().frames_rejected.fetch_add(1, std::memory_order_relaxed);
                royale::log::warn("[conn] {} sent an invalid message, dropping connection", session->connection_id);
                drop = true;
                break;
            }
        }
        if (fps.corrupt) {
            royale::metrics::runtime().frames_rejected.fetch_add(1, std::memory_order_relaxed);
            royale::log::warn("[conn] {} bad frame length, dropping connection", session->connection_id);
            drop = true;
        }
        if (drop)
            break;
    }
    deps.sessions->disconnect_session(session);
    co_return;
}

} // namespace royale::net
