// SPDX-License-Identifier: Apache-2.0
#include "server/net/metrics_http.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <chrono>
#include <cstring>
#include <span>
#include <sstream>
#include <string>

namespace royale::net {

namespace {
void counter(std::ostringstream &oss, const char *name, const std::atomic<uint64_t> &v)
{
    oss << "# TYPE royale_" << name << " counter\n";
    oss << "royale_" << name << " " << v.load(std::memory_order_relaxed) << "\n";
}

void gauge(std::ostringstream &oss, const char *name, uint64_t v)
{
    oss << "# TYPE royale_" << name << " gauge\n";
    oss << "royale_" << name << " " << v << "\n";
}
} // namespace

std::string build_metrics_body()
{
    std::ostringstream oss;
    auto &rt = royale::metrics::runtime();
    uint64_t samples = rt.tick_samples.load();
    uint64_t avg_ns = samples ? rt.tick_duration_ns_accum.load() / samples : 0;

    counter(oss, "phase_transitions_total", rt.phase_transitions);
    counter(oss, "matches_started_total", rt.matches_started);
    counter(oss, "matches_won_total", rt.matches_won);
    counter(oss, "matches_timed_out_total", rt.matches_timed_out);
    counter(oss, "eliminations_total", rt.eliminations);
    counter(oss, "handler_failures_total", rt.handler_failures);
    counter(oss, "collaborator_failures_total", rt.collaborator_failures);
    counter(oss, "mode_change_rejected_total", rt.mode_change_rejected);
    counter(oss, "zone_steps_total", rt.zone_steps);
    counter(oss, "zone_damage_events_total", rt.zone_damage_events);
    oss << "# TYPE royale_zone_damage_total counter\n";
    oss << "royale_zone_damage_total " << static_cast<double>(rt.zone_damage_milli_total.load()) / 1000.0 << "\n";
    counter(oss, "broadcasts_published_total", rt.broadcasts_published);
    counter(oss, "direct_messages_total", rt.direct_messages);
    counter(oss, "broadcast_failures_total", rt.broadcast_failures);
    counter(oss, "frames_rejected_total", rt.frames_rejected);

    gauge(oss, "connected_players", rt.connected_players.load());
    gauge(oss, "alive_players", rt.alive_players.load());
    gauge(oss, "current_phase", rt.current_phase.load());
    gauge(oss, "zone_phase", rt.zone_phase.load());
    gauge(oss, "avg_tick_ns", avg_ns);
    gauge(oss, "p99_tick_ns", royale::metrics::approx_tick_p99());

    // Driver tick duration histogram (nanoseconds), geometric x2 buckets.
    oss << "# TYPE royale_tick_duration_ns histogram\n";
    uint64_t cumulative = 0;
    for (int i = 0; i < royale::metrics::RuntimeCounters::TICK_BUCKETS; ++i) {
        cumulative += rt.tick_hist[i].load();
        uint64_t le = royale::metrics::RuntimeCounters::TICK_BUCKET_BASE_NS << i;
        oss << "royale_tick_duration_ns_bucket{le=\"" << le << "\"} " << cumulative << "\n";
    }
    oss << "royale_tick_duration_ns_bucket{le=\"+Inf\"} " << cumulative << "\n";
    oss << "royale_tick_duration_ns_sum " << rt.tick_duration_ns_accum.load() << "\n";
    oss << "royale_tick_duration_ns_count " << samples << "\n";
    return oss.str();
}

static coro::task<void> handle_client(std::shared_ptr<coro::io_scheduler> scheduler, coro::net::tcp::client client)
{
    co_await scheduler->schedule();
    // Very small timeout; one-shot request
    auto pol = co_await client.poll(coro::poll_op::read, std::chrono::milliseconds(200));
    if (pol != coro::poll_status::event) {
        co_return;
    }
    std::string buf(1024, '\0');
    auto [rs, span] = client.recv(buf);
    if (rs != coro::net::recv_status::ok && rs != coro::net::recv_status::would_block)
        co_return;
    // naive method/path parse
    std::string_view req(span.data(), span.size());
    bool metrics = req.rfind("GET /metrics", 0) == 0;
    std::string body = metrics ? build_metrics_body() : std::string("not found\n");
    std::ostringstream resp;
    resp << "HTTP/1.1 " << (metrics ? "200 OK" : "404 Not Found") << "\r\n";
    resp << "Content-Type: text/plain; version=0.0.4\r\n";
    resp << "Content-Length: " << body.size() << "\r\n";
    resp << "Connection: close\r\n\r\n";
    resp << body;
    auto s = resp.str();
    std::span<const char> out{s.data(), s.size()};
    while (!out.empty()) {
        co_await client.poll(coro::poll_op::write);
        auto [st, rest] = client.send(out);
        if (st == coro::net::send_status::ok || st == coro::net::send_status::would_block) {
            out = rest;
            continue;
        }
        break;
    }
    co_return;
}

coro::task<void> run_metrics_endpoint(
    std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port, const std::atomic<bool> &stop)
{
    co_await scheduler->schedule();
    royale::log::info("[metrics] HTTP endpoint on port {}", port);
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    while (!stop.load(std::memory_order_acquire)) {
        auto st = co_await server.poll(std::chrono::milliseconds(250));
        if (st == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid()) {
                scheduler->spawn(handle_client(scheduler, std::move(client)));
            }
        } else if (st == coro::poll_status::error || st == coro::poll_status::closed) {
            royale::log::error("[metrics] server poll error/closed");
            co_return;
        }
    }
}

} // namespace royale::net
