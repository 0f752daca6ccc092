// SPDX-License-Identifier: Apache-2.0
#include "common/clock.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/config/server_config.hpp"
#include "server/game/map_provider.hpp"
#include "server/game/match_coordinator.hpp"
#include "server/game/player_health.hpp"
#include "server/game/roster.hpp"
#include "server/game/zone_controller.hpp"
#include "server/net/listener.hpp"
#include "server/net/metrics_http.hpp"
#include "server/net/session_broadcast.hpp"
#include "server/net/session_manager.hpp"
#include "server/runtime/coro_ticker.hpp"

#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <random>
#include <sstream>
#include <thread>

#ifndef ROYALE_VERSION
#define ROYALE_VERSION "dev"
#endif

namespace royale {
std::atomic_bool g_shutdown{false};
}

static coro::task<void> heartbeat_monitor(
    std::shared_ptr<coro::io_scheduler> sched, royale::net::SessionManager &sessions, uint32_t timeout_sec)
{
    co_await sched->schedule();
    using clock = std::chrono::steady_clock;
    while (!royale::g_shutdown.load()) {
        auto now = clock::now();
        for (auto &stale : sessions.stale_sessions(now, std::chrono::seconds(timeout_sec))) {
            royale::log::warn(
                "[hb] disconnect timeout {} player={} diff={}s",
                stale.session->connection_id,
                stale.player_id,
                stale.idle.count());
            sessions.disconnect_session(stale.session);
        }
        co_await sched->yield_for(std::chrono::seconds(1));
    }
    co_return;
}

static std::string runtime_json(const char *metric)
{
    auto &rt = royale::metrics::runtime();
    uint64_t samples = rt.tick_samples.load();
    uint64_t avg_ns = samples ? rt.tick_duration_ns_accum.load() / samples : 0;
    std::ostringstream j;
    j << "{\"metric\":\"" << metric << "\"";
    j << ",\"avg_tick_ns\":" << avg_ns;
    j << ",\"p99_tick_ns\":" << royale::metrics::approx_tick_p99();
    j << ",\"samples\":" << samples;
    j << ",\"phase\":" << rt.current_phase.load();
    j << ",\"zone_phase\":" << rt.zone_phase.load();
    j << ",\"connected_players\":" << rt.connected_players.load();
    j << ",\"alive_players\":" << rt.alive_players.load();
    j << ",\"matches_started\":" << rt.matches_started.load();
    j << ",\"matches_won\":" << rt.matches_won.load();
    j << ",\"matches_timed_out\":" << rt.matches_timed_out.load();
    j << ",\"eliminations\":" << rt.eliminations.load();
    j << ",\"handler_failures\":" << rt.handler_failures.load();
    j << "}";
    return j.str();
}

static void handle_signal(int)
{
    royale::g_shutdown.store(true);
}

int main(int argc, char **argv)
{
    std::string config_path = "config/server.yaml";
    bool cli_test_mode = false;
    bool cli_port_override = false;
    uint16_t port_override = 0;
    int duration_override_sec = 0; // 0 means run until signal
    // First non-flag argument is the config path.
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--test-mode") {
            cli_test_mode = true;
        } else if (a == "--port" && i + 1 < argc) {
            try {
                port_override = static_cast<uint16_t>(std::stoi(argv[++i]));
                cli_port_override = true;
            } catch (const std::exception &) {
                royale::log::warn("Invalid --port value '{}', ignoring", argv[i]);
            }
        } else if (a == "--duration" && i + 1 < argc) {
            try {
                duration_override_sec = std::stoi(argv[++i]);
            } catch (const std::exception &) {
                royale::log::warn("Invalid --duration value '{}', ignoring", argv[i]);
            }
        } else if (!a.empty() && a[0] != '-') {
            config_path = a;
        }
    }

    royale::config::ServerConfig cfg;
    try {
        cfg = royale::config::load_config(config_path);
        if (cli_test_mode && !cfg.test_mode)
            royale::config::apply_test_mode(cfg);
    } catch (const royale::config::ConfigError &ex) {
        royale::log::error("Failed to load config: {}", ex.what());
        royale::log::flush();
        return 1;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    // An explicit ROYALE_LOG_LEVEL in the environment wins over the config file.
    if (!cfg.log_level.empty() && std::getenv("ROYALE_LOG_LEVEL") == nullptr)
        royale::log::set_level(cfg.log_level);
    if (cfg.log_json)
        royale::log::set_json(true);
    royale::log::init();
    royale::log::info("royale server starting (version: {})", ROYALE_VERSION);
    if (cli_port_override) {
        cfg.listen_port = port_override;
        royale::log::info("CLI override: listen_port set to {}", cfg.listen_port);
    }
    if (duration_override_sec > 0)
        royale::log::info("CLI override: auto-shutdown after {} seconds", duration_override_sec);
    if (cfg.test_mode)
        royale::log::warn("Test mode: min_players=1, victory disabled, zone damage x{}", cfg.zone.damage_scale);
    royale::log::info("Listening on port: {}", cfg.listen_port);

    auto scheduler = coro::default_executor::io_executor();
    royale::runtime::CoroTicker ticker{scheduler};
    royale::SteadyClock clock;
    royale::game::Roster roster;
    royale::net::SessionManager sessions;
    royale::net::SessionBroadcastChannel channel{sessions};
    royale::game::ConfiguredMapProvider map{cfg.map};
    royale::game::PlayerHealthSink health{roster};
    uint32_t seed = cfg.rng_seed != 0 ? cfg.rng_seed : std::random_device{}();
    royale::game::ZoneController zone{
        cfg.zone, royale::game::ZoneController::Deps{channel, clock, &ticker, &roster, &health, &map}, seed};
    royale::game::MatchCoordinator match{
        cfg.match, cfg.modes, roster, zone, channel, clock, royale::game::MatchCollaborators{&map, nullptr, nullptr}};
    health.set_death_handler([&match](royale::game::PlayerId id) { match.eliminate_player(id); });
    sessions.set_disconnect_handler([&match](royale::game::PlayerId id) { match.remove_player(id); });

    match.run(ticker);
    scheduler->spawn(royale::net::run_listener(
        scheduler, cfg.listen_port, cfg.match.tick_interval_ms, royale::net::ListenerDeps{&sessions, &match, &roster, &royale::g_shutdown}));
    scheduler->spawn(heartbeat_monitor(scheduler, sessions, cfg.heartbeat_timeout_seconds));
    if (cfg.metrics_port != 0)
        scheduler->spawn(royale::net::run_metrics_endpoint(scheduler, cfg.metrics_port, royale::g_shutdown));

    auto run_start = std::chrono::steady_clock::now();
    auto last_metrics = run_start;
    while (!royale::g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        auto now = std::chrono::steady_clock::now();
        if (duration_override_sec > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - run_start).count();
            if (elapsed >= duration_override_sec) {
                royale::log::info("Duration reached ({}s >= {}s); initiating shutdown", elapsed, duration_override_sec);
                royale::g_shutdown.store(true);
            }
        }
        if (now - last_metrics >= std::chrono::seconds(60)) {
            last_metrics = now;
            royale::log::info("{}", runtime_json("runtime"));
        }
    }
    royale::log::info("Signal or duration reached, shutting down...");
    match.shutdown();
    sessions.disconnect_all();
    // Every task polls with a timeout and observes g_shutdown, a stopped zone or its closed
    // session within about a second; they must finish before the objects above go away.
    auto drain_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!scheduler->empty() && std::chrono::steady_clock::now() < drain_deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    if (!scheduler->empty())
        royale::log::warn("{} task(s) still pending at shutdown", scheduler->size());
    scheduler->shutdown();
    royale::log::info("{}", runtime_json("runtime_final"));
    royale::log::info("Shutdown complete.");
    royale::log::flush();
    return 0;
}
