// SPDX-License-Identifier: Apache-2.0
#include "server/config/server_config.hpp"

#include "common/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <cmath>

namespace royale::config {

namespace {

template <typename T>
void read(const YAML::Node &node, const char *key, T &out)
{
    if (node[key])
        out = node[key].as<T>();
}

game::Vec3 read_vec3(const YAML::Node &node)
{
    game::Vec3 v;
    if (node.IsSequence()) {
        if (node.size() != 3)
            throw ConfigError("expected [x, y, z], got " + std::to_string(node.size()) + " values");
        v.x = node[0].as<float>();
        v.y = node[1].as<float>();
        v.z = node[2].as<float>();
        return v;
    }
    read(node, "x", v.x);
    read(node, "y", v.y);
    read(node, "z", v.z);
    return v;
}

void read_match(const YAML::Node &m, game::MatchSettings &match)
{
    read(m, "tick_interval_ms", match.tick_interval_ms);
    read(m, "min_players", match.min_players);
    read(m, "lobby_wait_seconds", match.lobby_wait_seconds);
    read(m, "countdown_seconds", match.countdown_seconds);
    read(m, "drop_settle_seconds", match.drop_settle_seconds);
    read(m, "drop_height", match.drop_height);
    read(m, "match_max_seconds", match.match_max_seconds);
    read(m, "results_seconds", match.results_seconds);
    read(m, "intermission_seconds", match.intermission_seconds);
    read(m, "default_mode", match.default_mode);
    read(m, "skip_victory", match.skip_victory);
}

void read_modes(const YAML::Node &node, game::ModeTable &modes)
{
    if (!node.IsMap())
        throw ConfigError("modes: expected a map of mode key -> settings");
    for (auto it = node.begin(); it != node.end(); ++it) {
        auto key = it->first.as<std::string>();
        const YAML::Node &m = it->second;
        game::ModeConfig cfg = modes.find(key).value_or(game::ModeConfig{key, 1, 20});
        read(m, "name", cfg.name);
        read(m, "team_size", cfg.team_size);
        read(m, "max_players", cfg.max_players);
        if (!modes.set(key, cfg))
            throw ConfigError("modes." + key + ": team_size must be at least 1");
    }
}

void read_zone(const YAML::Node &z, game::ZoneSettings &zone)
{
    read(z, "initial_radius", zone.initial_radius);
    read(z, "warning_seconds", zone.warning_seconds);
    read(z, "damage_interval_seconds", zone.damage_interval_seconds);
    read(z, "grace_period_seconds", zone.grace_period_seconds);
    read(z, "interpolation_hz", zone.interpolation_hz);
    read(z, "damage_scale", zone.damage_scale);
    if (auto phases = z["phases"]) {
        if (!phases.IsSequence())
            throw ConfigError("zone.phases: expected a list");
        zone.phases.clear();
        for (const auto &p : phases) {
            game::ZonePhaseConfig pc;
            read(p, "delay", pc.delay_sec);
            read(p, "shrink", pc.shrink_sec);
            read(p, "end_radius", pc.end_radius);
            read(p, "center_offset", pc.center_offset);
            read(p, "damage", pc.damage);
            zone.phases.push_back(pc);
        }
    }
}

void read_map(const YAML::Node &m, game::MapSettings &map)
{
    if (m["center"])
        map.center = read_vec3(m["center"]);
    read(m, "size", map.size);
    if (auto points = m["spawn_points"]) {
        map.spawn_points.clear();
        for (const auto &p : points)
            map.spawn_points.push_back(read_vec3(p));
    }
    if (m["lobby_spawn"])
        map.lobby_spawn = read_vec3(m["lobby_spawn"]);
}

ServerConfig from_node(const YAML::Node &root)
{
    ServerConfig cfg;
    try {
        read(root, "listen_port", cfg.listen_port);
        read(root, "metrics_port", cfg.metrics_port);
        read(root, "heartbeat_timeout_seconds", cfg.heartbeat_timeout_seconds);
        read(root, "log_level", cfg.log_level);
        read(root, "log_json", cfg.log_json);
        read(root, "test_mode", cfg.test_mode);
        read(root, "rng_seed", cfg.rng_seed);
        if (root["match"])
            read_match(root["match"], cfg.match);
        if (root["modes"])
            read_modes(root["modes"], cfg.modes);
        if (root["zone"])
            read_zone(root["zone"], cfg.zone);
        if (root["map"])
            read_map(root["map"], cfg.map);
    } catch (const YAML::Exception &ex) {
        throw ConfigError(std::string("invalid config value: ") + ex.what());
    }
    cfg.match.default_map_size = cfg.map.size;
    if (cfg.test_mode)
        apply_test_mode(cfg);
    validate(cfg);
    return cfg;
}

} // namespace

void apply_test_mode(ServerConfig &cfg)
{
    cfg.test_mode = true;
    cfg.match.min_players = 1;
    cfg.match.lobby_wait_seconds = 3.f;
    cfg.match.skip_victory = true;
    cfg.zone.damage_scale *= 0.25f;
    cfg.zone.grace_period_seconds *= 2.f;
}

void validate(const ServerConfig &cfg)
{
    const auto &m = cfg.match;
    if (m.tick_interval_ms == 0)
        throw ConfigError("match.tick_interval_ms must be > 0");
    if (m.min_players == 0)
        throw ConfigError("match.min_players must be >= 1");
    for (float v : {m.lobby_wait_seconds, m.drop_settle_seconds, m.results_seconds, m.intermission_seconds}) {
        if (!std::isfinite(v) || v < 0.f)
            throw ConfigError("match phase durations must be >= 0");
    }
    if (!std::isfinite(m.match_max_seconds) || m.match_max_seconds <= 0.f)
        throw ConfigError("match.match_max_seconds must be > 0");
    if (cfg.modes.all().empty())
        throw ConfigError("modes: at least one mode is required");
    if (!cfg.modes.contains(m.default_mode))
        throw ConfigError("match.default_mode '" + m.default_mode + "' is not a configured mode");
    if (!std::isfinite(cfg.map.size) || cfg.map.size <= 0.f)
        throw ConfigError("map.size must be > 0");
    if (auto err = game::validate_zone_settings(cfg.zone))
        throw ConfigError(*err);
}

ServerConfig load_config(const std::string &path)
{
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception &ex) {
        throw ConfigError("cannot read " + path + ": " + ex.what());
    }
    auto cfg = from_node(root);
    royale::log::debug("[config] loaded {} (test_mode={})", path, cfg.test_mode);
    return cfg;
}

ServerConfig load_config_string(const std::string &yaml)
{
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception &ex) {
        throw ConfigError(std::string("cannot parse config: ") + ex.what());
    }
    return from_node(root);
}

} // namespace royale::config
