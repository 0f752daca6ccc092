// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/game/map_provider.hpp"
#include "server/game/match_coordinator.hpp"
#include "server/game/mode_config.hpp"
#include "server/game/zone_state.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace royale::config {

class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct ServerConfig
{
    uint16_t listen_port{40001};
    uint16_t metrics_port{0}; // 0 disables
    uint32_t heartbeat_timeout_seconds{15};
    std::string log_level{"info"};
    bool log_json{false};
    bool test_mode{false};
    uint32_t rng_seed{0}; // 0: seeded from std::random_device
    game::MatchSettings match;
    game::ModeTable modes{game::ModeTable::defaults()};
    game::ZoneSettings zone;
    game::MapSettings map;
};

// Reads a YAML document; keys that are absent keep their compiled defaults. Throws
// ConfigError on unreadable files, type mismatches or values that fail validation.
ServerConfig load_config(const std::string &path);
ServerConfig load_config_string(const std::string &yaml);

// Single-player iteration profile: one player starts the match after 3 s, matches only
// end by timeout, zone damage x0.25, grace period doubled.
void apply_test_mode(ServerConfig &cfg);

// Throws ConfigError describing the first invalid value.
void validate(const ServerConfig &cfg);

} // namespace royale::config
