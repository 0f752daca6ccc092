// SPDX-License-Identifier: Apache-2.0
// collaborators.hpp
// Narrow interfaces to systems the match core does not own (map, creature AI, loot,
// player bodies). All of them are injected as raw non-owning pointers; a null pointer
// means "not available" and the dependent effect is skipped with a log line.
#pragma once

#include "server/game/types.hpp"

#include <optional>
#include <vector>

namespace royale::game {

class ISpawnPointProvider
{
public:
    virtual ~ISpawnPointProvider() = default;
    virtual std::vector<Vec3> player_spawn_points() = 0;
    virtual Vec3 map_center() = 0;
    virtual float map_size() = 0;
    virtual std::optional<Vec3> lobby_spawn() = 0;
};

class IDinosaurSpawnController
{
public:
    virtual ~IDinosaurSpawnController() = default;
    virtual void start_spawning() = 0;
    virtual void stop_spawning() = 0;
    virtual void despawn_all() = 0;
};

class ILootController
{
public:
    virtual ~ILootController() = default;
    virtual void spawn_all_loot() = 0;
    virtual void reset_loot() = 0;
};

struct PlayerSample
{
    PlayerId id{0};
    std::optional<Vec3> position; // empty when the player has no active body
    bool alive{false};
    bool connected{false};
};

class IPlayerPositionSource
{
public:
    virtual ~IPlayerPositionSource() = default;
    virtual std::vector<PlayerSample> sample_players() = 0;
};

class IDamageSink
{
public:
    virtual ~IDamageSink() = default;
    virtual void apply_damage(PlayerId player, float amount) = 0;
};

} // namespace royale::game
