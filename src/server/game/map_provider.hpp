// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/game/collaborators.hpp"

#include <optional>
#include <vector>

namespace royale::game {

struct MapSettings
{
    Vec3 center{};
    float size{2048.f};
    std::vector<Vec3> spawn_points; // empty: drop on the fallback ring
    std::optional<Vec3> lobby_spawn;
};

// Spawn point provider backed by the `map` section of the server config.
class ConfiguredMapProvider final : public ISpawnPointProvider
{
public:
    explicit ConfiguredMapProvider(MapSettings settings) : m_settings(std::move(settings)) {}

    std::vector<Vec3> player_spawn_points() override
    {
        return m_settings.spawn_points;
    }

    Vec3 map_center() override
    {
        return m_settings.center;
    }

    float map_size() override
    {
        return m_settings.size;
    }

    std::optional<Vec3> lobby_spawn() override
    {
        return m_settings.lobby_spawn;
    }

private:
    const MapSettings m_settings;
};

} // namespace royale::game
