// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/game/mode_config.hpp"
#include "server/game/team_registry.hpp"
#include "server/game/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace royale::game {

using AliveMap = std::unordered_map<PlayerId, bool>;

struct AliveCounts
{
    uint32_t players{0};
    uint32_t teams{0}; // teams with at least one alive member
};

struct Winner
{
    enum class Kind
    {
        player,
        team
    };

    Kind kind{Kind::player};
    PlayerId player{0}; // valid when kind == player
    std::string team_key; // valid when kind == team

    std::string describe() const
    {
        return kind == Kind::player ? "player " + std::to_string(player) : "team " + team_key;
    }
};

AliveCounts count_alive(const AliveMap &alive, const TeamSet &teams);

// Pure: no state is read besides the arguments. Solo modes need exactly one alive
// player, grouped modes exactly one team with an alive member; anything else
// (including zero survivors) is "no winner yet".
std::optional<Winner> evaluate_victory(
    const ModeConfig &mode, const AliveCounts &counts, const TeamSet &teams, const AliveMap &alive);

} // namespace royale::game
