// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "royale.pb.h"
#include "server/game/phase.hpp"
#include "server/game/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace royale::game {

struct ZoneState;
struct Winner;

namespace events {

// Stable event name of the payload carried by msg ("PhaseChanged", "ZoneUpdate", ...).
std::string_view name(const royale::ServerMessage &msg);

royale::ServerMessage phase_changed(MatchPhase now, MatchPhase old);
royale::ServerMessage lobby_status(uint32_t current, uint32_t required, uint32_t time_remaining, bool can_start);
royale::ServerMessage countdown(uint32_t seconds_remaining);
royale::ServerMessage alive_count(uint32_t players, uint32_t teams);
royale::ServerMessage zone_warning(uint32_t delay_seconds, uint32_t upcoming_phase);
royale::ServerMessage zone_update(uint32_t phase, float target_radius, const Vec3 &target_center, float damage);
royale::ServerMessage zone_damage(PlayerId player, float amount);
royale::ServerMessage victory(const Winner &winner);
royale::ServerMessage player_eliminated(PlayerId victim, std::optional<PlayerId> killer);
royale::ServerMessage drop_assigned(PlayerId player, const Vec3 &position);
royale::ServerMessage lobby_return(const Vec3 &position);
royale::ServerMessage join_ack(PlayerId player, MatchPhase phase, const std::string &mode, const ZoneState &zone);
royale::ServerMessage mode_ack(bool accepted, const std::string &mode);

void to_proto(const Vec3 &v, royale::Vec3 *out);
Vec3 from_proto(const royale::Vec3 &v);
void to_proto(const ZoneState &zone, royale::ZoneSnapshot *out);

} // namespace events
} // namespace royale::game
