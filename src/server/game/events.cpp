// SPDX-License-Identifier: Apache-2.0
#include "server/game/events.hpp"

#include "server/game/victory.hpp"
#include "server/game/zone_state.hpp"

namespace royale::game::events {

std::string_view name(const royale::ServerMessage &msg)
{
    switch (msg.payload_case()) {
        case royale::ServerMessage::kPhaseChanged:
            return "PhaseChanged";
        case royale::ServerMessage::kLobbyStatus:
            return "LobbyStatus";
        case royale::ServerMessage::kCountdown:
            return "Countdown";
        case royale::ServerMessage::kAliveCount:
            return "AliveCountUpdate";
        case royale::ServerMessage::kZoneWarning:
            return "ZoneWarning";
        case royale::ServerMessage::kZoneUpdate:
            return "ZoneUpdate";
        case royale::ServerMessage::kZoneDamage:
            return "ZoneDamage";
        case royale::ServerMessage::kVictory:
            return "VictoryDeclared";
        case royale::ServerMessage::kPlayerEliminated:
            return "PlayerEliminated";
        case royale::ServerMessage::kDropAssigned:
            return "DropAssigned";
        case royale::ServerMessage::kLobbyReturn:
            return "LobbyReturn";
        case royale::ServerMessage::kJoinAck:
            return "JoinAck";
        case royale::ServerMessage::kModeAck:
            return "ModeAck";
        case royale::ServerMessage::kHeartbeatResp:
            return "HeartbeatResp";
        case royale::ServerMessage::PAYLOAD_NOT_SET:
            break;
    }
    return "Unknown";
}

void to_proto(const Vec3 &v, royale::Vec3 *out)
{
    out->set_x(v.x);
    out->set_y(v.y);
    out->set_z(v.z);
}

Vec3 from_proto(const royale::Vec3 &v)
{
    return Vec3{v.x(), v.y(), v.z()};
}

void to_proto(const ZoneState &zone, royale::ZoneSnapshot *out)
{
    out->set_phase(zone.phase);
    out->set_current_radius(zone.current_radius);
    out->set_target_radius(zone.target_radius);
    to_proto(zone.current_center, out->mutable_current_center());
    to_proto(zone.target_center, out->mutable_target_center());
    out->set_active(zone.active);
    out->set_damage(zone.damage);
    out->set_in_grace(zone.in_grace);
}

royale::ServerMessage phase_changed(MatchPhase now, MatchPhase old)
{
    royale::ServerMessage msg;
    auto *p = msg.mutable_phase_changed();
    p->set_new_phase(to_proto(now));
    p->set_old_phase(to_proto(old));
    return msg;
}

royale::ServerMessage lobby_status(uint32_t current, uint32_t required, uint32_t time_remaining, bool can_start)
{
    royale::ServerMessage msg;
    auto *s = msg.mutable_lobby_status();
    s->set_current_players(current);
    s->set_required_players(required);
    s->set_time_remaining(time_remaining);
    s->set_can_start(can_start);
    return msg;
}

royale::ServerMessage countdown(uint32_t seconds_remaining)
{
    royale::ServerMessage msg;
    msg.mutable_countdown()->set_seconds_remaining(seconds_remaining);
    return msg;
}

royale::ServerMessage alive_count(uint32_t players, uint32_t teams)
{
    royale::ServerMessage msg;
    auto *a = msg.mutable_alive_count();
    a->set_players(players);
    a->set_teams(teams);
    return msg;
}

royale::ServerMessage zone_warning(uint32_t delay_seconds, uint32_t upcoming_phase)
{
    royale::ServerMessage msg;
    auto *w = msg.mutable_zone_warning();
    w->set_delay_seconds(delay_seconds);
    w->set_upcoming_phase(upcoming_phase);
    return msg;
}

royale::ServerMessage zone_update(uint32_t phase, float target_radius, const Vec3 &target_center, float damage)
{
    royale::ServerMessage msg;
    auto *u = msg.mutable_zone_update();
    u->set_phase(phase);
    u->set_target_radius(target_radius);
    to_proto(target_center, u->mutable_target_center());
    u->set_damage(damage);
    return msg;
}

royale::ServerMessage zone_damage(PlayerId player, float amount)
{
    royale::ServerMessage msg;
    auto *d = msg.mutable_zone_damage();
    d->set_player_id(player);
    d->set_amount(amount);
    return msg;
}

royale::ServerMessage victory(const Winner &winner)
{
    royale::ServerMessage msg;
    auto *v = msg.mutable_victory();
    if (winner.kind == Winner::Kind::player)
        v->set_player_id(winner.player);
    else
        v->set_team_key(winner.team_key);
    return msg;
}

royale::ServerMessage player_eliminated(PlayerId victim, std::optional<PlayerId> killer)
{
    royale::ServerMessage msg;
    auto *e = msg.mutable_player_eliminated();
    e->set_victim_id(victim);
    if (killer)
        e->set_killer_id(*killer);
    return msg;
}

royale::ServerMessage drop_assigned(PlayerId player, const Vec3 &position)
{
    royale::ServerMessage msg;
    auto *d = msg.mutable_drop_assigned();
    d->set_player_id(player);
    to_proto(position, d->mutable_position());
    return msg;
}

royale::ServerMessage lobby_return(const Vec3 &position)
{
    royale::ServerMessage msg;
    to_proto(position, msg.mutable_lobby_return()->mutable_position());
    return msg;
}

royale::ServerMessage join_ack(PlayerId player, MatchPhase phase, const std::string &mode, const ZoneState &zone)
{
    royale::ServerMessage msg;
    auto *j = msg.mutable_join_ack();
    j->set_player_id(player);
    j->set_phase(to_proto(phase));
    j->set_mode(mode);
    to_proto(zone, j->mutable_zone());
    j->set_spectator(phase == MatchPhase::Dropping || phase == MatchPhase::Match || phase == MatchPhase::Ending);
    return msg;
}

royale::ServerMessage mode_ack(bool accepted, const std::string &mode)
{
    royale::ServerMessage msg;
    auto *m = msg.mutable_mode_ack();
    m->set_accepted(accepted);
    m->set_mode(mode);
    return msg;
}

} // namespace royale::game::events
