// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "royale.pb.h"

#include <cstdint>

namespace royale::game {

// Match lifecycle. The cycle is closed: Cleanup is followed by Lobby.
enum class MatchPhase : uint8_t
{
    Lobby = 0,
    Starting,
    Dropping,
    Match,
    Ending,
    Cleanup
};

inline constexpr MatchPhase next_phase(MatchPhase p) noexcept
{
    switch (p) {
        case MatchPhase::Lobby:
            return MatchPhase::Starting;
        case MatchPhase::Starting:
            return MatchPhase::Dropping;
        case MatchPhase::Dropping:
            return MatchPhase::Match;
        case MatchPhase::Match:
            return MatchPhase::Ending;
        case MatchPhase::Ending:
            return MatchPhase::Cleanup;
        case MatchPhase::Cleanup:
            return MatchPhase::Lobby;
    }
    return MatchPhase::Lobby;
}

inline constexpr const char *phase_name(MatchPhase p) noexcept
{
    switch (p) {
        case MatchPhase::Lobby:
            return "Lobby";
        case MatchPhase::Starting:
            return "Starting";
        case MatchPhase::Dropping:
            return "Dropping";
        case MatchPhase::Match:
            return "Match";
        case MatchPhase::Ending:
            return "Ending";
        case MatchPhase::Cleanup:
            return "Cleanup";
    }
    return "Unknown";
}

inline royale::Phase to_proto(MatchPhase p) noexcept
{
    return static_cast<royale::Phase>(static_cast<int>(p));
}

} // namespace royale::game
