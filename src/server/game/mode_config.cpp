// SPDX-License-Identifier: Apache-2.0
#include "server/game/mode_config.hpp"

namespace royale::game {

ModeTable ModeTable::defaults()
{
    return ModeTable({
        {"solo", ModeConfig{"Solo", 1, 20}},
        {"duos", ModeConfig{"Duos", 2, 20}},
        {"trios", ModeConfig{"Trios", 3, 21}}, // 7 teams of 3
    });
}

std::optional<ModeConfig> ModeTable::find(const std::string &key) const
{
    auto it = m_modes.find(key);
    if (it == m_modes.end())
        return std::nullopt;
    return it->second;
}

bool ModeTable::set(const std::string &key, ModeConfig cfg)
{
    if (key.empty() || cfg.team_size == 0)
        return false;
    m_modes[key] = std::move(cfg);
    return true;
}

} // namespace royale::game
