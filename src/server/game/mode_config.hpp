// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace royale::game {

struct ModeConfig
{
    std::string name; // display name
    uint32_t team_size{1};
    uint32_t max_players{20};

    bool is_solo() const noexcept
    {
        return team_size <= 1;
    }
};

// Mode key ("solo", "duos", "trios") -> config. Keys are what clients send in ModeRequest.
class ModeTable
{
public:
    ModeTable() = default;
    explicit ModeTable(std::map<std::string, ModeConfig> modes) : m_modes(std::move(modes)) {}

    // solo / duos / trios with the shipped player limits.
    static ModeTable defaults();

    bool contains(const std::string &key) const
    {
        return m_modes.count(key) != 0;
    }

    std::optional<ModeConfig> find(const std::string &key) const;

    // Replaces or adds one entry; returns false (table unchanged) when team_size is 0.
    bool set(const std::string &key, ModeConfig cfg);

    const std::map<std::string, ModeConfig> &all() const noexcept
    {
        return m_modes;
    }

private:
    std::map<std::string, ModeConfig> m_modes;
};

} // namespace royale::game
