// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/game/collaborators.hpp"
#include "server/game/types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace royale::game {

struct PlayerRecord
{
    PlayerRecord(PlayerId pid, std::string display_name) : id(pid), name(std::move(display_name)) {}

    const PlayerId id;
    const std::string name;
    // Written only by the match core (revive at Starting, eliminate, clear at Cleanup);
    // atomic so team membership can read it through a weak reference without the roster lock.
    std::atomic<bool> alive{false};
    // Guarded by the owning Roster's mutex.
    float health{0.f};
    std::optional<Vec3> position; // empty until the client reports a body
};

// Copy of a record taken under the roster lock.
struct PlayerView
{
    PlayerId id{0};
    std::string name;
    bool alive{false};
    float health{0.f};
    std::optional<Vec3> position;
};

// Connected players in join order. Owns every PlayerRecord; other components keep
// weak references only.
class Roster final : public IPlayerPositionSource
{
public:
    explicit Roster(float max_health = 100.f) : m_max_health(max_health) {}

    PlayerId add_player(std::string name);
    // Returns false when the id is unknown.
    bool remove_player(PlayerId id);
    bool contains(PlayerId id);
    size_t size();

    std::vector<std::shared_ptr<PlayerRecord>> members();
    std::vector<PlayerView> snapshot();
    std::unordered_map<PlayerId, bool> alive_map();
    uint32_t alive_count();

    // Returns true only on the alive -> eliminated edge.
    bool mark_eliminated(PlayerId id);
    void revive_all();
    void clear_alive();

    // Client reports and server-side placement (drop, lobby return) both land here.
    void set_position(PlayerId id, std::optional<Vec3> position);
    // Remaining health after the hit; nullopt when the player is unknown or not alive.
    std::optional<float> apply_damage(PlayerId id, float amount);

    std::vector<PlayerSample> sample_players() override;

    float max_health() const noexcept
    {
        return m_max_health;
    }

private:
    std::shared_ptr<PlayerRecord> find_locked(PlayerId id);

    std::mutex m_mutex;
    const float m_max_health;
    PlayerId m_last_id{0};
    std::vector<std::shared_ptr<PlayerRecord>> m_players;
};

} // namespace royale::game
