/**
 * BombManager.h
 * 
 * Food bombs dropped from the shuttle
 * 
 * Features:
 * - Drops draw one droppable food from the inventory, in catalog order
 * - Per-player drop cooldown
 * - Ballistic integration under gravity
 */

#pragma once

#include "../core/Types.h"
#include "../economy/CollectibleCatalog.h"
#include <array>
#include <glm/glm.hpp>
#include <random>
#include <vector>

namespace Lander {

class AudioCue;
class TimerQueue;
class Shuttle;
class InventorySystem;

struct Bomb {
    static constexpr float GRAVITY = 0.125f;   // px/frame^2
    
    glm::vec2 position{0.0f};
    glm::vec2 velocity{0.0f};
    PlayerId droppedBy = 1;
    TimeMs createdAt = 0.0;
    CollectibleType payloadType = CollectibleType::Burger;
    bool hasExploded = false;
    bool active = true;
    
    void step() {
        velocity.y += GRAVITY;
        position += velocity;
    }
    
    TimeMs ageAt(TimeMs now) const { return now - createdAt; }
};

class BombManager {
public:
    static constexpr TimeMs DROP_COOLDOWN_MS = 300.0;
    static constexpr float DROP_OFFSET_Y = 20.0f;
    static constexpr int BOMB_QUOTE_COUNT = 8;
    
    BombManager(AudioCue& audio, TimerQueue& timers, uint32_t seed = std::random_device{}());
    
    /**
     * Drop a bomb below the shuttle.
     * @return false while cooling down, with no food on board, or when the
     *         shuttle is inactive
     */
    bool dropBomb(const Shuttle& shuttle, InventorySystem& inventory, PlayerId player, TimeMs now);
    
    bool canDropBomb(PlayerId player) const;
    
    /** Advance every live bomb one frame */
    void update();
    
    std::vector<Bomb>& getBombs() { return bombs_; }
    const std::vector<Bomb>& getBombs() const { return bombs_; }
    size_t getBombCount() const { return bombs_.size(); }
    
    /** Add a bomb directly (replays and tests) */
    void addBomb(const Bomb& bomb) { bombs_.push_back(bomb); }
    
    void clear();
    
private:
    void startCooldown(PlayerId player, TimeMs now);
    
    AudioCue& audio_;
    TimerQueue& timers_;
    std::mt19937 rng_;
    std::vector<Bomb> bombs_;
    std::array<bool, 2> cooldown_{{false, false}};
    std::array<uint64_t, 2> cooldownGeneration_{{0, 0}};
};

} // namespace Lander
