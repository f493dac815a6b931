/**
 * BombManager.cpp
 */

#include "BombManager.h"
#include "../core/Collaborators.h"
#include "../core/TimerQueue.h"
#include "../economy/InventorySystem.h"
#include "../entities/Shuttle.h"
#include "../core/Log.h"
#include <string>

namespace Lander {

namespace {

size_t playerSlot(PlayerId player) {
    return player == 2 ? 1 : 0;
}

} // namespace

BombManager::BombManager(AudioCue& audio, TimerQueue& timers, uint32_t seed)
    : audio_(audio), timers_(timers), rng_(seed) {
}

bool BombManager::canDropBomb(PlayerId player) const {
    return !cooldown_[playerSlot(player)];
}

bool BombManager::dropBomb(const Shuttle& shuttle, InventorySystem& inventory, PlayerId player, TimeMs now) {
    if (!shuttle.isActive() || !canDropBomb(player)) return false;
    
    std::optional<CollectibleType> payload = inventory.findBombPayload();
    if (!payload) return false;
    
    // Above the top of the screen gets its own quote
    if (shuttle.getPosition().y < 0.0f) {
        audio_.playSoundIfNotPlaying("space_force");
    } else {
        std::uniform_int_distribution<int> quote(1, BOMB_QUOTE_COUNT);
        audio_.playSoundIfNotPlaying("bomb" + std::to_string(quote(rng_)));
    }
    
    inventory.remove(*payload, 1);
    
    Bomb bomb;
    bomb.position = shuttle.getPosition() + glm::vec2(0.0f, DROP_OFFSET_Y);
    bomb.velocity = glm::vec2(shuttle.getVelocity().x * 0.5f, shuttle.getVelocity().y + 2.0f);
    bomb.droppedBy = player;
    bomb.createdAt = now;
    bomb.payloadType = *payload;
    bombs_.push_back(bomb);
    
    startCooldown(player, now);
    
    LANDER_LOG_DEBUG("P%d dropped %s at (%.0f, %.0f)", player,
                     getCollectibleInfo(*payload).name, bomb.position.x, bomb.position.y);
    return true;
}

void BombManager::startCooldown(PlayerId player, TimeMs now) {
    size_t slot = playerSlot(player);
    cooldown_[slot] = true;
    uint64_t generation = ++cooldownGeneration_[slot];
    
    timers_.schedule(now, DROP_COOLDOWN_MS, [this, slot, generation]() {
        // A cleared manager ignores cooldowns from before the clear
        if (cooldownGeneration_[slot] == generation) {
            cooldown_[slot] = false;
        }
    });
}

void BombManager::update() {
    for (auto& bomb : bombs_) {
        if (bomb.active && !bomb.hasExploded) {
            bomb.step();
        }
    }
}

void BombManager::clear() {
    bombs_.clear();
    cooldown_.fill(false);
    cooldownGeneration_[0]++;
    cooldownGeneration_[1]++;
}

} // namespace Lander
