/**
 * OceanManager.cpp
 */

#include "OceanManager.h"
#include "../core/WorldLayout.h"
#include "../core/TimerQueue.h"
#include "../core/Collaborators.h"
#include "../entities/WorldEntities.h"
#include "../combat/BombManager.h"
#include "../settings/QualityPresets.h"
#include "../core/Log.h"
#include <cmath>

namespace Lander {

OceanManager::OceanManager(const WorldLayout& layout, WorldEntities& entities, TimerQueue& timers,
                           EffectSink* effects, uint32_t seed)
    : layout_(layout), entities_(entities), timers_(timers), effects_(effects), rng_(seed) {
}

float OceanManager::getWaterSurface() const {
    return Shark::waterSurface();
}

void OceanManager::populate(GameMode mode) {
    std::uniform_real_distribution<float> chance(0.0f, 1.0f);
    
    entities_.fisherBoat = std::make_unique<FisherBoat>(FISHER_BOAT_X, getWaterSurface(), effects_);
    entities_.fisherBoat->setHasPackage(chance(rng_) < BOAT_PACKAGE_CHANCE);
    
    spawnSharks();
    
    if (mode != GameMode::Dogfight) {
        spawnGreenlandIce();
    }
    
    if (chance(rng_) < GOLF_CART_CHANCE) {
        entities_.golfCart = std::make_unique<GolfCart>(GOLF_CART_X, GOLF_CART_MIN_X, GOLF_CART_MAX_X, effects_);
    }
    
    LANDER_LOG_INFO("Ocean populated: %zu sharks, boat package %s, ice %s, golf cart %s",
                    entities_.sharks.size(),
                    entities_.fisherBoat->hasPackage() ? "yes" : "no",
                    entities_.greenlandIce ? "yes" : "no",
                    entities_.golfCart ? "yes" : "no");
}

void OceanManager::spawnSharks() {
    std::uniform_int_distribution<int> countPick(2, 3);
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    
    int sharkCount = countPick(rng_);
    float oceanStart = layout_.getOceanStart();
    float zoneWidth = (layout_.getOceanEnd() - oceanStart) / static_cast<float>(sharkCount);
    
    for (int i = 0; i < sharkCount; ++i) {
        float zoneStart = oceanStart + static_cast<float>(i) * zoneWidth;
        float zoneEnd = zoneStart + zoneWidth;
        
        float x = zoneStart + zoneWidth * 0.5f + (unit(rng_) - 0.5f) * zoneWidth * 0.3f;
        float depth = 80.0f + unit(rng_) * 40.0f;
        
        entities_.sharks.push_back(std::make_unique<Shark>(x, depth, zoneStart + 50.0f, zoneEnd - 50.0f, effects_));
    }
}

void OceanManager::spawnGreenlandIce() {
    // Clear of the fisher boat and the mid-Atlantic platform
    struct Zone { float min; float max; };
    static const Zone zones[] = {{2800.0f, 3400.0f}, {3600.0f, 4100.0f}};
    
    std::uniform_int_distribution<int> zonePick(0, 1);
    const Zone& zone = zones[zonePick(rng_)];
    std::uniform_real_distribution<float> xPick(zone.min, zone.max);
    
    entities_.greenlandIce = std::make_unique<GreenlandIce>(xPick(rng_), getWaterSurface(), effects_);
}

void OceanManager::update(TimeMs now, const QualityPreset& preset, float pollutionLevel,
                          const TerrainQuery& terrain, const std::vector<glm::vec2>& shuttlePositions,
                          const std::vector<Bomb>& bombs) {
    if (preset.oceanWaves) {
        waveOffset_ += WAVE_STEP;
    }
    
    // Floating objects
    shuttleNearBoat_ = false;
    if (entities_.fisherBoat && !entities_.fisherBoat->isDestroyed()) {
        const glm::vec2& boat = entities_.fisherBoat->getPosition();
        for (const auto& shuttle : shuttlePositions) {
            if (std::abs(shuttle.x - boat.x) < BOAT_PROXIMITY_X && std::abs(shuttle.y - boat.y) < BOAT_PROXIMITY_Y) {
                shuttleNearBoat_ = true;
                break;
            }
        }
        if (preset.entityUpdates) {
            entities_.fisherBoat->update(waveOffset_);
        }
    }
    
    if (preset.entityUpdates && entities_.greenlandIce && !entities_.greenlandIce->isDestroyed()) {
        entities_.greenlandIce->update(waveOffset_);
    }
    
    if (entities_.golfCart && !entities_.golfCart->isDestroyed() && !shuttlePositions.empty()) {
        entities_.golfCart->update(terrain, shuttlePositions.front(), now);
    }
    
    // Sharks
    std::vector<glm::vec2> foodTargets = collectFoodTargets(bombs);
    for (auto& shark : entities_.sharks) {
        if (!shark->isDestroyed()) {
            shark->update(waveOffset_, pollutionLevel, foodTargets);
        }
    }
    
    feedSharks(now);
}

std::vector<glm::vec2> OceanManager::collectFoodTargets(const std::vector<Bomb>& bombs) const {
    std::vector<glm::vec2> targets;
    targets.reserve(sunkenFood_.size() + bombs.size());
    
    for (const auto& food : sunkenFood_) {
        targets.push_back(food.position);
    }
    
    // Bombs already below the surface
    float surface = getWaterSurface();
    for (const auto& bomb : bombs) {
        if (!bomb.active || bomb.hasExploded) continue;
        if (bomb.position.x >= layout_.getOceanStart() && bomb.position.x <= layout_.getOceanEnd() &&
            bomb.position.y > surface) {
            targets.push_back(bomb.position);
        }
    }
    
    return targets;
}

void OceanManager::feedSharks(TimeMs now) {
    // Dead sharks never eat again, so nothing is left to hunt the food
    if (!hasHungrySharks()) {
        sunkenFood_.clear();
        return;
    }
    
    for (auto& shark : entities_.sharks) {
        if (shark->isDestroyed() || !shark->canEatBomb()) continue;
        
        Rect mouth = shark->getEatingBounds();
        for (int i = static_cast<int>(sunkenFood_.size()) - 1; i >= 0; --i) {
            if (mouth.contains(sunkenFood_[i].position)) {
                shark->eatBomb(timers_, now);
                sunkenFood_.erase(sunkenFood_.begin() + i);
                break;
            }
        }
    }
}

void OceanManager::addSunkenFood(const glm::vec2& position, CollectibleType type) {
    if (!hasHungrySharks()) return;
    sunkenFood_.push_back({position, type});
}

bool OceanManager::hasHungrySharks() const {
    for (const auto& shark : entities_.sharks) {
        if (!shark->isDestroyed() && shark->canEatBomb()) return true;
    }
    return false;
}

void OceanManager::clear() {
    sunkenFood_.clear();
    waveOffset_ = 0.0f;
    shuttleNearBoat_ = false;
}

} // namespace Lander
