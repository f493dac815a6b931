/**
 * CannonBattery.cpp
 */

#include "CannonBattery.h"
#include "../core/Collaborators.h"
#include "../entities/WorldEntities.h"
#include "../settings/QualityPresets.h"
#include "../core/Log.h"

#include <cmath>
#include <unordered_set>

namespace Lander {

CannonBattery::CannonBattery(WorldEntities& entities, EffectSink* effects, uint32_t seed)
    : entities_(entities)
    , effects_(effects)
    , rng_(seed) {
}

// ============================================================================
// FIRING
// ============================================================================

void CannonBattery::update(TimeMs now, float cameraX, const std::vector<glm::vec2>& targets) {
    bool bribed = isBribed(now);
    
    for (auto& cannon : entities_.cannons) {
        bool onScreen = isOnScreen(cannon->getX(), cameraX);
        bool inFlight = !cannon->getProjectiles().empty();
        
        if (onScreen && cannon->isActive() && !bribed && !targets.empty()) {
            if (const glm::vec2* target = findNearest(cannon->getPosition(), targets)) {
                cannon->setTarget(*target);
            }
        } else if (bribed) {
            cannon->setTarget(std::nullopt);
        }
        
        if (onScreen || inFlight) {
            cannon->update(now, cameraX, rng_);
        }
    }
}

bool CannonBattery::isOnScreen(float x, float cameraX) {
    return x >= cameraX - CAMERA_MARGIN && x <= cameraX + GAME_WIDTH + CAMERA_MARGIN;
}

const glm::vec2* CannonBattery::findNearest(const glm::vec2& from, const std::vector<glm::vec2>& targets) {
    const glm::vec2* nearest = nullptr;
    float nearestDist = 0.0f;
    
    for (const auto& target : targets) {
        float dist = glm::length(target - from);
        if (!nearest || dist < nearestDist) {
            nearest = &target;
            nearestDist = dist;
        }
    }
    return nearest;
}

void CannonBattery::bribe(TimeMs now) {
    bribeEndTime_ = now + BRIBE_DURATION_MS;
    LANDER_LOG_INFO("Cannons bribed until %.0f", bribeEndTime_);
}

// ============================================================================
// INTERCEPTS
// ============================================================================

InterceptStats CannonBattery::resolveIntercepts(const QualityPreset& preset) {
    InterceptStats stats;
    
    std::vector<CannonProjectile*> all;
    for (auto& cannon : entities_.cannons) {
        for (auto& projectile : cannon->getProjectiles()) {
            all.push_back(&projectile);
        }
    }
    
    std::unordered_set<const CannonProjectile*> toDestroy;
    
    // Pairwise test is quadratic, lower presets skip it
    if (preset.projectileCollisions) {
        for (size_t i = 0; i < all.size(); ++i) {
            for (size_t j = i + 1; j < all.size(); ++j) {
                if (toDestroy.count(all[i]) || toDestroy.count(all[j])) continue;
                
                if (glm::length(all[i]->position - all[j]->position) < INTERCEPT_RADIUS) {
                    toDestroy.insert(all[i]);
                    toDestroy.insert(all[j]);
                    glm::vec2 mid = (all[i]->position + all[j]->position) * 0.5f;
                    burst(mid.x, mid.y);
                    stats.shotDown += 2;
                }
            }
        }
    }
    
    for (CannonProjectile* projectile : all) {
        if (toDestroy.count(projectile)) continue;
        
        for (auto& building : entities_.buildings) {
            if (building->isDestroyed() || !building->isVisible()) continue;
            if (std::abs(projectile->position.x - building->getX()) > BUILDING_PREFILTER) continue;
            
            if (building->getCollisionBounds().contains(projectile->position)) {
                toDestroy.insert(projectile);
                burst(projectile->position.x, projectile->position.y);
                stats.absorbedByBuildings++;
                break;
            }
        }
    }
    
    if (toDestroy.empty()) return stats;
    
    for (auto& cannon : entities_.cannons) {
        auto& projectiles = cannon->getProjectiles();
        for (int i = static_cast<int>(projectiles.size()) - 1; i >= 0; --i) {
            if (toDestroy.count(&projectiles[i])) {
                projectiles.erase(projectiles.begin() + i);
            }
        }
    }
    
    return stats;
}

int CannonBattery::collectHullHits(const glm::vec2& hullCenter) {
    int hits = 0;
    
    for (auto& cannon : entities_.cannons) {
        auto& projectiles = cannon->getProjectiles();
        for (int i = static_cast<int>(projectiles.size()) - 1; i >= 0; --i) {
            if (glm::length(projectiles[i].position - hullCenter) < HULL_HIT_RADIUS) {
                projectiles.erase(projectiles.begin() + i);
                hits++;
            }
        }
    }
    return hits;
}

void CannonBattery::burst(float x, float y) {
    if (effects_) {
        effects_->spawnEffect(EffectKind::ProjectileBurst, x, y);
    }
}

// ============================================================================
// BOOKKEEPING
// ============================================================================

size_t CannonBattery::getProjectileCount() const {
    size_t count = 0;
    for (const auto& cannon : entities_.cannons) {
        count += cannon->getProjectiles().size();
    }
    return count;
}

void CannonBattery::clearProjectiles() {
    for (auto& cannon : entities_.cannons) {
        cannon->getProjectiles().clear();
    }
}

} // namespace Lander
