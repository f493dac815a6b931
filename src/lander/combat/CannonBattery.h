/**
 * CannonBattery.h
 * 
 * Drives every cannon in the world and resolves their projectiles
 * 
 * Features:
 * - Cannons near the camera aim at the nearest active shuttle
 * - Cannons off-screen keep moving their projectiles in flight
 * - Bribe power-up stands every cannon down for a while
 * - Projectile intercepts: shot vs shot, shot vs building, shot vs hull
 */

#pragma once

#include "../core/Types.h"
#include <glm/glm.hpp>
#include <random>
#include <vector>

namespace Lander {

class EffectSink;
struct WorldEntities;
struct QualityPreset;

/**
 * What the intercept pass removed this frame
 */
struct InterceptStats {
    int shotDown = 0;        // Projectiles destroyed by other projectiles
    int absorbedByBuildings = 0;
};

class CannonBattery {
public:
    static constexpr float CAMERA_MARGIN = 200.0f;
    static constexpr float INTERCEPT_RADIUS = 15.0f;
    static constexpr float BUILDING_PREFILTER = 150.0f;
    static constexpr float HULL_HIT_RADIUS = 25.0f;
    static constexpr TimeMs BRIBE_DURATION_MS = 10000.0;
    
    CannonBattery(WorldEntities& entities, EffectSink* effects = nullptr,
                  uint32_t seed = std::random_device{}());
    
    /**
     * Retarget and fire
     * @param targets Positions of the active shuttles
     */
    void update(TimeMs now, float cameraX, const std::vector<glm::vec2>& targets);
    
    /** Projectile vs projectile and projectile vs building */
    InterceptStats resolveIntercepts(const QualityPreset& preset);
    
    /**
     * Remove every projectile touching the hull at the given position
     * @return Number of projectiles that hit
     */
    int collectHullHits(const glm::vec2& hullCenter);
    
    // Bribe
    void bribe(TimeMs now);
    bool isBribed(TimeMs now) const { return now < bribeEndTime_; }
    
    size_t getProjectileCount() const;
    void clearProjectiles();
    
private:
    static bool isOnScreen(float x, float cameraX);
    static const glm::vec2* findNearest(const glm::vec2& from, const std::vector<glm::vec2>& targets);
    
    void burst(float x, float y);
    
    WorldEntities& entities_;
    EffectSink* effects_;
    std::mt19937 rng_;
    TimeMs bribeEndTime_ = 0.0;
};

} // namespace Lander
