/**
 * Structures.h
 * 
 * Ground-anchored destructibles: country buildings, the medal house,
 * cannon towers and oil derricks
 */

#pragma once

#include "Destructible.h"
#include <optional>
#include <random>
#include <vector>

namespace Lander {

// ============================================================================
// BUILDINGS
// ============================================================================

/**
 * Country decoration building, anchored at its base
 */
class Building : public Destructible {
public:
    static constexpr int LANDMARK_POINTS = 500;
    static constexpr int EARLY_BUILDING_POINTS = 300;
    static constexpr int BUILDING_POINTS = 100;
    
    /** Landmarks pay most, then the first four buildings of a country */
    static int pointsFor(int indexInCountry, bool isLandmark);
    
    Building(const glm::vec2& base, float width, float height,
             const std::string& name, const std::string& country,
             int indexInCountry, bool isLandmark, EffectSink* effects = nullptr);
    
    bool isLandmark() const { return landmark_; }
    
protected:
    void onExplode() override;
    
private:
    bool landmark_;
};

/**
 * The milestone building that holds the peace medal
 */
class MedalHouse : public Destructible {
public:
    static constexpr int POINTS = 1000;
    static constexpr TimeMs MILESTONE_CUE_DELAY_MS = 500.0;
    static constexpr const char* MILESTONE_CUE = "sorry_johnny";
    
    MedalHouse(const glm::vec2& base, float width, float height,
               const std::string& country, EffectSink* effects = nullptr);
    
protected:
    void onExplode() override;
};

// ============================================================================
// CANNONS
// ============================================================================

struct CannonProjectile {
    glm::vec2 position{0.0f};
    glm::vec2 velocity{0.0f};
    std::string spriteKey;
    
    void step() { position += velocity; }
    
    /** Above the sky, far off either side of the view, or below the world */
    bool isOutOfBounds(float cameraX) const;
};

class Cannon : public Destructible {
public:
    static constexpr int POINTS = 200;
    static constexpr float SIZE = 36.0f;
    static constexpr TimeMs FIRE_INTERVAL_MS = 2000.0;
    static constexpr float PROJECTILE_SPEED = 5.0f;
    static constexpr float MUZZLE_OFFSET = 25.0f;
    
    Cannon(const glm::vec2& position, const std::string& country, EffectSink* effects = nullptr);
    
    bool isActive() const { return !isDestroyed(); }
    
    void setTarget(const std::optional<glm::vec2>& target) { target_ = target; }
    const std::optional<glm::vec2>& getTarget() const { return target_; }
    
    /**
     * Aim at the target, fire when the interval has passed, advance
     * projectiles and drop those out of bounds
     */
    void update(TimeMs now, float cameraX, std::mt19937& rng);
    
    std::vector<CannonProjectile>& getProjectiles() { return projectiles_; }
    const std::vector<CannonProjectile>& getProjectiles() const { return projectiles_; }
    
    float getAimAngle() const { return aimAngle_; }
    
protected:
    void onExplode() override;
    
private:
    void fire(float angle, std::mt19937& rng);
    
    std::optional<glm::vec2> target_;
    std::vector<CannonProjectile> projectiles_;
    std::vector<std::string> projectileSprites_;
    TimeMs lastFireTime_ = 0.0;
    float aimAngle_ = 0.0f;
};

// ============================================================================
// OIL
// ============================================================================

class OilTower : public Destructible {
public:
    static constexpr int POINTS = 100;
    
    OilTower(const glm::vec2& base, const std::string& country, EffectSink* effects = nullptr);
    
protected:
    void onExplode() override;
};

} // namespace Lander
