/**
 * Structures.cpp
 */

#include "Structures.h"
#include "../core/Collaborators.h"
#include <cmath>
#include <unordered_map>

namespace Lander {

namespace {

DestructibleState makeState(const glm::vec2& position, const std::string& name,
                            const std::string& country, int points, const BoundsConfig& bounds) {
    DestructibleState state;
    state.position = position;
    state.name = name;
    state.country = country;
    state.pointValue = points;
    state.bounds = bounds;
    return state;
}

const std::vector<std::string>& projectileSpritesFor(const std::string& country) {
    static const std::unordered_map<std::string, std::vector<std::string>> sprites = {
        {"United Kingdom", {"teacup", "doubledecker", "blackcab", "guardhat"}},
        {"France", {"baguette", "wine", "croissant"}},
        {"Germany", {"pretzel", "beer"}},
        {"Poland", {"pierogi", "pottery"}},
        {"Russia", {"proj_matryoshka", "balalaika", "borscht", "samovar"}},
    };
    static const std::vector<std::string> fallback = {"cannonball"};
    
    auto it = sprites.find(country);
    return it != sprites.end() ? it->second : fallback;
}

} // namespace

// ============================================================================
// BUILDING
// ============================================================================

int Building::pointsFor(int indexInCountry, bool isLandmark) {
    if (isLandmark) return LANDMARK_POINTS;
    if (indexInCountry >= 0 && indexInCountry < 4) return EARLY_BUILDING_POINTS;
    return BUILDING_POINTS;
}

Building::Building(const glm::vec2& base, float width, float height,
                   const std::string& name, const std::string& country,
                   int indexInCountry, bool isLandmark, EffectSink* effects)
    : Destructible(EntityKind::Building,
                   makeState(base, name, country, pointsFor(indexInCountry, isLandmark),
                             {width, height, BoundsAlignment::Top, 0.0f}),
                   effects)
    , landmark_(isLandmark) {
}

void Building::onExplode() {
    if (EffectSink* fx = effects()) {
        Rect bounds = getCollisionBounds();
        fx->spawnEffect(EffectKind::Explosion, state_.position.x, bounds.y + bounds.height * 0.5f);
        fx->spawnEffect(EffectKind::Debris, state_.position.x, bounds.y);
    }
}

MedalHouse::MedalHouse(const glm::vec2& base, float width, float height,
                       const std::string& country, EffectSink* effects)
    : Destructible(EntityKind::MedalHouse,
                   makeState(base, "Medal House", country, POINTS,
                             {width, height, BoundsAlignment::Top, 0.0f}),
                   effects) {
}

void MedalHouse::onExplode() {
    if (EffectSink* fx = effects()) {
        Rect bounds = getCollisionBounds();
        fx->spawnEffect(EffectKind::Explosion, state_.position.x, bounds.y + bounds.height * 0.5f, 1.5f);
        fx->spawnEffect(EffectKind::Debris, state_.position.x, bounds.y, 1.5f);
    }
}

// ============================================================================
// CANNON
// ============================================================================

bool CannonProjectile::isOutOfBounds(float cameraX) const {
    return position.y < -100.0f ||
           position.x < cameraX - 500.0f ||
           position.x > cameraX + GAME_WIDTH + 500.0f ||
           position.y > GAME_HEIGHT + 200.0f;
}

Cannon::Cannon(const glm::vec2& position, const std::string& country, EffectSink* effects)
    : Destructible(EntityKind::Cannon,
                   makeState(position, "Cannon", country, POINTS,
                             {SIZE, SIZE, BoundsAlignment::Center, 0.0f}),
                   effects)
    , projectileSprites_(projectileSpritesFor(country)) {
}

void Cannon::update(TimeMs now, float cameraX, std::mt19937& rng) {
    if (target_ && !isDestroyed()) {
        glm::vec2 delta = *target_ - state_.position;
        aimAngle_ = std::atan2(delta.y, delta.x);
        
        if (now - lastFireTime_ > FIRE_INTERVAL_MS) {
            fire(aimAngle_, rng);
            lastFireTime_ = now;
        }
    }
    
    for (int i = static_cast<int>(projectiles_.size()) - 1; i >= 0; --i) {
        projectiles_[i].step();
        if (projectiles_[i].isOutOfBounds(cameraX)) {
            projectiles_.erase(projectiles_.begin() + i);
        }
    }
}

void Cannon::fire(float angle, std::mt19937& rng) {
    std::uniform_int_distribution<size_t> pick(0, projectileSprites_.size() - 1);
    glm::vec2 dir(std::cos(angle), std::sin(angle));
    
    CannonProjectile projectile;
    projectile.position = state_.position + dir * MUZZLE_OFFSET;
    projectile.velocity = dir * PROJECTILE_SPEED;
    projectile.spriteKey = projectileSprites_[pick(rng)];
    projectiles_.push_back(projectile);
}

void Cannon::onExplode() {
    target_.reset();
    if (EffectSink* fx = effects()) {
        fx->spawnEffect(EffectKind::Explosion, state_.position.x, state_.position.y);
    }
}

// ============================================================================
// OIL TOWER
// ============================================================================

OilTower::OilTower(const glm::vec2& base, const std::string& country, EffectSink* effects)
    : Destructible(EntityKind::OilTower,
                   makeState(base, "Oil Derrick", country, POINTS,
                             {36.0f, 55.0f, BoundsAlignment::Top, 0.0f}),
                   effects) {
}

void OilTower::onExplode() {
    if (EffectSink* fx = effects()) {
        fx->spawnEffect(EffectKind::Explosion, state_.position.x, state_.position.y - 25.0f);
        fx->spawnEffect(EffectKind::OilBurst, state_.position.x, state_.position.y - 25.0f);
    }
}

} // namespace Lander
