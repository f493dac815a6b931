/**
 * Vehicles.cpp
 */

#include "Vehicles.h"
#include <cmath>
#include <unordered_map>

namespace Lander {

namespace {

struct PropagandaStyle {
    const char* adjective;
    const char* propagandaType;
    uint32_t accentColor;
};

const PropagandaStyle& propagandaStyleFor(const std::string& country) {
    static const std::unordered_map<std::string, PropagandaStyle> styles = {
        {"USA", {"American", "USA_PROPAGANDA", 0x3C3B6E}},
        {"United Kingdom", {"British", "UK_PROPAGANDA", 0x012169}},
        {"France", {"French", "FRANCE_PROPAGANDA", 0xEF4135}},
        {"Switzerland", {"Swiss", "SWISS_PROPAGANDA", 0xFF0000}},
        {"Germany", {"German", "GERMANY_PROPAGANDA", 0xDD0000}},
        {"Poland", {"Polish", "POLAND_PROPAGANDA", 0xDC143C}},
        {"Russia", {"Russian", "RUSSIA_PROPAGANDA", 0xD52B1E}},
        {"GAME_INFO", {"Gameplay", "GAME_INFO", 0xFFD700}},
    };
    
    auto it = styles.find(country);
    return it != styles.end() ? it->second : styles.at("USA");
}

DestructibleState vehicleState(const glm::vec2& position, const std::string& name,
                               const std::string& country, int points, const BoundsConfig& bounds) {
    DestructibleState state;
    state.position = position;
    state.name = name;
    state.country = country;
    state.pointValue = points;
    state.bounds = bounds;
    return state;
}

} // namespace

// ============================================================================
// GOLF CART
// ============================================================================

GolfCart::GolfCart(float x, float patrolMinX, float patrolMaxX, EffectSink* effects)
    : Destructible(EntityKind::GolfCart,
                   vehicleState({x, 0.0f}, "Presidential Getaway", "USA", POINTS,
                                {60.0f, 55.0f, BoundsAlignment::Top, 10.0f}),
                   effects)
    , patrolMinX_(patrolMinX)
    , patrolMaxX_(patrolMaxX) {
}

void GolfCart::update(const TerrainQuery& terrain, const glm::vec2& playerPosition, TimeMs now) {
    if (isDestroyed()) return;
    
    float& x = state_.position.x;
    
    if (glm::length(state_.position - playerPosition) < FLEE_DISTANCE) {
        fleeingUntil_ = now + FLEE_DURATION_MS;
        fleeDirection_ = playerPosition.x < x ? 1 : -1;
    }
    
    if (now < fleeingUntil_) {
        x += FLEE_SPEED * static_cast<float>(fleeDirection_);
        direction_ = fleeDirection_;
    } else {
        x += PATROL_SPEED * static_cast<float>(direction_);
        if (x >= patrolMaxX_) {
            x = patrolMaxX_;
            direction_ = -1;
        } else if (x <= patrolMinX_) {
            x = patrolMinX_;
            direction_ = 1;
        }
    }
    
    // Wheels on the ground
    state_.position.y = terrain.getTerrainHeightAt(x) - 10.0f;
}

std::array<glm::vec2, 3> GolfCart::getScatterPositions() const {
    const glm::vec2& p = state_.position;
    return {
        glm::vec2(p.x - 40.0f, p.y - 20.0f),
        glm::vec2(p.x, p.y - 30.0f),
        glm::vec2(p.x + 40.0f, p.y - 20.0f)
    };
}

void GolfCart::onExplode() {
    if (EffectSink* fx = effects()) {
        fx->spawnEffect(EffectKind::Explosion, state_.position.x, state_.position.y - 25.0f);
        fx->spawnEffect(EffectKind::Debris, state_.position.x, state_.position.y - 25.0f);
    }
}

// ============================================================================
// FISHER BOAT
// ============================================================================

FisherBoat::FisherBoat(float x, float waterY, EffectSink* effects)
    : Destructible(EntityKind::FisherBoat,
                   vehicleState({x, waterY}, "Drug Kingpin boat", "Atlantic Ocean", POINTS,
                                {70.0f, 50.0f, BoundsAlignment::Top, 20.0f}),
                   effects)
    , bobbing_(waterY, BobbingParams{8.0f, 1.5f, 0.04f, 0.7f, 0.3f}) {
}

void FisherBoat::onExplode() {
    if (EffectSink* fx = effects()) {
        fx->spawnEffect(EffectKind::Explosion, state_.position.x, state_.position.y - 20.0f);
        fx->spawnEffect(EffectKind::WaterSplash, state_.position.x, bobbing_.getBaseY());
    }
}

// ============================================================================
// GREENLAND ICE
// ============================================================================

GreenlandIce::GreenlandIce(float x, float waterY, EffectSink* effects)
    : Destructible(EntityKind::GreenlandIce,
                   vehicleState({x, waterY}, "Greenland Ice", "Atlantic Ocean", POINTS,
                                {90.0f, 60.0f, BoundsAlignment::Top, 20.0f}),
                   effects)
    , bobbing_(waterY) {
}

void GreenlandIce::onExplode() {
    if (EffectSink* fx = effects()) {
        fx->spawnEffect(EffectKind::Debris, state_.position.x, state_.position.y - 30.0f);
        fx->spawnEffect(EffectKind::WaterSplash, state_.position.x, bobbing_.getBaseY());
    }
}

// ============================================================================
// BIPLANE
// ============================================================================

Biplane::Biplane(const glm::vec2& spawn, const std::string& country, const std::string& message,
                 int direction, EffectSink* effects)
    : Destructible(EntityKind::Biplane,
                   vehicleState(spawn, std::string(propagandaStyleFor(country).adjective) + " Propaganda Plane",
                                country, POINTS, {70.0f, 35.0f, BoundsAlignment::Center, 0.0f}),
                   effects)
    , message_(message)
    , propagandaType_(propagandaStyleFor(country).propagandaType)
    , accentColor_(propagandaStyleFor(country).accentColor)
    , direction_(direction >= 0 ? 1 : -1)
    , baseY_(spawn.y) {
}

void Biplane::update(TimeMs now, float cameraX) {
    if (isDestroyed()) return;
    
    if (waiting_) {
        if (now < waitUntil_) return;
        
        // Re-enter from the side it left
        state_.position.x = direction_ == 1 ? cameraX - 200.0f : cameraX + GAME_WIDTH + 200.0f;
        waiting_ = false;
        state_.visible = true;
    }
    
    state_.position.x += SPEED * static_cast<float>(direction_);
    state_.position.y = baseY_ + std::sin(static_cast<float>(now) * 0.003f) * 3.0f;
    state_.rotation = std::sin(static_cast<float>(now) * 0.002f) * 0.02f;
    
    if (state_.position.x < cameraX - EXIT_MARGIN ||
        state_.position.x > cameraX + GAME_WIDTH + EXIT_MARGIN) {
        waiting_ = true;
        waitUntil_ = now + REENTRY_DELAY_MS;
        state_.visible = false;
    }
}

BannerDrop Biplane::getBannerDrop() const {
    BannerDrop banner;
    banner.position = glm::vec2(state_.position.x - 50.0f, state_.position.y);
    banner.propagandaType = propagandaType_;
    banner.message = message_;
    banner.accentColor = accentColor_;
    return banner;
}

void Biplane::onExplode() {
    if (EffectSink* fx = effects()) {
        fx->spawnEffect(EffectKind::Explosion, state_.position.x, state_.position.y);
        fx->spawnEffect(EffectKind::Debris, state_.position.x, state_.position.y);
    }
}

} // namespace Lander
