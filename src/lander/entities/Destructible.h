/**
 * Destructible.h
 * 
 * Shared destruction contract for world objects
 * 
 * Features:
 * - Collision bounds derived on demand from position and box config
 * - Idempotent one-shot explode() with a per-variant hook
 * - Sinusoidal bobbing for floating objects
 */

#pragma once

#include "../core/Types.h"
#include <glm/glm.hpp>
#include <string>

namespace Lander {

class EffectSink;

enum class EntityKind {
    Building,
    MedalHouse,
    Cannon,
    GolfCart,
    FisherBoat,
    OilTower,
    GreenlandIce,
    Shark,
    Biplane
};

const char* entityKindName(EntityKind kind);

/**
 * Payout of a single explode() call
 */
struct ExplosionResult {
    std::string name;
    int points = 0;
};

/**
 * State every destructible variant carries
 */
struct DestructibleState {
    glm::vec2 position{0.0f};
    float rotation = 0.0f;
    std::string name;
    std::string country;
    int pointValue = 0;
    BoundsConfig bounds;
    bool destroyed = false;
    bool visible = true;
};

// ============================================================================
// DESTRUCTIBLE
// ============================================================================

class Destructible {
public:
    Destructible(EntityKind kind, DestructibleState state, EffectSink* effects = nullptr);
    virtual ~Destructible() = default;
    
    Destructible(const Destructible&) = delete;
    Destructible& operator=(const Destructible&) = delete;
    
    /**
     * Destroy the object.
     * First call: marks destroyed, hides it, runs onExplode() and returns the
     * point value. Later calls return {name, 0} and do nothing else.
     */
    ExplosionResult explode();
    
    /** Recomputed from the current position on every call */
    Rect getCollisionBounds() const { return state_.bounds.at(state_.position); }
    
    EntityKind getKind() const { return kind_; }
    bool isDestroyed() const { return state_.destroyed; }
    bool isVisible() const { return state_.visible; }
    
    const std::string& getName() const { return state_.name; }
    const std::string& getCountry() const { return state_.country; }
    int getPointValue() const { return state_.pointValue; }
    
    const glm::vec2& getPosition() const { return state_.position; }
    float getX() const { return state_.position.x; }
    float getY() const { return state_.position.y; }
    void setPosition(const glm::vec2& position) { state_.position = position; }
    float getRotation() const { return state_.rotation; }
    
    /** Number of times the explode hook has run (0 or 1) */
    int getExplodeHookCount() const { return explodeHookCount_; }
    
protected:
    /** Variant-specific side effects, run once on the first explode() */
    virtual void onExplode() = 0;
    
    EffectSink* effects() const { return effects_; }
    
    DestructibleState state_;
    
private:
    EntityKind kind_;
    EffectSink* effects_;
    int explodeHookCount_ = 0;
};

// ============================================================================
// BOBBING
// ============================================================================

struct BobbingParams {
    float amplitude = 6.0f;
    float frequency = 1.2f;
    float rotationAmplitude = 0.04f;
    float rotationFrequency = 0.7f;
    float rotationPhase = 0.3f;
};

/**
 * Wave-driven vertical and rotational offset for floating objects
 */
class BobbingMotion {
public:
    BobbingMotion(float baseY, const BobbingParams& params = {})
        : baseY_(baseY), params_(params) {}
    
    /**
     * Apply the offset for a wave phase. Frozen once the owner is destroyed
     * or attached to a carrier.
     */
    void apply(DestructibleState& state, float waveOffset) const;
    
    float getBaseY() const { return baseY_; }
    void setBaseY(float baseY) { baseY_ = baseY; }
    
    bool isAttached() const { return attached_; }
    void setAttached(bool attached) { attached_ = attached; }
    
    const BobbingParams& getParams() const { return params_; }
    
private:
    float baseY_;
    BobbingParams params_;
    bool attached_ = false;
};

} // namespace Lander
