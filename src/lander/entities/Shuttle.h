/**
 * Shuttle.h
 * 
 * Player vehicle flight model
 * 
 * Features:
 * - Gravity, air drag and rotational thrust
 * - Landing legs (extra drag, weaker thrust, higher burn)
 * - Thrust multiplier for timed boosts
 * - Parked on its start pad until the first thrust
 * - Landing safety grading
 */

#pragma once

#include "../core/Types.h"
#include "../economy/TradeEconomy.h"
#include "../world/ScorchField.h"
#include <glm/glm.hpp>
#include <optional>
#include <string>

namespace Lander {

class FuelTank;

struct ShuttleControls {
    bool thrust = false;
    bool rotateLeft = false;
    bool rotateRight = false;
    bool toggleLegs = false;
};

/**
 * Outcome of touching down on a pad
 */
struct LandingSafety {
    bool safe = false;
    std::optional<LandingQuality> quality;   // Set when safe
    std::string reason;                      // Set when not safe
};

class Shuttle {
public:
    static constexpr float GRAVITY = 0.125f;             // px/frame^2
    static constexpr float THRUST_ACCELERATION = 0.333f;
    static constexpr float LEGS_THRUST_FACTOR = 0.7f;
    static constexpr float ROTATION_SPEED = 0.04f;
    static constexpr float ROTATION_DAMPING = 0.95f;
    static constexpr float AIR_DRAG = 0.99f;
    static constexpr float HULL_WIDTH = 28.0f;
    static constexpr float HULL_HEIGHT = 36.0f;
    static constexpr float BOTTOM_OFFSET = 18.0f;
    static constexpr float MAX_SAFE_LANDING_VELOCITY = 5.0f;
    static constexpr float MAX_SAFE_LANDING_ANGLE = 0.5f;
    
    explicit Shuttle(const glm::vec2& spawn);
    
    /**
     * Advance one frame. Thrust burns fuel and is skipped when the tank is empty.
     * A parked shuttle stays put until the first thrust.
     */
    void update(const ShuttleControls& controls, FuelTank& fuel);
    
    const glm::vec2& getPosition() const { return position_; }
    void setPosition(const glm::vec2& position) { position_ = position; }
    
    const glm::vec2& getVelocity() const { return velocity_; }
    void setVelocity(const glm::vec2& velocity) { velocity_ = velocity; }
    float getSpeed() const { return glm::length(velocity_); }
    
    float getRotation() const { return rotation_; }
    void setRotation(float rotation) { rotation_ = rotation; }
    
    float getBottom() const { return position_.y + BOTTOM_OFFSET; }
    Rect getHullBounds() const;
    
    bool isActive() const { return active_; }
    bool isThrusting() const { return thrusting_; }
    bool isParked() const { return parked_; }
    
    /** Set when the first thrust lifts off the start pad */
    bool hasLaunched() const { return launched_; }
    
    bool areLegsExtended() const { return legsExtended_; }
    void setLegsExtended(bool extended) { legsExtended_ = extended; }
    
    /** Scales thrust (speed boost); fuel burn is unchanged */
    float getThrustMultiplier() const { return thrustMultiplier_; }
    void setThrustMultiplier(float multiplier) { thrustMultiplier_ = multiplier; }
    
    /** Destroyed: stops thrusting and freezes */
    void explode();
    
    /** Put down on a pad: velocity and spin cleared, parked until next thrust */
    void settle(float padSurfaceY);
    
    LandingSafety checkLandingSafety() const;
    
    /** Exhaust ray for scorching */
    ThrustInfo getThrustInfo() const;
    
private:
    glm::vec2 position_;
    glm::vec2 velocity_{0.0f};
    float rotation_ = 0.0f;
    float angularVelocity_ = 0.0f;
    float thrustMultiplier_ = 1.0f;
    bool active_ = true;
    bool thrusting_ = false;
    bool parked_ = true;
    bool launched_ = false;
    bool legsExtended_ = false;
};

} // namespace Lander
