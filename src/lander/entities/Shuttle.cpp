/**
 * Shuttle.cpp
 */

#include "Shuttle.h"
#include "../economy/FuelTank.h"
#include <glm/gtc/constants.hpp>
#include <cmath>

namespace Lander {

namespace {

float wrapAngle(float angle) {
    const float twoPi = glm::two_pi<float>();
    angle = std::fmod(angle + glm::pi<float>(), twoPi);
    if (angle < 0.0f) angle += twoPi;
    return angle - glm::pi<float>();
}

} // namespace

Shuttle::Shuttle(const glm::vec2& spawn)
    : position_(spawn) {
}

void Shuttle::update(const ShuttleControls& controls, FuelTank& fuel) {
    if (!active_) return;
    
    if (controls.toggleLegs) {
        legsExtended_ = !legsExtended_;
    }
    
    bool canThrust = controls.thrust && !fuel.isEmpty();
    
    if (parked_) {
        if (!canThrust) {
            thrusting_ = false;
            return;
        }
        parked_ = false;
        launched_ = true;
    }
    
    // Rotation
    if (controls.rotateLeft) {
        angularVelocity_ = -ROTATION_SPEED;
    } else if (controls.rotateRight) {
        angularVelocity_ = ROTATION_SPEED;
    } else {
        angularVelocity_ *= ROTATION_DAMPING;
    }
    rotation_ += angularVelocity_;
    
    // Thrust along the nose
    if (canThrust) {
        float rate = legsExtended_ ? FuelTank::CONSUMPTION_RATE * FuelTank::LEGS_EXTENDED_FACTOR
                                   : FuelTank::CONSUMPTION_RATE;
        fuel.consume(rate);
        
        float angle = rotation_ - glm::half_pi<float>();
        float power = THRUST_ACCELERATION * thrustMultiplier_ * (legsExtended_ ? LEGS_THRUST_FACTOR : 1.0f);
        velocity_ += glm::vec2(std::cos(angle), std::sin(angle)) * power;
        thrusting_ = true;
    } else {
        thrusting_ = false;
    }
    
    velocity_.y += GRAVITY;
    velocity_ *= AIR_DRAG;
    if (legsExtended_) {
        velocity_.x *= 0.98f;
        velocity_.y *= 0.99f;
    }
    
    position_ += velocity_;
}

Rect Shuttle::getHullBounds() const {
    return Rect{position_.x - HULL_WIDTH * 0.5f, position_.y - HULL_HEIGHT * 0.5f, HULL_WIDTH, HULL_HEIGHT};
}

void Shuttle::explode() {
    active_ = false;
    thrusting_ = false;
    velocity_ = glm::vec2(0.0f);
    angularVelocity_ = 0.0f;
}

void Shuttle::settle(float padSurfaceY) {
    position_.y = padSurfaceY - BOTTOM_OFFSET;
    velocity_ = glm::vec2(0.0f);
    angularVelocity_ = 0.0f;
    thrusting_ = false;
    parked_ = true;
}

LandingSafety Shuttle::checkLandingSafety() const {
    LandingSafety result;
    
    if (!legsExtended_) {
        result.reason = "Landing gear not deployed!";
        return result;
    }
    
    if (std::abs(wrapAngle(rotation_)) > MAX_SAFE_LANDING_ANGLE) {
        result.reason = "Bad angle!";
        return result;
    }
    
    float speed = getSpeed();
    if (speed <= MAX_SAFE_LANDING_VELOCITY * 0.5f) {
        result.safe = true;
        result.quality = LandingQuality::Perfect;
    } else if (speed <= MAX_SAFE_LANDING_VELOCITY) {
        result.safe = true;
        result.quality = LandingQuality::Good;
    } else {
        result.reason = "Too fast!";
    }
    
    return result;
}

ThrustInfo Shuttle::getThrustInfo() const {
    ThrustInfo info;
    info.isThrusting = thrusting_ && active_;
    
    // Exhaust points out of the tail, opposite the nose
    float angle = rotation_ + glm::half_pi<float>();
    info.direction = glm::vec2(std::cos(angle), std::sin(angle));
    info.position = position_ + info.direction * BOTTOM_OFFSET;
    info.vehicleX = position_.x;
    return info;
}

} // namespace Lander
