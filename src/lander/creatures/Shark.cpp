/**
 * Shark.cpp
 */

#include "Shark.h"
#include "../core/Collaborators.h"
#include "../core/TimerQueue.h"
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>

namespace Lander {

const char* sharkStateName(SharkState state) {
    switch (state) {
        case SharkState::Alive: return "alive";
        case SharkState::Coughing: return "coughing";
        case SharkState::Dead: return "dead";
        default: return "unknown";
    }
}

namespace {

DestructibleState sharkState(float x, float y) {
    DestructibleState state;
    state.position = glm::vec2(x, y);
    state.name = "Atlantic Shark";
    state.country = "Atlantic Ocean";
    state.pointValue = Shark::POINTS;
    state.bounds = {80.0f, 30.0f, BoundsAlignment::Center, 0.0f};
    return state;
}

} // namespace

Shark::Shark(float x, float depth, float patrolMinX, float patrolMaxX, EffectSink* effects)
    : Destructible(EntityKind::Shark, sharkState(x, waterSurface() + depth), effects)
    , baseY_(waterSurface() + depth)
    , patrolMinX_(patrolMinX)
    , patrolMaxX_(patrolMaxX) {
}

void Shark::update(float waveOffset, float pollutionLevel, const std::vector<glm::vec2>& foodTargets) {
    if (isDestroyed()) return;
    
    updatePollutionState(pollutionLevel);
    
    if (mood_ == SharkState::Dead) {
        floatToSurface(waveOffset);
        return;
    }
    
    findNearestFood(foodTargets);
    
    float moveSpeed = mood_ == SharkState::Coughing ? SPEED * 0.5f : SPEED;
    float chaseSpeed = moveSpeed * CHASE_FACTOR;
    glm::vec2& pos = state_.position;
    
    if (hasTarget_) {
        glm::vec2 delta = targetFood_ - pos;
        float dist = glm::length(delta);
        
        if (dist > 5.0f) {
            direction_ = delta.x > 0.0f ? 1 : -1;
            pos.x += (delta.x / dist) * chaseSpeed;
            pos.y += (delta.y / dist) * chaseSpeed * 0.5f;
        }
    } else {
        pos.x += moveSpeed * static_cast<float>(direction_);
        
        if (pos.x <= patrolMinX_) {
            direction_ = 1;
        } else if (pos.x >= patrolMaxX_) {
            direction_ = -1;
        }
        
        pos.y = baseY_ + std::sin(waveOffset * 0.5f + pos.x * 0.01f) * 5.0f;
    }
    
    if (mood_ == SharkState::Coughing) {
        ++coughTimer_;
        if (coughTimer_ % COUGH_INTERVAL_TICKS == 0) {
            if (EffectSink* fx = effects()) {
                glm::vec2 mouth = mouthPosition();
                fx->spawnEffect(EffectKind::CoughBubbles, mouth.x, mouth.y);
            }
        }
    }
}

void Shark::updatePollutionState(float pollutionLevel) {
    if (mood_ == SharkState::Dead) return;
    
    if (pollutionLevel >= LETHAL_POLLUTION) {
        die();
    } else if (pollutionLevel >= COUGH_POLLUTION) {
        if (mood_ == SharkState::Alive) {
            mood_ = SharkState::Coughing;
        }
    } else if (mood_ == SharkState::Coughing) {
        mood_ = SharkState::Alive;
    }
}

void Shark::findNearestFood(const std::vector<glm::vec2>& foodTargets) {
    float nearestDist = DETECTION_RANGE;
    hasTarget_ = false;
    
    for (const auto& food : foodTargets) {
        float dist = glm::length(food - state_.position);
        if (dist < nearestDist) {
            nearestDist = dist;
            targetFood_ = food;
            hasTarget_ = true;
        }
    }
}

void Shark::floatToSurface(float waveOffset) {
    float targetY = waterSurface() + 5.0f;
    
    floatProgress_ = std::min(1.0f, floatProgress_ + FLOAT_STEP);
    state_.position.y = glm::mix(baseY_, targetY, floatProgress_);
    state_.rotation = glm::mix(0.0f, glm::pi<float>(), floatProgress_);
    
    if (floatProgress_ < 1.0f) return;
    
    state_.position.y = targetY + std::sin(waveOffset) * 3.0f;
    
    if (!reachedSurface_) {
        reachedSurface_ = true;
        surfaceTimer_ = 0;
    }
    
    ++surfaceTimer_;
    if (surfaceTimer_ > SURFACE_FUME_DELAY_TICKS) {
        ++fumeTimer_;
        if (fumeTimer_ % FUME_INTERVAL_TICKS == 0) {
            if (EffectSink* fx = effects()) {
                fx->spawnEffect(EffectKind::ToxicFumes, state_.position.x, state_.position.y - 5.0f);
            }
        }
    }
}

bool Shark::eatBomb(TimerQueue& timers, TimeMs now) {
    if (!canEatBomb() || isDestroyed()) return false;
    
    ++foodEaten_;
    
    glm::vec2 mouth = mouthPosition();
    EffectSink* fx = effects();
    if (fx) {
        fx->spawnEffect(EffectKind::SharkGulp, mouth.x, mouth.y);
    }
    
    if (foodEaten_ >= FATAL_FOOD_COUNT) {
        die();
    }
    
    std::weak_ptr<bool> alive = lifeToken_;
    timers.schedule(now, BURP_DELAY_MS, [this, alive, fx]() {
        if (alive.expired() || isDestroyed() || !fx) return;
        glm::vec2 burp = mouthPosition();
        fx->spawnEffect(EffectKind::BurpBubbles, burp.x, burp.y);
    });
    
    return true;
}

Rect Shark::getEatingBounds() const {
    return Rect{state_.position.x - 60.0f, state_.position.y - 30.0f, 120.0f, 60.0f};
}

SharkExplosion Shark::explodeShark() {
    bool wasDead = mood_ == SharkState::Dead;
    ExplosionResult result = explode();
    return {result.name, result.points, wasDead};
}

void Shark::onExplode() {
    if (EffectSink* fx = effects()) {
        fx->spawnEffect(EffectKind::Explosion, state_.position.x, state_.position.y);
        fx->spawnEffect(EffectKind::WaterSplash, state_.position.x, waterSurface());
    }
}

void Shark::die() {
    mood_ = SharkState::Dead;
    floatProgress_ = 0.0f;
    hasTarget_ = false;
}

glm::vec2 Shark::mouthPosition() const {
    return glm::vec2(state_.position.x + 35.0f * static_cast<float>(direction_), state_.position.y);
}

} // namespace Lander
