/**
 * Destructible.cpp
 */

#include "Destructible.h"
#include <cmath>

namespace Lander {

const char* entityKindName(EntityKind kind) {
    switch (kind) {
        case EntityKind::Building: return "building";
        case EntityKind::MedalHouse: return "medal_house";
        case EntityKind::Cannon: return "cannon";
        case EntityKind::GolfCart: return "golf_cart";
        case EntityKind::FisherBoat: return "fisher_boat";
        case EntityKind::OilTower: return "oil_tower";
        case EntityKind::GreenlandIce: return "greenland_ice";
        case EntityKind::Shark: return "shark";
        case EntityKind::Biplane: return "biplane";
        default: return "unknown";
    }
}

Destructible::Destructible(EntityKind kind, DestructibleState state, EffectSink* effects)
    : state_(std::move(state))
    , kind_(kind)
    , effects_(effects) {
}

ExplosionResult Destructible::explode() {
    if (state_.destroyed) {
        return {state_.name, 0};
    }
    
    state_.destroyed = true;
    state_.visible = false;
    
    ++explodeHookCount_;
    onExplode();
    
    return {state_.name, state_.pointValue};
}

void BobbingMotion::apply(DestructibleState& state, float waveOffset) const {
    if (state.destroyed || attached_) return;
    
    state.position.y = baseY_ + std::sin(waveOffset * params_.frequency) * params_.amplitude;
    state.rotation = std::sin(waveOffset * params_.rotationFrequency + params_.rotationPhase) *
                     params_.rotationAmplitude;
}

} // namespace Lander
