/**
 * FuelTank.cpp
 */

#include "FuelTank.h"
#include <glm/glm.hpp>

namespace Lander {

FuelTank::FuelTank(float maxFuel)
    : fuel_(maxFuel), maxFuel_(maxFuel) {
}

bool FuelTank::consume(float amount) {
    if (fuel_ <= 0.0f) return false;
    
    fuel_ = glm::max(0.0f, fuel_ - amount);
    notifyChange();
    return true;
}

void FuelTank::add(float amount) {
    fuel_ = glm::min(maxFuel_, fuel_ + amount);
    notifyChange();
}

void FuelTank::setFuel(float fuel) {
    fuel_ = glm::clamp(fuel, 0.0f, maxFuel_);
    notifyChange();
}

void FuelTank::reset() {
    fuel_ = maxFuel_;
    notifyChange();
}

void FuelTank::notifyChange() {
    if (onChange_) {
        onChange_(fuel_, maxFuel_);
    }
}

} // namespace Lander
