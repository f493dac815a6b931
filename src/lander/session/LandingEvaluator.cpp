/**
 * LandingEvaluator.cpp
 */

#include "LandingEvaluator.h"
#include <cmath>

namespace Lander {

const char* landingTypeName(LandingType type) {
    switch (type) {
        case LandingType::Normal: return "normal";
        case LandingType::Victory: return "victory";
        case LandingType::WashingtonMedal: return "washington_medal";
        case LandingType::WashingtonIce: return "washington_ice";
    }
    return "normal";
}

LandingValidation LandingEvaluator::isValidLandingPosition(float shuttleX, float shuttleY,
                                                           float padX, float padY, float padWidth) {
    float shuttleBottom = shuttleY + SHUTTLE_BOTTOM_OFFSET;
    float distanceFromPad = padY - shuttleBottom;   // Positive above the pad
    
    if (std::abs(shuttleX - padX) > padWidth * 0.5f) {
        return {false, "not horizontally aligned"};
    }
    
    if (distanceFromPad < -VERTICAL_TOLERANCE_BELOW || distanceFromPad > VERTICAL_TOLERANCE_ABOVE) {
        return {false, "not on pad surface"};
    }
    
    return {true, ""};
}

LandingType LandingEvaluator::getLandingType(const LandingPadInfo& pad, bool hasPeaceMedal,
                                             bool hasGreenlandIce, GameMode mode) {
    if (pad.isFinalDestination && mode != GameMode::Dogfight) {
        return LandingType::Victory;
    }
    if (pad.isWashington && hasGreenlandIce) {
        return LandingType::WashingtonIce;
    }
    if (pad.isWashington && !hasPeaceMedal && mode != GameMode::Dogfight) {
        return LandingType::WashingtonMedal;
    }
    return LandingType::Normal;
}

std::string LandingEvaluator::getLandingSoundKey(LandingQuality quality) {
    return std::string("landing_") + landingQualityName(quality);
}

} // namespace Lander
