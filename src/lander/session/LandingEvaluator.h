/**
 * LandingEvaluator.h
 * 
 * Landing pad touchdown rules
 * 
 * Features:
 * - Pad surface validation (horizontal alignment, vertical tolerance)
 * - Debounce of repeated touchdowns
 * - Start pad ignored until the shuttle has actually flown
 * - Landing type selection (victory, Washington deliveries, normal)
 * - Landing quality bonus and audio cue
 */

#pragma once

#include "../core/Types.h"
#include "../core/WorldLayout.h"
#include "../economy/TradeEconomy.h"
#include <string>

namespace Lander {

enum class LandingType {
    Normal,
    Victory,
    WashingtonMedal,
    WashingtonIce
};

const char* landingTypeName(LandingType type);

struct LandingValidation {
    bool valid = false;
    std::string reason;
};

class LandingEvaluator {
public:
    static constexpr float SHUTTLE_BOTTOM_OFFSET = 18.0f;
    static constexpr float VERTICAL_TOLERANCE_ABOVE = 10.0f;
    static constexpr float VERTICAL_TOLERANCE_BELOW = 5.0f;
    static constexpr TimeMs LANDING_DEBOUNCE_MS = 1000.0;
    static constexpr float START_PAD_VELOCITY_THRESHOLD = 0.5f;
    
    /** Shuttle center must be over the pad and its bottom on the pad surface */
    static LandingValidation isValidLandingPosition(float shuttleX, float shuttleY,
                                                    float padX, float padY, float padWidth);
    
    static bool shouldDebounce(TimeMs lastLandingTime, TimeMs now) {
        return now - lastLandingTime < LANDING_DEBOUNCE_MS;
    }
    
    /** The start pad counts only once the shuttle has picked up speed */
    static bool shouldIgnoreStartPad(int padIndex, int startPadIndex, float shuttleSpeed) {
        if (padIndex != startPadIndex) return false;
        return shuttleSpeed < START_PAD_VELOCITY_THRESHOLD;
    }
    
    static LandingType getLandingType(const LandingPadInfo& pad, bool hasPeaceMedal,
                                      bool hasGreenlandIce, GameMode mode);
    
    static float getLandingBonus(LandingQuality quality) { return Lander::getLandingBonus(quality); }
    
    static std::string getLandingSoundKey(LandingQuality quality);
};

} // namespace Lander
