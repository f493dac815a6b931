/**
 * PlayerState.h
 * 
 * Everything one pilot owns: shuttle, inventory, fuel and match record
 */

#pragma once

#include "../core/Types.h"
#include "../economy/FuelTank.h"
#include "../economy/InventorySystem.h"
#include "../entities/Shuttle.h"
#include <limits>
#include <string>

namespace Lander {

struct PlayerState {
    PlayerState(PlayerId number, const glm::vec2& spawn, uint32_t seed)
        : playerNum(number), shuttle(spawn), inventory(seed) {}
    
    PlayerId playerNum;
    Shuttle shuttle;
    InventorySystem inventory;
    FuelTank fuel;
    
    int kills = 0;
    std::string deathMessage;
    
    // Landing bookkeeping
    int startPadIndex = 0;
    TimeMs lastLandingTime = -std::numeric_limits<double>::infinity();
    TimeMs invulnerableUntil = 0.0;
    TimeMs speedBoostUntil = 0.0;       // 0 = no boost running
    bool hasPeaceMedal = false;
    bool carryingGreenlandIce = false;
    
    bool isActive() const { return shuttle.isActive(); }
};

} // namespace Lander
