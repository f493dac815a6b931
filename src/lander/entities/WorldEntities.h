/**
 * WorldEntities.h
 * 
 * Owning collections of every destructible in the world, one per category
 */

#pragma once

#include "Structures.h"
#include "Vehicles.h"
#include "../creatures/Shark.h"
#include <memory>
#include <vector>

namespace Lander {

struct WorldEntities {
    std::vector<std::unique_ptr<Destructible>> buildings;   // Building or MedalHouse
    std::vector<std::unique_ptr<Cannon>> cannons;
    std::unique_ptr<GolfCart> golfCart;
    std::unique_ptr<FisherBoat> fisherBoat;
    std::vector<std::unique_ptr<OilTower>> oilTowers;
    std::unique_ptr<GreenlandIce> greenlandIce;
    std::vector<std::unique_ptr<Shark>> sharks;
    std::vector<std::unique_ptr<Biplane>> biplanes;
    
    /**
     * Remove destroyed entities from every collection
     * @return Number removed
     */
    size_t pruneDestroyed();
    
    /** Bounds of standing buildings, for surface queries */
    std::vector<Rect> getBuildingBounds() const;
    
    size_t countAlive() const;
    
    void clear();
};

} // namespace Lander
