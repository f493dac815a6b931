/**
 * WorldBuilder.h
 * 
 * One-shot population of the static world at session start
 * 
 * Features:
 * - Country buildings and landmarks on flat plateaus
 * - The medal house next to the Washington pad
 * - Cannons per country density, thinned by the quality preset
 * - The oil derrick on the mid-ocean platform
 */

#pragma once

#include <glm/glm.hpp>
#include <random>
#include <string>
#include <vector>

namespace Lander {

class WorldLayout;
class TerrainQuery;
class EffectSink;
struct WorldEntities;
struct QualityPreset;

struct WorldBuildStats {
    int buildings = 0;
    int cannons = 0;
    int oilTowers = 0;
    bool medalHouse = false;
};

class WorldBuilder {
public:
    static constexpr float PLATEAU_SPACING = 800.0f;
    static constexpr float PLATEAU_JITTER = 400.0f;
    static constexpr float PLACEMENT_CHANCE = 0.8f;
    static constexpr float LANDMARK_CHANCE = 0.3f;
    static constexpr float CANNON_CLEARANCE = 80.0f;
    static constexpr float CANNON_PAD_CLEARANCE = 200.0f;
    static constexpr float CANNON_SPACING = 500.0f;
    static constexpr float MEDAL_HOUSE_OFFSET = 120.0f;
    
    WorldBuilder(const WorldLayout& layout, const TerrainQuery& terrain, EffectSink* effects = nullptr,
                 uint32_t seed = std::random_device{}());
    
    /** Cannons first so buildings can keep their distance */
    WorldBuildStats build(WorldEntities& entities, const QualityPreset& preset);
    
    /**
     * How many cannons a country keeps at a given preset
     * @param fullCount Count at full density
     */
    static int thinnedCannonCount(int fullCount, float cannonMultiplier);
    
private:
    int buildCannons(WorldEntities& entities, float cannonMultiplier);
    int buildDecorations(WorldEntities& entities);
    bool buildMedalHouse(WorldEntities& entities);
    int buildOilTowers(WorldEntities& entities);
    
    bool isNearPad(float x, float extraMargin) const;
    
    const WorldLayout& layout_;
    const TerrainQuery& terrain_;
    EffectSink* effects_;
    std::mt19937 rng_;
};

} // namespace Lander
