/**
 * OceanManager.h
 * 
 * Atlantic sea life and floating objects
 * 
 * Features:
 * - Sharks spread over patrol zones across the ocean
 * - Fisher boat with an occasional package, Greenland ice floe
 * - Golf cart patrolling near Washington
 * - Sunken bomb food that sharks hunt and eat, dropped once none can
 * - Shared wave phase for bobbing
 */

#pragma once

#include "../core/Types.h"
#include "../economy/CollectibleCatalog.h"
#include <glm/glm.hpp>
#include <random>
#include <vector>

namespace Lander {

class WorldLayout;
class TimerQueue;
class EffectSink;
class TerrainQuery;
struct WorldEntities;
struct QualityPreset;
struct Bomb;

struct SunkenFood {
    glm::vec2 position{0.0f};
    CollectibleType type = CollectibleType::Burger;
};

class OceanManager {
public:
    static constexpr float FISHER_BOAT_X = 3500.0f;
    static constexpr float BOAT_PACKAGE_CHANCE = 0.15f;
    static constexpr float GOLF_CART_CHANCE = 0.33f;
    static constexpr float GOLF_CART_X = 1000.0f;
    static constexpr float GOLF_CART_MIN_X = 800.0f;
    static constexpr float GOLF_CART_MAX_X = 1200.0f;
    static constexpr float WAVE_STEP = 0.02f;
    static constexpr float BOAT_PROXIMITY_X = 150.0f;
    static constexpr float BOAT_PROXIMITY_Y = 100.0f;
    
    OceanManager(const WorldLayout& layout, WorldEntities& entities, TimerQueue& timers,
                 EffectSink* effects, uint32_t seed = std::random_device{}());
    
    /** Spawn sharks, boat, ice (not in dogfight) and maybe the golf cart */
    void populate(GameMode mode);
    
    /**
     * One tick of sea life.
     * Sharks always update; boat and ice bob only with entity updates enabled.
     */
    void update(TimeMs now, const QualityPreset& preset, float pollutionLevel,
                const TerrainQuery& terrain, const std::vector<glm::vec2>& shuttlePositions,
                const std::vector<Bomb>& bombs);
    
    /** Bomb food coming to rest on the sea floor */
    void addSunkenFood(const glm::vec2& position, CollectibleType type);
    const std::vector<SunkenFood>& getSunkenFood() const { return sunkenFood_; }
    
    /** At least one shark is still able to eat */
    bool hasHungrySharks() const;
    
    float getWaveOffset() const { return waveOffset_; }
    float getWaterSurface() const;
    
    /** A shuttle is hovering close to the fisher boat */
    bool isShuttleNearBoat() const { return shuttleNearBoat_; }
    
    void clear();
    
private:
    void spawnSharks();
    void spawnGreenlandIce();
    std::vector<glm::vec2> collectFoodTargets(const std::vector<Bomb>& bombs) const;
    void feedSharks(TimeMs now);
    
    const WorldLayout& layout_;
    WorldEntities& entities_;
    TimerQueue& timers_;
    EffectSink* effects_;
    std::mt19937 rng_;
    
    std::vector<SunkenFood> sunkenFood_;
    float waveOffset_ = 0.0f;
    bool shuttleNearBoat_ = false;
};

} // namespace Lander
