/**
 * BombCollisionResolver.h
 * 
 * Per-frame bomb collision resolution
 * 
 * Order per bomb (newest first):
 * 1. Drop bombs that already went off
 * 2. Opposing shuttle (two-player modes)
 * 3. Own shuttle, after the drop grace period
 * 4. Ground targets, only near the ground and when the throttle allows:
 *    buildings, cannons, golf cart, fisher boat, oil towers, ice, sharks
 * 5. Biplanes, whenever the throttle allows
 * 6. Terrain contact: sink over water, crater on land
 * 7. Silent discard below the world
 * 
 * The first hit ends the bomb; each destroyed target explodes exactly once.
 */

#pragma once

#include "BombManager.h"
#include "../core/Types.h"
#include <random>
#include <string>
#include <vector>

namespace Lander {

class AudioCue;
class EffectSink;
class ScoreSink;
class AchievementSink;
class MatchEvents;
class TerrainQuery;
class TimerQueue;
class WorldLayout;
class ScorchField;
class OceanManager;
class MatchState;
class Destructible;
struct WorldEntities;
struct QualityPreset;
struct PlayerState;

/**
 * Collaborators the resolver reports to
 */
struct ResolverServices {
    AudioCue& audio;
    EffectSink& effects;
    ScoreSink& score;
    AchievementSink& achievements;
    MatchEvents& events;
    const TerrainQuery& terrain;
    TimerQueue& timers;
};

/**
 * What happened during one resolve() call
 */
struct ResolveStats {
    int targetsDestroyed = 0;
    int vehicleHits = 0;
    int groundExplosions = 0;
    int sunk = 0;
    int eatenBySharks = 0;
    int discarded = 0;
    int groundSweeps = 0;
    bool matchEnded = false;
};

class BombCollisionResolver {
public:
    static constexpr float VEHICLE_HIT_RADIUS = 25.0f;
    static constexpr TimeMs SELF_HIT_GRACE_MS = 500.0;
    static constexpr float GROUND_PROXIMITY_BAND = 250.0f;
    static constexpr float TERRAIN_CONTACT_OFFSET = 5.0f;
    static constexpr float BUILDING_PREFILTER = 150.0f;
    static constexpr float DISCARD_Y = GAME_HEIGHT + 200.0f;
    static constexpr float SUNKEN_FOOD_DEPTH = 120.0f;
    static constexpr TimeMs SINK_DURATION_MS = 2000.0;
    static constexpr TimeMs KILL_CUE_DELAY_MS = 1000.0;
    static constexpr TimeMs BOMB_HIT_CUE_DELAY_MS = 1500.0;
    static constexpr int SHARK_MIN_AWARD = 500;
    
    BombCollisionResolver(const WorldLayout& layout, WorldEntities& entities, ScorchField& scorch,
                          OceanManager& ocean, MatchState& match, const ResolverServices& services,
                          uint32_t seed = std::random_device{}());
    
    /**
     * Resolve every bomb for this frame. Bombs that hit, sink or leave the
     * world are removed from the vector.
     * @param preset Read fresh from the governor each frame
     */
    ResolveStats resolve(std::vector<Bomb>& bombs, TimeMs now, const QualityPreset& preset);
    
    TimeMs getLastCollisionCheckTime() const { return lastCollisionCheckTime_; }
    
private:
    enum class VehicleOutcome { None, Hit, MatchEnded };
    
    VehicleOutcome checkOpponentHit(Bomb& bomb, TimeMs now);
    bool checkSelfHit(Bomb& bomb, TimeMs now);
    
    bool runGroundSweep(Bomb& bomb, TimeMs now);
    bool checkBuildings(Bomb& bomb, TimeMs now);
    bool checkCannons(Bomb& bomb);
    bool checkGolfCart(Bomb& bomb);
    bool checkFisherBoat(Bomb& bomb);
    bool checkOilTowers(Bomb& bomb);
    bool checkGreenlandIce(Bomb& bomb);
    bool checkSharks(Bomb& bomb);
    bool checkBiplanes(Bomb& bomb);
    
    void sinkBomb(Bomb& bomb, float waterLevel, TimeMs now);
    void explodeOnGround(Bomb& bomb, float terrainY);
    
    /** Bomb blast: flash, debris and a short shake */
    void detonate(Bomb& bomb);
    
    /** Shared bookkeeping for a destroyed target */
    void award(const std::string& name, const std::string& country, int points, float x, float y);
    
    void playExplosion(float volume);
    std::string pickCue(const char* prefix, int variants);
    
    static bool within(const Bomb& bomb, const Rect& bounds) { return bounds.contains(bomb.position); }
    static bool inRange(const Bomb& bomb, const PlayerState* player);
    
    const WorldLayout& layout_;
    WorldEntities& entities_;
    ScorchField& scorch_;
    OceanManager& ocean_;
    MatchState& match_;
    ResolverServices services_;
    std::mt19937 rng_;
    ResolveStats stats_;
    TimeMs lastCollisionCheckTime_ = -1.0e9;
};

} // namespace Lander
