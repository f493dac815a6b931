/**
 * AirTraffic.h
 * 
 * Spawns the propaganda biplane and keeps shuttles from flying through it
 * 
 * Features:
 * - One plane per run, themed on a random country or on gameplay tips
 * - Appears when a shuttle closes on the chosen country
 * - Shuttles that touch the plane bounce off with a "boing"
 */

#pragma once

#include "../core/Types.h"
#include <glm/glm.hpp>
#include <random>
#include <string>
#include <vector>

namespace Lander {

class WorldLayout;
class AudioCue;
class EffectSink;
class Biplane;
class Shuttle;
struct WorldEntities;

class AirTraffic {
public:
    static constexpr float SPAWN_DISTANCE = 1500.0f;
    static constexpr float SPAWN_OFFSET = 400.0f;
    static constexpr float BOUNCE_STRENGTH = 8.0f;
    static constexpr float INFO_PLANE_CHANCE = 0.3f;
    static constexpr const char* INFO_PLANE = "GAME_INFO";
    
    AirTraffic(const WorldLayout& layout, WorldEntities& entities, AudioCue* audio = nullptr,
               EffectSink* effects = nullptr, uint32_t seed = std::random_device{}());
    
    /** Choose the plane's theme for a fresh run */
    void initialize();
    
    /**
     * Spawn when due, move the plane and bounce touching shuttles
     * @param shuttles Active and inactive shuttles; inactive ones are ignored
     */
    void update(TimeMs now, float cameraX, const std::vector<Shuttle*>& shuttles);
    
    const std::string& getTargetCountry() const { return targetCountry_; }
    bool hasSpawned() const { return spawned_; }
    
    /** The live plane, or nullptr before spawn and after destruction */
    Biplane* getBiplane() const;
    
    void clear();
    
private:
    void checkSpawn(const std::vector<Shuttle*>& shuttles);
    void spawnOver(const std::string& country, float playerX);
    void bounceShuttles(const Biplane& biplane, const std::vector<Shuttle*>& shuttles);
    
    const std::string& pickMessage(const std::string& theme);
    
    const WorldLayout& layout_;
    WorldEntities& entities_;
    AudioCue* audio_;
    EffectSink* effects_;
    std::mt19937 rng_;
    
    std::string targetCountry_;
    bool spawned_ = false;
};

} // namespace Lander
