/**
 * Collaborators.h
 * 
 * Narrow side-effect interfaces the simulation core calls into.
 * Rendering, audio and UI layers implement these; the core never awaits or
 * inspects their results.
 */

#pragma once

#include "Types.h"
#include <glm/glm.hpp>
#include <string>
#include <vector>

namespace Lander {

// ============================================================================
// AUDIO
// ============================================================================

class AudioCue {
public:
    virtual ~AudioCue() = default;
    
    virtual void playSound(const std::string& key, float volume = 1.0f) = 0;
    virtual void playSoundIfNotPlaying(const std::string& key) = 0;
};

// ============================================================================
// VISUAL EFFECTS
// ============================================================================

enum class EffectKind {
    Explosion,
    BombExplosion,
    Shockwave,
    WaterSplash,
    SinkBubbles,
    SharkGulp,
    CoughBubbles,
    BurpBubbles,
    ToxicFumes,
    OilBurst,
    ProjectileBurst,
    Debris,
    LightningWarning,
    LightningBolt
};

const char* effectKindName(EffectKind kind);

class EffectSink {
public:
    virtual ~EffectSink() = default;
    
    virtual void spawnEffect(EffectKind kind, float x, float y, float scale = 1.0f) = 0;
    virtual void shakeCamera(float durationMs, float intensity) = 0;
    
    /** Floating "+points" text */
    virtual void showDestructionPoints(float x, float y, int points, const std::string& name) = 0;
};

// ============================================================================
// WORLD QUERIES
// ============================================================================

class TerrainQuery {
public:
    virtual ~TerrainQuery() = default;
    
    /** Surface y at world x (y grows downward) */
    virtual float getTerrainHeightAt(float x) const = 0;
};

// ============================================================================
// SCORING AND PROGRESSION
// ============================================================================

class ScoreSink {
public:
    virtual ~ScoreSink() = default;
    
    virtual void addDestructionScore(int points) = 0;
    virtual void addDestroyedBuilding(const std::string& name, const std::string& country) = 0;
};

class AchievementSink {
public:
    virtual ~AchievementSink() = default;
    
    virtual void onBuildingDestroyed(const std::string& name, const std::string& country) = 0;
    virtual void onPlayerKill(PlayerId killer) = 0;
    virtual void onSharkKilled(bool wasAlreadyDead) = 0;
};

// ============================================================================
// MATCH FLOW
// ============================================================================

/**
 * Items thrown clear of a destroyed vehicle
 */
struct SecondaryDrop {
    std::string kind;
    std::vector<glm::vec2> positions;
};

/**
 * Propaganda banner released by a downed biplane
 */
struct BannerDrop {
    glm::vec2 position{0.0f};
    std::string propagandaType;
    std::string message;
    uint32_t accentColor = 0;
};

class MatchEvents {
public:
    virtual ~MatchEvents() = default;
    
    virtual void onVehicleCrash(PlayerId victim, const std::string& message, const std::string& cause) = 0;
    virtual void onProjectileHit(PlayerId victim) = 0;
    virtual void onDogfightWinner(PlayerId winner, int p1Kills, int p2Kills) = 0;
    virtual void onSecondaryDrop(const SecondaryDrop& drop) = 0;
    virtual void onBannerDrop(const BannerDrop& banner) = 0;
};

// ============================================================================
// NULL IMPLEMENTATIONS
// ============================================================================

class NullAudioCue : public AudioCue {
public:
    void playSound(const std::string&, float) override {}
    void playSoundIfNotPlaying(const std::string&) override {}
};

class NullEffectSink : public EffectSink {
public:
    void spawnEffect(EffectKind, float, float, float) override {}
    void shakeCamera(float, float) override {}
    void showDestructionPoints(float, float, int, const std::string&) override {}
};

class NullAchievementSink : public AchievementSink {
public:
    void onBuildingDestroyed(const std::string&, const std::string&) override {}
    void onPlayerKill(PlayerId) override {}
    void onSharkKilled(bool) override {}
};

class NullMatchEvents : public MatchEvents {
public:
    void onVehicleCrash(PlayerId, const std::string&, const std::string&) override {}
    void onProjectileHit(PlayerId) override {}
    void onDogfightWinner(PlayerId, int, int) override {}
    void onSecondaryDrop(const SecondaryDrop&) override {}
    void onBannerDrop(const BannerDrop&) override {}
};

/**
 * Flat terrain at a fixed height, used by the demo and tests
 */
class FlatTerrain : public TerrainQuery {
public:
    explicit FlatTerrain(float height = 600.0f) : height_(height) {}
    
    float getTerrainHeightAt(float) const override { return height_; }
    void setHeight(float height) { height_ = height; }
    
private:
    float height_;
};

/**
 * Land at one height with a band of open water at the sea surface
 */
class CoastalTerrain : public TerrainQuery {
public:
    CoastalTerrain(float landHeight, float waterHeight, float waterStart, float waterEnd)
        : landHeight_(landHeight), waterHeight_(waterHeight)
        , waterStart_(waterStart), waterEnd_(waterEnd) {}
    
    float getTerrainHeightAt(float x) const override {
        return x >= waterStart_ && x < waterEnd_ ? waterHeight_ : landHeight_;
    }
    
private:
    float landHeight_;
    float waterHeight_;
    float waterStart_;
    float waterEnd_;
};

} // namespace Lander
