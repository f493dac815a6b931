/**
 * GameSession.h
 * 
 * Owns every simulation service and runs one frame at a time
 * 
 * Features:
 * - Services wired by reference at construction, no globals
 * - Fixed per-frame order (timers, governor, vehicles, scorch, sea and
 *   air traffic, weather, cannons, bombs, cleanup)
 * - Collectibles picked up in flight, vehicle drops turned into pickups
 * - Pad landings graded and followed by an automatic fuel trade
 * - Power-ups: cannon bribe and a timed thrust boost
 * - Dogfight rounds restart in place with kills carried over
 * - End-of-run report
 */

#pragma once

#include "MatchState.h"
#include "SessionScore.h"
#include "../combat/BombCollisionResolver.h"
#include "../combat/BombManager.h"
#include "../combat/CannonBattery.h"
#include "../core/Collaborators.h"
#include "../core/TimerQueue.h"
#include "../entities/Shuttle.h"
#include "../entities/WorldEntities.h"
#include "../settings/PerformanceGovernor.h"
#include "../world/AirTraffic.h"
#include "../world/CollectibleField.h"
#include "../world/OceanManager.h"
#include "../world/ScorchField.h"
#include "../world/WeatherSystem.h"
#include "../world/WorldBuilder.h"
#include <optional>
#include <string>
#include <random>
#include <vector>

namespace Lander {

class WorldLayout;
class TerrainQuery;
class SettingsStore;

/**
 * One pilot's input for a frame
 */
struct PilotInput {
    ShuttleControls flight;
    bool dropBomb = false;
};

/**
 * Collaborators supplied by the host
 */
struct SessionServices {
    AudioCue& audio;
    EffectSink& effects;
    AchievementSink& achievements;
    MatchEvents& events;
    SettingsStore& settings;
};

struct SessionConfig {
    GameMode mode = GameMode::Single;
    uint32_t seed = 1;
    int startPadIndex = 0;
    bool isMobile = false;
};

/**
 * Result of a touchdown on a landing pad
 */
struct LandingOutcome {
    PlayerId player = 1;
    int padIndex = 0;
    LandingQuality quality = LandingQuality::Good;
    LandingType type = LandingType::Normal;
    std::optional<TradeResult> trade;
};

class GameSession {
public:
    static constexpr TimeMs INVULNERABILITY_MS = 800.0;
    static constexpr float VOID_DEPTH = GAME_HEIGHT + 100.0f;
    static constexpr float PAD_CONTACT_MARGIN = 10.0f;
    static constexpr float ICE_PICKUP_RANGE = 25.0f;
    static constexpr float ICE_PICKUP_LIFT = 40.0f;
    static constexpr float SECOND_PILOT_OFFSET = 40.0f;
    static constexpr TimeMs SPEED_BOOST_MS = 6000.0;
    static constexpr float SPEED_BOOST_THRUST = 1.8f;
    
    GameSession(const WorldLayout& layout, const TerrainQuery& terrain,
                const SessionServices& services, const SessionConfig& config = {});
    
    /** Build the world and put the pilots on the start pad */
    void start(TimeMs now);
    
    /**
     * Run one frame
     * @param inputs One entry per pilot; missing entries mean no input
     */
    void tick(TimeMs now, float fps, const std::vector<PilotInput>& inputs);
    
    /** Spend a power-up from a pilot's inventory */
    bool usePowerUp(PlayerId player, CollectibleType type, TimeMs now);
    
    /** Final numbers for the game-over screen */
    SessionReport buildReport(TimeMs now) const;
    
    // Accessors
    MatchState& getMatch() { return match_; }
    const MatchState& getMatch() const { return match_; }
    PlayerState* getPlayer(PlayerId player) { return match_.getPlayer(player); }
    WorldEntities& getEntities() { return entities_; }
    PerformanceGovernor& getGovernor() { return governor_; }
    BombManager& getBombs() { return bombs_; }
    CannonBattery& getCannons() { return cannons_; }
    ScorchField& getScorch() { return scorch_; }
    OceanManager& getOcean() { return ocean_; }
    AirTraffic& getAirTraffic() { return airTraffic_; }
    CollectibleField& getPickups() { return pickups_; }
    WeatherSystem& getWeather() { return weather_; }
    TimerQueue& getTimers() { return timers_; }
    const DestructionLedger& getLedger() const { return ledger_; }
    
    const std::vector<LandingOutcome>& getLandings() const { return landings_; }
    const ResolveStats& getLastResolveStats() const { return lastResolve_; }
    float getCameraX() const { return cameraX_; }
    uint64_t getFrameCount() const { return frame_; }
    
private:
    void updatePilot(PlayerState& player, const PilotInput& input, TimeMs now);
    void checkGroundContact(PlayerState& player, TimeMs now);
    bool checkPadContact(PlayerState& player, TimeMs now);
    void land(PlayerState& player, int padIndex, const LandingPadInfo& pad, LandingQuality quality, TimeMs now);
    void checkIcePickup(PlayerState& player);
    void checkPickups(PlayerState& player, TimeMs now);
    void expireSpeedBoosts(TimeMs now);
    void checkProjectileHits(TimeMs now);
    void updateCamera();
    
    void restartRound(const KillTally& kills);
    glm::vec2 spawnPointFor(PlayerId player) const;
    float padSurface(const LandingPadInfo& pad) const;
    
    std::vector<glm::vec2> activeShuttlePositions() const;
    std::vector<PlayerId> activePilots() const;
    std::vector<Shuttle*> allShuttles();
    
    /**
     * Passes match events through to the host; secondary drops also
     * become pickups
     */
    class DropRouter : public MatchEvents {
    public:
        DropRouter(MatchEvents& host, CollectibleField& pickups, const TimeMs& now)
            : host_(host), pickups_(pickups), now_(now) {}
        
        void onVehicleCrash(PlayerId victim, const std::string& message, const std::string& cause) override {
            host_.onVehicleCrash(victim, message, cause);
        }
        void onProjectileHit(PlayerId victim) override { host_.onProjectileHit(victim); }
        void onDogfightWinner(PlayerId winner, int p1Kills, int p2Kills) override {
            host_.onDogfightWinner(winner, p1Kills, p2Kills);
        }
        void onSecondaryDrop(const SecondaryDrop& drop) override {
            pickups_.spawnDrop(drop, now_);
            host_.onSecondaryDrop(drop);
        }
        void onBannerDrop(const BannerDrop& banner) override { host_.onBannerDrop(banner); }
        
    private:
        MatchEvents& host_;
        CollectibleField& pickups_;
        const TimeMs& now_;
    };
    
    const WorldLayout& layout_;
    const TerrainQuery& terrain_;
    SessionServices services_;
    SessionConfig config_;
    std::mt19937 rng_;
    
    TimerQueue timers_;
    PerformanceGovernor governor_;
    WorldEntities entities_;
    DestructionLedger ledger_;
    MatchState match_;
    ScorchField scorch_;
    OceanManager ocean_;
    AirTraffic airTraffic_;
    CollectibleField pickups_;
    WeatherSystem weather_;
    DropRouter router_;
    CannonBattery cannons_;
    BombManager bombs_;
    BombCollisionResolver resolver_;
    
    std::vector<LandingOutcome> landings_;
    ResolveStats lastResolve_;
    TimeMs startTime_ = 0.0;
    TimeMs now_ = 0.0;
    float cameraX_ = 0.0f;
    uint64_t frame_ = 0;
};

} // namespace Lander
