/**
 * MatchState.h
 * 
 * Players, game mode and the kill race
 * 
 * Features:
 * - Single, two-player and dogfight modes
 * - Kill tally with a win threshold in dogfight
 * - Crash handling with a deferred round restart in dogfight
 */

#pragma once

#include "PlayerState.h"
#include "LandingEvaluator.h"
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace Lander {

class MatchEvents;
class TimerQueue;

struct KillTally {
    int p1Kills = 0;
    int p2Kills = 0;
};

enum class MatchPhase {
    Playing,
    Crashed,        // Every pilot is down
    Victory,        // Final destination reached
    DogfightOver
};

const char* matchPhaseName(MatchPhase phase);

class MatchState {
public:
    static constexpr int KILLS_TO_WIN = 10;
    static constexpr TimeMs RESTART_DELAY_MS = 1500.0;
    
    using RestartHandler = std::function<void(const KillTally&)>;
    
    MatchState(GameMode mode, MatchEvents& events, TimerQueue& timers);
    
    PlayerState& addPlayer(const glm::vec2& spawn, uint32_t seed);
    
    PlayerState* getPlayer(PlayerId player);
    const PlayerState* getPlayer(PlayerId player) const;
    
    /** The other pilot in two-player modes, nullptr otherwise */
    PlayerState* getOpponent(PlayerId player);
    
    std::vector<std::unique_ptr<PlayerState>>& getPlayers() { return players_; }
    const std::vector<std::unique_ptr<PlayerState>>& getPlayers() const { return players_; }
    int getPlayerCount() const { return static_cast<int>(players_.size()); }
    
    GameMode getMode() const { return mode_; }
    bool isTwoPlayer() const { return players_.size() == 2; }
    bool isDogfight() const { return mode_ == GameMode::Dogfight; }
    
    /** Credit a kill and return both tallies */
    KillTally recordKill(PlayerId killer);
    KillTally getKills() const;
    
    /** Seed tallies carried over from the previous dogfight round */
    void restoreKills(const KillTally& kills);
    
    bool checkForWinner() const;
    std::optional<PlayerId> getWinner() const;
    
    /** End a dogfight whose kill threshold has been reached */
    void declareDogfightWinner();
    
    /**
     * Take a pilot out. In dogfight a round restart is scheduled;
     * otherwise the match ends once no pilot is left flying.
     */
    void crashVehicle(PlayerId victim, const std::string& message, const std::string& cause, TimeMs now);
    
    /** Final destination reached */
    void declareVictory();
    
    MatchPhase getPhase() const { return phase_; }
    bool isOver() const { return phase_ != MatchPhase::Playing; }
    
    void setRestartHandler(RestartHandler handler) { onRestart_ = std::move(handler); }
    bool isRestartPending() const { return restartPending_; }
    
private:
    GameMode mode_;
    MatchEvents& events_;
    TimerQueue& timers_;
    std::vector<std::unique_ptr<PlayerState>> players_;
    MatchPhase phase_ = MatchPhase::Playing;
    bool restartPending_ = false;
    RestartHandler onRestart_;
};

} // namespace Lander
