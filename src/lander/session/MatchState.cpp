/**
 * MatchState.cpp
 */

#include "MatchState.h"
#include "../core/Collaborators.h"
#include "../core/TimerQueue.h"
#include "../core/Log.h"

namespace Lander {

const char* matchPhaseName(MatchPhase phase) {
    switch (phase) {
        case MatchPhase::Playing: return "playing";
        case MatchPhase::Crashed: return "crashed";
        case MatchPhase::Victory: return "victory";
        case MatchPhase::DogfightOver: return "dogfight_over";
    }
    return "playing";
}

MatchState::MatchState(GameMode mode, MatchEvents& events, TimerQueue& timers)
    : mode_(mode), events_(events), timers_(timers) {
}

PlayerState& MatchState::addPlayer(const glm::vec2& spawn, uint32_t seed) {
    PlayerId number = static_cast<PlayerId>(players_.size()) + 1;
    players_.push_back(std::make_unique<PlayerState>(number, spawn, seed));
    return *players_.back();
}

PlayerState* MatchState::getPlayer(PlayerId player) {
    if (player < 1 || player > static_cast<PlayerId>(players_.size())) return nullptr;
    return players_[static_cast<size_t>(player - 1)].get();
}

const PlayerState* MatchState::getPlayer(PlayerId player) const {
    if (player < 1 || player > static_cast<PlayerId>(players_.size())) return nullptr;
    return players_[static_cast<size_t>(player - 1)].get();
}

PlayerState* MatchState::getOpponent(PlayerId player) {
    if (!isTwoPlayer()) return nullptr;
    return getPlayer(player == 1 ? 2 : 1);
}

KillTally MatchState::recordKill(PlayerId killer) {
    if (PlayerState* state = getPlayer(killer)) {
        state->kills++;
    }
    KillTally tally = getKills();
    LANDER_LOG_INFO("P%d scored a kill (%d - %d)", killer, tally.p1Kills, tally.p2Kills);
    return tally;
}

KillTally MatchState::getKills() const {
    KillTally tally;
    if (const PlayerState* p1 = getPlayer(1)) tally.p1Kills = p1->kills;
    if (const PlayerState* p2 = getPlayer(2)) tally.p2Kills = p2->kills;
    return tally;
}

void MatchState::restoreKills(const KillTally& kills) {
    if (PlayerState* p1 = getPlayer(1)) p1->kills = kills.p1Kills;
    if (PlayerState* p2 = getPlayer(2)) p2->kills = kills.p2Kills;
}

bool MatchState::checkForWinner() const {
    KillTally tally = getKills();
    return tally.p1Kills >= KILLS_TO_WIN || tally.p2Kills >= KILLS_TO_WIN;
}

std::optional<PlayerId> MatchState::getWinner() const {
    if (!checkForWinner()) return std::nullopt;
    return getKills().p1Kills >= KILLS_TO_WIN ? 1 : 2;
}

void MatchState::declareDogfightWinner() {
    std::optional<PlayerId> winner = getWinner();
    if (!winner || phase_ == MatchPhase::DogfightOver) return;
    
    phase_ = MatchPhase::DogfightOver;
    KillTally tally = getKills();
    
    if (PlayerState* loser = getPlayer(*winner == 1 ? 2 : 1)) {
        loser->shuttle.explode();
    }
    
    LANDER_LOG_INFO("Dogfight over: P%d wins %d - %d", *winner, tally.p1Kills, tally.p2Kills);
    events_.onDogfightWinner(*winner, tally.p1Kills, tally.p2Kills);
}

void MatchState::crashVehicle(PlayerId victim, const std::string& message, const std::string& cause, TimeMs now) {
    PlayerState* state = getPlayer(victim);
    if (!state || !state->isActive() || isOver()) return;
    
    state->shuttle.explode();
    state->deathMessage = message;
    events_.onVehicleCrash(victim, message, cause);
    LANDER_LOG_INFO("P%d down: %s", victim, message.c_str());
    
    if (isDogfight()) {
        if (restartPending_) return;
        restartPending_ = true;
        KillTally tally = getKills();
        timers_.schedule(now, RESTART_DELAY_MS, [this, tally]() {
            restartPending_ = false;
            if (onRestart_ && phase_ == MatchPhase::Playing) {
                onRestart_(tally);
            }
        });
        return;
    }
    
    for (const auto& player : players_) {
        if (player->isActive()) return;
    }
    phase_ = MatchPhase::Crashed;
}

void MatchState::declareVictory() {
    if (isOver()) return;
    phase_ = MatchPhase::Victory;
    LANDER_LOG_INFO("Final destination reached");
}

} // namespace Lander
