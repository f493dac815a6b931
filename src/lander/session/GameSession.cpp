/**
 * GameSession.cpp
 */

#include "GameSession.h"
#include "LandingEvaluator.h"
#include "../core/Collaborators.h"
#include "../core/WorldLayout.h"
#include "../economy/TradeEconomy.h"
#include "../core/Log.h"

#include <algorithm>
#include <cmath>

namespace Lander {

GameSession::GameSession(const WorldLayout& layout, const TerrainQuery& terrain,
                         const SessionServices& services, const SessionConfig& config)
    : layout_(layout)
    , terrain_(terrain)
    , services_(services)
    , config_(config)
    , rng_(config.seed)
    , governor_(services.settings)
    , match_(config.mode, services.events, timers_)
    , scorch_(layout, config.seed + 1)
    , ocean_(layout, entities_, timers_, &services.effects, config.seed + 2)
    , airTraffic_(layout, entities_, &services.audio, &services.effects, config.seed + 3)
    , pickups_(layout, terrain, &services.audio, config.seed + 8)
    , weather_(terrain, timers_, &services.audio, &services.effects, config.seed + 9)
    , router_(services.events, pickups_, now_)
    , cannons_(entities_, &services.effects, config.seed + 4)
    , bombs_(services.audio, timers_, config.seed + 5)
    , resolver_(layout, entities_, scorch_, ocean_, match_,
                ResolverServices{services.audio, services.effects, ledger_, services.achievements,
                                 router_, terrain, timers_},
                config.seed + 6) {
    match_.setRestartHandler([this](const KillTally& kills) { restartRound(kills); });
    
    weather_.setShuttleLookup([this](PlayerId player) -> const Shuttle* {
        PlayerState* state = match_.getPlayer(player);
        return state ? &state->shuttle : nullptr;
    });
    weather_.setStrikeHandler([this](PlayerId player, TimeMs now) {
        match_.crashVehicle(player, "Struck by lightning!", "lightning", now);
    });
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void GameSession::start(TimeMs now) {
    startTime_ = now;
    now_ = now;
    frame_ = 0;
    
    governor_.initialize(now);
    governor_.setDefaultForDevice(config_.isMobile);
    
    WorldBuilder builder(layout_, terrain_, &services_.effects, config_.seed + 7);
    builder.build(entities_, governor_.getPreset());
    ocean_.populate(config_.mode);
    airTraffic_.initialize();
    pickups_.populate(WORLD_START_X, WORLD_START_X + WORLD_WIDTH);
    weather_.initialize(now);
    
    int pilots = config_.mode == GameMode::Single ? 1 : 2;
    for (int i = 0; i < pilots; ++i) {
        PlayerState& player = match_.addPlayer(spawnPointFor(i + 1), config_.seed + 10 + static_cast<uint32_t>(i));
        player.startPadIndex = config_.startPadIndex;
    }
    
    updateCamera();
    LANDER_LOG_INFO("Session started (%s, %d pilot%s)", gameModeName(config_.mode), pilots, pilots == 1 ? "" : "s");
}

glm::vec2 GameSession::spawnPointFor(PlayerId player) const {
    const auto& pads = layout_.getLandingPads();
    if (pads.empty()) return glm::vec2(0.0f, 0.0f);
    
    size_t index = static_cast<size_t>(std::max(0, std::min(config_.startPadIndex, static_cast<int>(pads.size()) - 1)));
    const LandingPadInfo& pad = pads[index];
    float x = pad.x + (player == 2 ? SECOND_PILOT_OFFSET : 0.0f);
    
    // Parked just above the deck until the first thrust
    return glm::vec2(x, padSurface(pad) - 40.0f);
}

float GameSession::padSurface(const LandingPadInfo& pad) const {
    return terrain_.getTerrainHeightAt(pad.x);
}

void GameSession::restartRound(const KillTally& kills) {
    for (auto& player : match_.getPlayers()) {
        player->shuttle = Shuttle(spawnPointFor(player->playerNum));
        player->fuel.reset();
        player->deathMessage.clear();
        player->startPadIndex = config_.startPadIndex;
        player->invulnerableUntil = 0.0;
        player->speedBoostUntil = 0.0;
    }
    match_.restoreKills(kills);
    bombs_.clear();
    cannons_.clearProjectiles();
    weather_.cancelPendingStrike();
    
    LANDER_LOG_INFO("Dogfight round restart (%d - %d)", kills.p1Kills, kills.p2Kills);
}

// ============================================================================
// FRAME
// ============================================================================

void GameSession::tick(TimeMs now, float fps, const std::vector<PilotInput>& inputs) {
    frame_++;
    now_ = now;
    
    // 1. Deferred callbacks due by now, then boosts that ran out
    timers_.processDue(now);
    expireSpeedBoosts(now);
    
    // 2. Quality governor; the preset is re-read below, never cached
    governor_.updateFPS(fps, now);
    const QualityPreset& preset = governor_.getPreset();
    
    if (match_.isOver()) return;
    
    // 3. Vehicles
    static const PilotInput idle;
    for (auto& player : match_.getPlayers()) {
        size_t slot = static_cast<size_t>(player->playerNum - 1);
        updatePilot(*player, slot < inputs.size() ? inputs[slot] : idle, now);
        if (match_.isOver()) return;
    }
    updateCamera();
    
    // 4. Exhaust scorching
    std::vector<Rect> buildingBounds = entities_.getBuildingBounds();
    for (auto& player : match_.getPlayers()) {
        if (!player->isActive()) continue;
        scorch_.update(now, player->shuttle.getThrustInfo(), preset, terrain_, buildingBounds);
    }
    
    // 5. Sea life and air traffic
    std::vector<glm::vec2> targets = activeShuttlePositions();
    ocean_.update(now, preset, scorch_.getWaterPollution(), terrain_, targets, bombs_.getBombs());
    airTraffic_.update(now, cameraX_, allShuttles());
    weather_.update(now, cameraX_, preset, activePilots());
    
    // 6. Cannons and their projectiles
    cannons_.update(now, cameraX_, activeShuttlePositions());
    cannons_.resolveIntercepts(preset);
    checkProjectileHits(now);
    if (match_.isOver()) return;
    
    // 7. Bombs
    bombs_.update();
    lastResolve_ = resolver_.resolve(bombs_.getBombs(), now, preset);
    
    // 8. Cleanup
    entities_.pruneDestroyed();
    pickups_.update(now);
}

void GameSession::updatePilot(PlayerState& player, const PilotInput& input, TimeMs now) {
    if (!player.isActive()) return;
    
    bool wasParked = player.shuttle.isParked();
    player.shuttle.update(input.flight, player.fuel);
    
    if (wasParked && !player.shuttle.isParked()) {
        player.invulnerableUntil = now + INVULNERABILITY_MS;
    }
    
    if (input.dropBomb) {
        bombs_.dropBomb(player.shuttle, player.inventory, player.playerNum, now);
    }
    
    checkIcePickup(player);
    checkPickups(player, now);
    checkGroundContact(player, now);
}

void GameSession::checkGroundContact(PlayerState& player, TimeMs now) {
    if (player.shuttle.isParked()) return;
    
    if (checkPadContact(player, now)) return;
    if (!player.isActive()) return;
    
    const glm::vec2& pos = player.shuttle.getPosition();
    
    if (pos.y > VOID_DEPTH) {
        match_.crashVehicle(player.playerNum, "Lost in the void!", "void", now);
        return;
    }
    
    if (now < player.invulnerableUntil) return;
    
    float groundY = terrain_.getTerrainHeightAt(pos.x);
    if (player.shuttle.getBottom() >= groundY) {
        match_.crashVehicle(player.playerNum, "You crashed into the terrain!", "terrain", now);
    }
}

bool GameSession::checkPadContact(PlayerState& player, TimeMs now) {
    Shuttle& shuttle = player.shuttle;
    const auto& pads = layout_.getLandingPads();
    
    for (size_t i = 0; i < pads.size(); ++i) {
        const LandingPadInfo& pad = pads[i];
        if (std::abs(shuttle.getPosition().x - pad.x) > pad.width * 0.5f) continue;
        
        float padY = padSurface(pad);
        if (shuttle.getBottom() < padY - PAD_CONTACT_MARGIN) return true;
        
        // The deck holds the shuttle up even when the touchdown does not count
        if (shuttle.getBottom() > padY) {
            shuttle.setPosition(glm::vec2(shuttle.getPosition().x, padY - Shuttle::BOTTOM_OFFSET));
        }
        auto rest = [&shuttle]() {
            glm::vec2 velocity = shuttle.getVelocity();
            if (velocity.y > 0.0f) {
                shuttle.setVelocity(glm::vec2(velocity.x, 0.0f));
            }
        };
        
        if (now < player.invulnerableUntil) {
            rest();
            return true;
        }
        
        int padIndex = static_cast<int>(i);
        const glm::vec2& pos = shuttle.getPosition();
        LandingValidation valid = LandingEvaluator::isValidLandingPosition(pos.x, pos.y, pad.x, padY, pad.width);
        if (!valid.valid) {
            LANDER_LOG_DEBUG("Ignoring pad contact: %s", valid.reason.c_str());
            return true;
        }
        
        if (LandingEvaluator::shouldIgnoreStartPad(padIndex, player.startPadIndex, shuttle.getSpeed())) {
            rest();
            return true;
        }
        if (padIndex == player.startPadIndex) {
            player.startPadIndex = -1;
        }
        
        if (LandingEvaluator::shouldDebounce(player.lastLandingTime, now)) {
            rest();
            return true;
        }
        
        LandingSafety safety = shuttle.checkLandingSafety();
        if (!safety.safe) {
            match_.crashVehicle(player.playerNum, "Crash landing! " + safety.reason, "bad_landing", now);
            return true;
        }
        
        land(player, padIndex, pad, safety.quality.value_or(LandingQuality::Rough), now);
        return true;
    }
    return false;
}

void GameSession::land(PlayerState& player, int padIndex, const LandingPadInfo& pad,
                       LandingQuality quality, TimeMs now) {
    player.lastLandingTime = now;
    player.shuttle.settle(padSurface(pad));
    services_.audio.playSound(LandingEvaluator::getLandingSoundKey(quality));
    
    LandingOutcome outcome;
    outcome.player = player.playerNum;
    outcome.padIndex = padIndex;
    outcome.quality = quality;
    outcome.type = LandingEvaluator::getLandingType(pad, player.hasPeaceMedal,
                                                    player.carryingGreenlandIce, match_.getMode());
    
    LANDER_LOG_INFO("P%d landed on %s (%s, %s)", player.playerNum, pad.name.c_str(),
                    landingQualityName(quality), landingTypeName(outcome.type));
    
    switch (outcome.type) {
        case LandingType::Victory:
            match_.declareVictory();
            landings_.push_back(outcome);
            return;
        case LandingType::WashingtonMedal:
            player.hasPeaceMedal = true;
            break;
        case LandingType::WashingtonIce:
            player.carryingGreenlandIce = false;
            break;
        case LandingType::Normal:
            break;
    }
    
    TradePlan plan = TradeEconomy::planAutoTrade(player.inventory, player.fuel.getDeficit());
    if (!plan.isEmpty()) {
        outcome.trade = TradeEconomy::execute(plan, player.inventory, player.fuel, quality);
        if (outcome.trade) {
            ledger_.deductTrade(outcome.trade->scoreLost);
        }
    }
    
    landings_.push_back(outcome);
}

void GameSession::checkIcePickup(PlayerState& player) {
    GreenlandIce* ice = entities_.greenlandIce.get();
    if (!ice || ice->isDestroyed() || ice->isAttached()) return;
    if (player.carryingGreenlandIce || player.hasPeaceMedal || match_.isDogfight()) return;
    
    glm::vec2 grip(ice->getX(), ice->getY() - ICE_PICKUP_LIFT);
    if (glm::length(player.shuttle.getPosition() - grip) < ICE_PICKUP_RANGE) {
        ice->attach();
        player.carryingGreenlandIce = true;
        LANDER_LOG_INFO("P%d picked up the Greenland ice", player.playerNum);
    }
}

void GameSession::checkPickups(PlayerState& player, TimeMs now) {
    for (const PickupEvent& pickup : pickups_.collect(player.shuttle, player.inventory, now)) {
        LANDER_LOG_INFO("P%d collected %d x %s", player.playerNum, pickup.count,
                        getCollectibleInfo(pickup.type).name);
    }
}

void GameSession::checkProjectileHits(TimeMs now) {
    for (auto& player : match_.getPlayers()) {
        if (!player->isActive() || now < player->invulnerableUntil) continue;
        if (player->shuttle.isParked() && !player->shuttle.hasLaunched()) continue;
        
        if (cannons_.collectHullHits(player->shuttle.getPosition()) > 0) {
            services_.events.onProjectileHit(player->playerNum);
            match_.crashVehicle(player->playerNum, "Shot down by enemy cannons!", "projectile", now);
            if (match_.isOver()) return;
        }
    }
}

void GameSession::updateCamera() {
    std::vector<glm::vec2> positions = activeShuttlePositions();
    if (positions.empty()) return;
    
    float sum = 0.0f;
    for (const auto& pos : positions) sum += pos.x;
    cameraX_ = sum / static_cast<float>(positions.size()) - GAME_WIDTH * 0.5f;
}

// ============================================================================
// POWER-UPS
// ============================================================================

bool GameSession::usePowerUp(PlayerId player, CollectibleType type, TimeMs now) {
    PlayerState* state = match_.getPlayer(player);
    if (!state || !state->isActive()) return false;
    
    const CollectibleInfo& info = getCollectibleInfo(type);
    if (info.special == PowerUpEffect::None) {
        LANDER_LOG_WARN("%s is not a power-up", info.name);
        return false;
    }
    
    if (!state->inventory.remove(type, 1)) return false;
    
    switch (info.special) {
        case PowerUpEffect::BribeCannons:
            cannons_.bribe(now);
            break;
        case PowerUpEffect::SpeedBoost:
            // A second tie restarts the clock rather than stacking
            state->speedBoostUntil = now + SPEED_BOOST_MS;
            state->shuttle.setThrustMultiplier(SPEED_BOOST_THRUST);
            break;
        case PowerUpEffect::None:
            break;
    }
    
    services_.audio.playSound("powerup");
    LANDER_LOG_INFO("P%d used %s", player, info.name);
    return true;
}

void GameSession::expireSpeedBoosts(TimeMs now) {
    for (auto& player : match_.getPlayers()) {
        if (player->speedBoostUntil <= 0.0 || now < player->speedBoostUntil) continue;
        
        player->speedBoostUntil = 0.0;
        player->shuttle.setThrustMultiplier(1.0f);
        LANDER_LOG_DEBUG("P%d speed boost ended", player->playerNum);
    }
}

// ============================================================================
// REPORT
// ============================================================================

SessionReport GameSession::buildReport(TimeMs now) const {
    const PlayerState* pilot = match_.getPlayer(1);
    
    SessionReport report;
    if (pilot) {
        report = SessionScore::compute(now - startTime_, SessionScore::deliveredFrom(pilot->inventory),
                                       pilot->hasPeaceMedal);
        report.fuelRemaining = pilot->fuel.getFuel();
        report.message = pilot->deathMessage;
    }
    
    report.victory = match_.getPhase() == MatchPhase::Victory;
    if (report.victory) {
        const auto& pads = layout_.getLandingPads();
        std::string destination = pads.empty() ? "the palace" : pads.back().name;
        report.message = "You've reached " + destination + "! Peace delivered!";
    }
    
    report.destructionScore = ledger_.getDestructionScore();
    report.tradeDeductions = ledger_.getTradeDeductions();
    report.destroyedBuildings = ledger_.getDestroyedBuildings();
    return report;
}

// ============================================================================
// HELPERS
// ============================================================================

std::vector<glm::vec2> GameSession::activeShuttlePositions() const {
    std::vector<glm::vec2> positions;
    for (const auto& player : match_.getPlayers()) {
        if (player->isActive()) positions.push_back(player->shuttle.getPosition());
    }
    return positions;
}

std::vector<PlayerId> GameSession::activePilots() const {
    std::vector<PlayerId> pilots;
    for (const auto& player : match_.getPlayers()) {
        if (player->isActive()) pilots.push_back(player->playerNum);
    }
    return pilots;
}

std::vector<Shuttle*> GameSession::allShuttles() {
    std::vector<Shuttle*> shuttles;
    for (auto& player : match_.getPlayers()) {
        shuttles.push_back(&player->shuttle);
    }
    return shuttles;
}

} // namespace Lander
