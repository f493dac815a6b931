/**
 * BombCollisionResolver.cpp
 */

#include "BombCollisionResolver.h"
#include "../core/Collaborators.h"
#include "../core/TimerQueue.h"
#include "../core/WorldLayout.h"
#include "../entities/Structures.h"
#include "../entities/Vehicles.h"
#include "../entities/WorldEntities.h"
#include "../creatures/Shark.h"
#include "../settings/QualityPresets.h"
#include "../session/MatchState.h"
#include "../world/OceanManager.h"
#include "../world/ScorchField.h"
#include "../core/Log.h"

#include <cmath>

namespace Lander {

BombCollisionResolver::BombCollisionResolver(const WorldLayout& layout, WorldEntities& entities,
                                             ScorchField& scorch, OceanManager& ocean, MatchState& match,
                                             const ResolverServices& services, uint32_t seed)
    : layout_(layout)
    , entities_(entities)
    , scorch_(scorch)
    , ocean_(ocean)
    , match_(match)
    , services_(services)
    , rng_(seed) {
}

// ============================================================================
// MAIN LOOP
// ============================================================================

ResolveStats BombCollisionResolver::resolve(std::vector<Bomb>& bombs, TimeMs now, const QualityPreset& preset) {
    stats_ = ResolveStats{};
    
    for (int i = static_cast<int>(bombs.size()) - 1; i >= 0; --i) {
        Bomb& bomb = bombs[static_cast<size_t>(i)];
        auto removeBomb = [&bombs, i]() { bombs.erase(bombs.begin() + i); };
        
        if (bomb.hasExploded || !bomb.active) {
            removeBomb();
            continue;
        }
        
        // Shuttles
        VehicleOutcome opponent = checkOpponentHit(bomb, now);
        if (opponent == VehicleOutcome::MatchEnded) {
            removeBomb();
            stats_.matchEnded = true;
            return stats_;
        }
        if (opponent == VehicleOutcome::Hit || checkSelfHit(bomb, now)) {
            removeBomb();
            continue;
        }
        
        // Ground targets are only reachable close to the surface
        float terrainY = services_.terrain.getTerrainHeightAt(bomb.position.x);
        bool nearGround = terrainY - bomb.position.y < GROUND_PROXIMITY_BAND;
        
        float interval = preset.collisionCheckIntervalMs;
        bool fullCheck = interval <= 0.0f || now - lastCollisionCheckTime_ >= interval;
        
        if (nearGround && fullCheck) {
            stats_.groundSweeps++;
            if (runGroundSweep(bomb, now)) {
                stats_.targetsDestroyed++;
                removeBomb();
                continue;
            }
            lastCollisionCheckTime_ = now;
        }
        
        if (fullCheck && checkBiplanes(bomb)) {
            stats_.targetsDestroyed++;
            removeBomb();
            continue;
        }
        
        if (bomb.position.y >= terrainY - TERRAIN_CONTACT_OFFSET) {
            if (layout_.isOverWater(bomb.position.x)) {
                sinkBomb(bomb, terrainY, now);
            } else {
                explodeOnGround(bomb, terrainY);
            }
            removeBomb();
            continue;
        }
        
        if (bomb.position.y > DISCARD_Y) {
            bomb.active = false;
            stats_.discarded++;
            removeBomb();
        }
    }
    
    return stats_;
}

bool BombCollisionResolver::runGroundSweep(Bomb& bomb, TimeMs now) {
    return checkBuildings(bomb, now) ||
           checkCannons(bomb) ||
           checkGolfCart(bomb) ||
           checkFisherBoat(bomb) ||
           checkOilTowers(bomb) ||
           checkGreenlandIce(bomb) ||
           checkSharks(bomb);
}

// ============================================================================
// SHUTTLES
// ============================================================================

bool BombCollisionResolver::inRange(const Bomb& bomb, const PlayerState* player) {
    if (!player || !player->isActive()) return false;
    return glm::length(bomb.position - player->shuttle.getPosition()) < VEHICLE_HIT_RADIUS;
}

BombCollisionResolver::VehicleOutcome BombCollisionResolver::checkOpponentHit(Bomb& bomb, TimeMs now) {
    if (!match_.isTwoPlayer()) return VehicleOutcome::None;
    
    PlayerState* target = match_.getOpponent(bomb.droppedBy);
    if (!inRange(bomb, target)) return VehicleOutcome::None;
    
    detonate(bomb);
    stats_.vehicleHits++;
    
    PlayerId killer = bomb.droppedBy;
    PlayerId victim = target->playerNum;
    
    match_.recordKill(killer);
    services_.achievements.onPlayerKill(killer);
    
    AudioCue* audio = &services_.audio;
    std::string gotcha = killer == 1 ? "p1_gotcha" : "p2_gotcha";
    services_.timers.schedule(now, KILL_CUE_DELAY_MS, [audio, gotcha]() {
        audio->playSound(gotcha);
    });
    
    if (match_.isDogfight() && match_.checkForWinner()) {
        match_.declareDogfightWinner();
        return VehicleOutcome::MatchEnded;
    }
    
    match_.crashVehicle(victim, "Bombed by P" + std::to_string(killer) + "!",
                        victim == 1 ? "p1_bombed" : "p2_bombed", now);
    return VehicleOutcome::Hit;
}

bool BombCollisionResolver::checkSelfHit(Bomb& bomb, TimeMs now) {
    if (bomb.ageAt(now) < SELF_HIT_GRACE_MS) return false;
    
    PlayerState* owner = match_.getPlayer(bomb.droppedBy);
    if (!inRange(bomb, owner)) return false;
    
    detonate(bomb);
    stats_.vehicleHits++;
    
    AudioCue* audio = &services_.audio;
    services_.timers.schedule(now, KILL_CUE_DELAY_MS, [audio]() {
        audio->playSound("self_bomb");
    });
    
    match_.crashVehicle(bomb.droppedBy, "Self-bombed!", "self_bomb", now);
    return true;
}

// ============================================================================
// GROUND TARGETS
// ============================================================================

bool BombCollisionResolver::checkBuildings(Bomb& bomb, TimeMs now) {
    auto& buildings = entities_.buildings;
    
    for (int j = static_cast<int>(buildings.size()) - 1; j >= 0; --j) {
        Destructible& building = *buildings[static_cast<size_t>(j)];
        if (building.isDestroyed() || !building.isVisible()) continue;
        
        if (std::abs(bomb.position.x - building.getX()) > BUILDING_PREFILTER) continue;
        
        Rect bounds = building.getCollisionBounds();
        if (!within(bomb, bounds)) continue;
        
        // The building's own blast stands in for the bomb's
        services_.effects.shakeCamera(200.0f, 0.01f);
        bomb.hasExploded = true;
        bomb.active = false;
        
        playExplosion(0.5f);
        AudioCue* audio = &services_.audio;
        std::string bombHit = pickCue("bombhit", 5);
        services_.timers.schedule(now, BOMB_HIT_CUE_DELAY_MS, [audio, bombHit]() {
            audio->playSoundIfNotPlaying(bombHit);
        });
        
        services_.effects.spawnEffect(EffectKind::Shockwave, building.getX(), building.getY());
        
        ExplosionResult result = building.explode();
        award(result.name, building.getCountry(), result.points, building.getX(), building.getY() - 50.0f);
        services_.achievements.onBuildingDestroyed(result.name, building.getCountry());
        scorch_.clearInArea(bounds);
        
        if (building.getKind() == EntityKind::MedalHouse) {
            services_.timers.schedule(now, MedalHouse::MILESTONE_CUE_DELAY_MS, [audio]() {
                audio->playSound(MedalHouse::MILESTONE_CUE);
            });
        }
        
        return true;
    }
    return false;
}

bool BombCollisionResolver::checkCannons(Bomb& bomb) {
    auto& cannons = entities_.cannons;
    
    for (int j = static_cast<int>(cannons.size()) - 1; j >= 0; --j) {
        Cannon& cannon = *cannons[static_cast<size_t>(j)];
        if (!cannon.isActive()) continue;
        if (!within(bomb, cannon.getCollisionBounds())) continue;
        
        detonate(bomb);
        playExplosion(0.5f);
        services_.audio.playSoundIfNotPlaying(pickCue("bombhit", 5));
        
        cannon.explode();
        award("Cannon", cannon.getCountry(), Cannon::POINTS, cannon.getX(), cannon.getY() - 30.0f);
        services_.effects.spawnEffect(EffectKind::Shockwave, bomb.position.x, bomb.position.y);
        return true;
    }
    return false;
}

bool BombCollisionResolver::checkGolfCart(Bomb& bomb) {
    GolfCart* cart = entities_.golfCart.get();
    if (!cart || cart->isDestroyed()) return false;
    if (!within(bomb, cart->getCollisionBounds())) return false;
    
    detonate(bomb);
    
    auto scatter = cart->getScatterPositions();
    ExplosionResult result = cart->explode();
    award(result.name, cart->getCountry(), result.points, cart->getX(), cart->getY() - 30.0f);
    
    playExplosion(0.5f);
    services_.effects.spawnEffect(EffectKind::Shockwave, bomb.position.x, bomb.position.y);
    
    SecondaryDrop drop;
    drop.kind = "classified_files";
    drop.positions.assign(scatter.begin(), scatter.end());
    services_.events.onSecondaryDrop(drop);
    return true;
}

bool BombCollisionResolver::checkFisherBoat(Bomb& bomb) {
    FisherBoat* boat = entities_.fisherBoat.get();
    if (!boat || boat->isDestroyed()) return false;
    if (!within(bomb, boat->getCollisionBounds())) return false;
    
    detonate(bomb);
    
    bool hadPackage = boat->hasPackage();
    ExplosionResult result = boat->explode();
    award(result.name, boat->getCountry(), result.points, boat->getX(), boat->getY() - 30.0f);
    
    playExplosion(0.5f);
    services_.effects.spawnEffect(EffectKind::Shockwave, bomb.position.x, bomb.position.y);
    
    if (hadPackage) {
        SecondaryDrop drop;
        drop.kind = "fish_package";
        drop.positions.push_back(boat->getPosition());
        services_.events.onSecondaryDrop(drop);
    }
    return true;
}

bool BombCollisionResolver::checkOilTowers(Bomb& bomb) {
    auto& towers = entities_.oilTowers;
    
    for (int j = static_cast<int>(towers.size()) - 1; j >= 0; --j) {
        OilTower& tower = *towers[static_cast<size_t>(j)];
        if (tower.isDestroyed()) continue;
        if (!within(bomb, tower.getCollisionBounds())) continue;
        
        detonate(bomb);
        playExplosion(0.6f);
        
        ExplosionResult result = tower.explode();
        award(result.name, tower.getCountry(), result.points, tower.getX(), tower.getY() - 30.0f);
        services_.effects.spawnEffect(EffectKind::Shockwave, bomb.position.x, bomb.position.y);
        return true;
    }
    return false;
}

bool BombCollisionResolver::checkGreenlandIce(Bomb& bomb) {
    GreenlandIce* ice = entities_.greenlandIce.get();
    if (!ice || ice->isDestroyed() || ice->isAttached()) return false;
    if (!within(bomb, ice->getCollisionBounds())) return false;
    
    detonate(bomb);
    
    ice->explode();
    award("Greenland Ice", ice->getCountry(), GreenlandIce::POINTS, ice->getX(), ice->getY() - 30.0f);
    
    services_.audio.playSound("ice_break", 0.5f);
    playExplosion(0.4f);
    services_.effects.spawnEffect(EffectKind::Shockwave, bomb.position.x, bomb.position.y);
    return true;
}

bool BombCollisionResolver::checkSharks(Bomb& bomb) {
    for (auto& shark : entities_.sharks) {
        if (shark->isDestroyed()) continue;
        if (!within(bomb, shark->getCollisionBounds())) continue;
        
        detonate(bomb);
        
        SharkExplosion result = shark->explodeShark();
        int points = result.points > 0 ? result.points : SHARK_MIN_AWARD;
        award(result.name, shark->getCountry(), points, shark->getX(), shark->getY() - 30.0f);
        services_.achievements.onSharkKilled(result.wasDead);
        
        playExplosion(0.4f);
        services_.effects.spawnEffect(EffectKind::Shockwave, bomb.position.x, bomb.position.y);
        return true;
    }
    return false;
}

bool BombCollisionResolver::checkBiplanes(Bomb& bomb) {
    auto& biplanes = entities_.biplanes;
    
    for (int j = static_cast<int>(biplanes.size()) - 1; j >= 0; --j) {
        Biplane& biplane = *biplanes[static_cast<size_t>(j)];
        if (biplane.isDestroyed() || biplane.isWaiting()) continue;
        if (!within(bomb, biplane.getCollisionBounds())) continue;
        
        detonate(bomb);
        
        ExplosionResult result = biplane.explode();
        award(result.name, biplane.getCountry(), result.points, biplane.getX(), biplane.getY() - 30.0f);
        
        playExplosion(0.5f);
        services_.effects.spawnEffect(EffectKind::Shockwave, bomb.position.x, bomb.position.y);
        services_.events.onBannerDrop(biplane.getBannerDrop());
        return true;
    }
    return false;
}

// ============================================================================
// TERRAIN
// ============================================================================

void BombCollisionResolver::sinkBomb(Bomb& bomb, float waterLevel, TimeMs now) {
    bomb.active = false;
    float bombX = bomb.position.x;
    
    for (auto& shark : entities_.sharks) {
        if (shark->isDestroyed() || !shark->canEatBomb()) continue;
        
        Rect mouth = shark->getEatingBounds();
        if (bombX >= mouth.left() && bombX <= mouth.right()) {
            shark->eatBomb(services_.timers, now);
            stats_.eatenBySharks++;
            return;
        }
    }
    
    services_.effects.spawnEffect(EffectKind::WaterSplash, bombX, waterLevel);
    services_.effects.spawnEffect(EffectKind::SinkBubbles, bombX, waterLevel + 30.0f);
    
    // Food settles on the bottom once it has finished sinking
    OceanManager* ocean = &ocean_;
    glm::vec2 restingPlace(bombX, waterLevel + SUNKEN_FOOD_DEPTH);
    CollectibleType type = bomb.payloadType;
    services_.timers.schedule(now, SINK_DURATION_MS, [ocean, restingPlace, type]() {
        ocean->addSunkenFood(restingPlace, type);
    });
    
    stats_.sunk++;
}

void BombCollisionResolver::explodeOnGround(Bomb& bomb, float terrainY) {
    detonate(bomb);
    scorch_.addCrater(bomb.position.x, terrainY);
    playExplosion(0.4f);
    services_.effects.spawnEffect(EffectKind::Shockwave, bomb.position.x, terrainY);
    stats_.groundExplosions++;
}

// ============================================================================
// HELPERS
// ============================================================================

void BombCollisionResolver::detonate(Bomb& bomb) {
    if (bomb.hasExploded) return;
    bomb.hasExploded = true;
    bomb.active = false;
    
    services_.effects.spawnEffect(EffectKind::BombExplosion, bomb.position.x, bomb.position.y);
    services_.effects.shakeCamera(200.0f, 0.01f);
}

void BombCollisionResolver::award(const std::string& name, const std::string& country, int points, float x, float y) {
    services_.score.addDestructionScore(points);
    services_.score.addDestroyedBuilding(name, country);
    services_.effects.showDestructionPoints(x, y, points, name);
    LANDER_LOG_DEBUG("Destroyed %s (+%d)", name.c_str(), points);
}

void BombCollisionResolver::playExplosion(float volume) {
    services_.audio.playSound(pickCue("explosion", 3), volume);
}

std::string BombCollisionResolver::pickCue(const char* prefix, int variants) {
    std::uniform_int_distribution<int> pick(1, variants);
    return prefix + std::to_string(pick(rng_));
}

} // namespace Lander
