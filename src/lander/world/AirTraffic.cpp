/**
 * AirTraffic.cpp
 */

#include "AirTraffic.h"
#include "../core/Collaborators.h"
#include "../core/WorldLayout.h"
#include "../entities/Shuttle.h"
#include "../entities/WorldEntities.h"
#include "../core/Log.h"

#include <cmath>
#include <unordered_map>

namespace Lander {

namespace {

const std::vector<std::string> PLANE_COUNTRIES = {
    "USA", "United Kingdom", "France", "Switzerland", "Germany", "Poland", "Russia"
};

const std::unordered_map<std::string, std::vector<std::string>>& bannerMessages() {
    static const std::unordered_map<std::string, std::vector<std::string>> messages = {
        {"USA", {"MAKE LANDINGS GREAT AGAIN", "OIL DETECTED - DEMOCRACY INBOUND"}},
        {"United Kingdom", {"QUEUE HERE FOR FIERY DEATH", "MIND THE GAP IN YOUR FUEL TANK"}},
        {"France", {"ON STRIKE - FLY YOURSELF", "WINE PAIRS WELL WITH EXPLOSIONS"}},
        {"Switzerland", {"NEUTRAL ON YOUR CRASH LANDING", "YOUR WRECKAGE IS SECURE WITH US"}},
        {"Germany", {"PRECISION CRASHING SINCE 1871", "AUTOBAHN RULES APPLY UP HERE"}},
        {"Poland", {"PIEROGI POWERED FLIGHT", "WE SURVIVED WORSE NEIGHBOURS"}},
        {"Russia", {"VODKA IS ROCKET FUEL", "YOUR SHUTTLE HAS BEEN ANNEXED"}},
        {"GAME_INFO", {"TRADE GOODS FOR FUEL ON EVERY PAD", "LAND SLOWLY FOR A FUEL BONUS",
                       "DROP FOOD ON TARGETS WITH THE BOMB KEY"}},
    };
    return messages;
}

} // namespace

AirTraffic::AirTraffic(const WorldLayout& layout, WorldEntities& entities, AudioCue* audio,
                       EffectSink* effects, uint32_t seed)
    : layout_(layout)
    , entities_(entities)
    , audio_(audio)
    , effects_(effects)
    , rng_(seed) {
}

void AirTraffic::initialize() {
    std::uniform_real_distribution<float> chance(0.0f, 1.0f);
    if (chance(rng_) < INFO_PLANE_CHANCE) {
        targetCountry_ = INFO_PLANE;
    } else {
        std::uniform_int_distribution<size_t> pick(0, PLANE_COUNTRIES.size() - 1);
        targetCountry_ = PLANE_COUNTRIES[pick(rng_)];
    }
    spawned_ = false;
    LANDER_LOG_DEBUG("Biplane theme: %s", targetCountry_.c_str());
}

void AirTraffic::update(TimeMs now, float cameraX, const std::vector<Shuttle*>& shuttles) {
    checkSpawn(shuttles);
    
    Biplane* biplane = getBiplane();
    if (!biplane) return;
    
    biplane->update(now, cameraX);
    
    if (biplane->isWaiting()) return;
    bounceShuttles(*biplane, shuttles);
}

// ============================================================================
// SPAWNING
// ============================================================================

void AirTraffic::checkSpawn(const std::vector<Shuttle*>& shuttles) {
    if (spawned_ || targetCountry_.empty()) return;
    
    // Info planes may show up over any of the themed countries
    std::vector<std::string> candidates;
    if (targetCountry_ == INFO_PLANE) {
        candidates = PLANE_COUNTRIES;
    } else {
        candidates.push_back(targetCountry_);
    }
    
    for (const auto& country : candidates) {
        const CountryInfo* info = layout_.findCountry(country);
        if (!info) continue;
        
        float center = (info->startX + layout_.countryEndX(country)) * 0.5f;
        
        for (Shuttle* shuttle : shuttles) {
            if (!shuttle || !shuttle->isActive()) continue;
            if (std::abs(shuttle->getPosition().x - center) < SPAWN_DISTANCE) {
                spawnOver(country, shuttle->getPosition().x);
                return;
            }
        }
    }
}

void AirTraffic::spawnOver(const std::string& country, float playerX) {
    const CountryInfo* info = layout_.findCountry(country);
    float center = (info->startX + layout_.countryEndX(country)) * 0.5f;
    
    // Enter on the far side and fly back toward the player
    bool playerFromLeft = playerX < center;
    float spawnX = playerFromLeft ? center + SPAWN_OFFSET : center - SPAWN_OFFSET;
    int direction = playerFromLeft ? -1 : 1;
    
    std::uniform_real_distribution<float> jitter(0.0f, 40.0f);
    float spawnY = country == "Switzerland" ? -1200.0f + jitter(rng_) : 100.0f + jitter(rng_);
    
    entities_.biplanes.push_back(std::make_unique<Biplane>(
        glm::vec2(spawnX, spawnY), targetCountry_, pickMessage(targetCountry_), direction, effects_));
    spawned_ = true;
    
    LANDER_LOG_INFO("Biplane (%s) spawned over %s", targetCountry_.c_str(), country.c_str());
}

const std::string& AirTraffic::pickMessage(const std::string& theme) {
    const auto& all = bannerMessages();
    auto it = all.find(theme);
    const auto& list = it != all.end() ? it->second : all.at("USA");
    
    std::uniform_int_distribution<size_t> pick(0, list.size() - 1);
    return list[pick(rng_)];
}

// ============================================================================
// SHUTTLE CONTACT
// ============================================================================

void AirTraffic::bounceShuttles(const Biplane& biplane, const std::vector<Shuttle*>& shuttles) {
    Rect planeBounds = biplane.getCollisionBounds();
    
    for (Shuttle* shuttle : shuttles) {
        if (!shuttle || !shuttle->isActive()) continue;
        if (!shuttle->getHullBounds().overlaps(planeBounds)) continue;
        
        glm::vec2 delta = shuttle->getPosition() - biplane.getPosition();
        float norm = std::abs(delta.x) + std::abs(delta.y) + 0.1f;
        glm::vec2 push = delta / norm * BOUNCE_STRENGTH;
        
        glm::vec2 velocity = shuttle->getVelocity();
        shuttle->setVelocity(glm::vec2(velocity.x + push.x, velocity.y + push.y - 2.0f));
        
        if (audio_) {
            audio_->playSound("boing");
        }
        break;
    }
}

Biplane* AirTraffic::getBiplane() const {
    for (const auto& biplane : entities_.biplanes) {
        if (!biplane->isDestroyed()) return biplane.get();
    }
    return nullptr;
}

void AirTraffic::clear() {
    entities_.biplanes.clear();
    targetCountry_.clear();
    spawned_ = false;
}

} // namespace Lander
