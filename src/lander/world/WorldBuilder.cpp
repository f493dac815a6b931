/**
 * WorldBuilder.cpp
 */

#include "WorldBuilder.h"
#include "../core/Collaborators.h"
#include "../core/WorldLayout.h"
#include "../entities/WorldEntities.h"
#include "../settings/QualityPresets.h"
#include "../core/Log.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <unordered_map>

namespace Lander {

namespace {

struct CountryNames {
    std::vector<std::string> buildings;
    std::vector<std::string> landmarks;
};

const std::unordered_map<std::string, CountryNames>& namesByCountry() {
    static const std::unordered_map<std::string, CountryNames> names = {
        {"Washington DC", {{"White House", "Capitol Building", "Washington Monument", "Lincoln Memorial",
                            "Supreme Court", "Smithsonian Castle", "National Archives", "Library of Congress"},
                           {"Space Needle", "Pike Place Market", "Mount Rainier", "Grand Coulee Dam"}}},
        {"USA", {{"One World Trade Center", "Willis Tower", "Chrysler Building", "Flatiron Building",
                  "Pentagon", "Independence Hall", "Guggenheim Museum", "Monticello"},
                 {"Statue of Liberty", "Golden Gate Bridge", "Mount Rushmore", "Gateway Arch"}}},
        {"United Kingdom", {{"Big Ben", "Tower Bridge", "Buckingham Palace", "Westminster Abbey",
                             "The Shard", "The Gherkin", "London Eye", "Tower of London"},
                            {"Stonehenge", "Angel of the North", "Edinburgh Castle", "Windsor Castle"}}},
        {"France", {{"Eiffel Tower", "Louvre Museum", "Notre Dame", "Sacre Coeur",
                     "Arc de Triomphe", "Centre Pompidou", "Les Invalides", "Pantheon"},
                    {"Mont Saint-Michel", "Palace of Versailles", "Pont du Gard", "Carcassonne"}}},
        {"Germany", {{"Brandenburg Gate", "Reichstag", "Cologne Cathedral", "Berlin TV Tower",
                      "Berlin Cathedral", "Elbphilharmonie Hamburg", "Heidelberg Castle", "Holstentor Lubeck"},
                     {"Neuschwanstein Castle", "Zwinger Palace Dresden", "Porta Nigra Trier", "Schwerin Castle"}}},
        {"Poland", {{"Wawel Castle", "Malbork Castle", "St Marys Basilica", "Palace of Culture",
                     "Warsaw Old Town", "Cloth Hall Krakow", "Royal Castle Warsaw", "Poznan Town Hall"},
                    {"Moszna Castle", "Ksiaz Castle", "Crooked House Sopot", "Wooden Church"}}},
        {"Russia", {{"Red Square", "Moscow Kremlin", "St Isaacs Cathedral", "Winter Palace",
                     "Bolshoi Theatre", "Tretyakov Gallery", "Admiralty Building", "GUM Department Store"},
                    {"Church on Spilled Blood", "Peterhof Palace", "Kizhi Pogost", "Catherine Palace"}}},
    };
    return names;
}

} // namespace

WorldBuilder::WorldBuilder(const WorldLayout& layout, const TerrainQuery& terrain, EffectSink* effects, uint32_t seed)
    : layout_(layout)
    , terrain_(terrain)
    , effects_(effects)
    , rng_(seed) {
}

WorldBuildStats WorldBuilder::build(WorldEntities& entities, const QualityPreset& preset) {
    WorldBuildStats stats;
    stats.cannons = buildCannons(entities, preset.cannonMultiplier);
    stats.buildings = buildDecorations(entities);
    stats.medalHouse = buildMedalHouse(entities);
    stats.oilTowers = buildOilTowers(entities);
    
    LANDER_LOG_INFO("World built: %d buildings, %d cannons, %d oil towers",
                    stats.buildings, stats.cannons, stats.oilTowers);
    return stats;
}

// ============================================================================
// CANNONS
// ============================================================================

int WorldBuilder::thinnedCannonCount(int fullCount, float cannonMultiplier) {
    if (fullCount <= 0 || cannonMultiplier <= 0.0f) return 0;
    int kept = static_cast<int>(std::ceil(static_cast<float>(fullCount) * cannonMultiplier));
    return std::min(kept, fullCount);
}

int WorldBuilder::buildCannons(WorldEntities& entities, float cannonMultiplier) {
    int created = 0;
    const auto& countries = layout_.getCountries();
    
    for (size_t c = 0; c < countries.size(); ++c) {
        const CountryInfo& country = countries[c];
        if (country.cannonDensity <= 0.0f) continue;
        
        float endX = c + 1 < countries.size() ? countries[c + 1].startX : WORLD_WIDTH;
        float width = endX - country.startX;
        
        int fullCount = static_cast<int>(std::floor(width * country.cannonDensity / CANNON_SPACING));
        int count = thinnedCannonCount(fullCount, cannonMultiplier);
        
        for (int i = 0; i < count; ++i) {
            float x = country.startX + (width / static_cast<float>(count + 1)) * static_cast<float>(i + 1);
            if (isNearPad(x, CANNON_PAD_CLEARANCE)) continue;
            
            float y = terrain_.getTerrainHeightAt(x) - 15.0f;
            entities.cannons.push_back(std::make_unique<Cannon>(glm::vec2(x, y), country.name, effects_));
            created++;
        }
    }
    return created;
}

// ============================================================================
// DECORATIONS
// ============================================================================

int WorldBuilder::buildDecorations(WorldEntities& entities) {
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    std::set<std::string> usedNames;
    int created = 0;
    
    const auto& allNames = namesByCountry();
    
    for (float x = WORLD_START_X + 400.0f; x < WORLD_WIDTH - 400.0f;
         x += PLATEAU_SPACING + unit(rng_) * PLATEAU_JITTER) {
        if (layout_.isOverWater(x)) continue;
        
        bool nearPad = false;
        for (const auto& pad : layout_.getLandingPads()) {
            if (std::abs(x - pad.x) < pad.width + 200.0f) {
                nearPad = true;
                break;
            }
        }
        if (nearPad) continue;
        
        const CountryInfo& country = layout_.countryAt(x);
        auto names = allNames.find(country.name);
        if (names == allNames.end()) continue;
        
        if (unit(rng_) > PLACEMENT_CHANCE) continue;
        
        float groundY = terrain_.getTerrainHeightAt(x);
        bool nearCannon = false;
        for (const auto& cannon : entities.cannons) {
            if (glm::length(cannon->getPosition() - glm::vec2(x, groundY)) < CANNON_CLEARANCE) {
                nearCannon = true;
                break;
            }
        }
        if (nearCannon) continue;
        
        // Fall back to the other list once one runs out of unused names
        bool landmark = unit(rng_) < LANDMARK_CHANCE;
        std::vector<int> available;
        for (int attempt = 0; attempt < 2 && available.empty(); ++attempt) {
            if (attempt == 1) landmark = !landmark;
            const auto& list = landmark ? names->second.landmarks : names->second.buildings;
            for (size_t i = 0; i < list.size(); ++i) {
                if (!usedNames.count(list[i])) available.push_back(static_cast<int>(i));
            }
        }
        if (available.empty()) continue;
        
        std::uniform_int_distribution<size_t> pick(0, available.size() - 1);
        int index = available[pick(rng_)];
        const std::string& name = landmark ? names->second.landmarks[index] : names->second.buildings[index];
        usedNames.insert(name);
        
        float height = (120.0f + unit(rng_) * 60.0f) * 0.9f;
        float width = 50.0f + unit(rng_) * 60.0f;
        
        entities.buildings.push_back(std::make_unique<Building>(
            glm::vec2(x, groundY), width, height, name, country.name, index, landmark, effects_));
        created++;
    }
    
    return created;
}

bool WorldBuilder::buildMedalHouse(WorldEntities& entities) {
    for (const auto& pad : layout_.getLandingPads()) {
        if (!pad.isWashington) continue;
        
        float x = pad.x - MEDAL_HOUSE_OFFSET;
        float y = terrain_.getTerrainHeightAt(x);
        entities.buildings.push_back(std::make_unique<MedalHouse>(
            glm::vec2(x, y), 80.0f, 90.0f, layout_.countryAt(x).name, effects_));
        return true;
    }
    return false;
}

int WorldBuilder::buildOilTowers(WorldEntities& entities) {
    int created = 0;
    for (const auto& pad : layout_.getLandingPads()) {
        if (!layout_.isOverWater(pad.x)) continue;
        
        // Derrick stands on the platform deck beside the pad
        float x = pad.x + pad.width * 0.5f + 20.0f;
        float y = terrain_.getTerrainHeightAt(pad.x) - 8.0f;
        entities.oilTowers.push_back(std::make_unique<OilTower>(glm::vec2(x, y), layout_.countryAt(pad.x).name, effects_));
        created++;
    }
    return created;
}

bool WorldBuilder::isNearPad(float x, float extraMargin) const {
    for (const auto& pad : layout_.getLandingPads()) {
        if (std::abs(pad.x - x) < extraMargin) return true;
    }
    return false;
}

} // namespace Lander
