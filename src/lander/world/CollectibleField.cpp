/**
 * CollectibleField.cpp
 */

#include "CollectibleField.h"
#include "../core/Collaborators.h"
#include "../core/WorldLayout.h"
#include "../economy/InventorySystem.h"
#include "../entities/Shuttle.h"
#include "../core/Log.h"

#include <algorithm>

namespace Lander {

CollectibleField::CollectibleField(const WorldLayout& layout, const TerrainQuery& terrain, AudioCue* audio,
                                   uint32_t seed)
    : layout_(layout)
    , terrain_(terrain)
    , audio_(audio)
    , rng_(seed) {
}

// ============================================================================
// SPAWNING
// ============================================================================

size_t CollectibleField::populate(float startX, float endX) {
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    size_t placed = 0;
    
    for (float x = startX + EDGE_MARGIN; x < endX - EDGE_MARGIN; x += SPACING + unit(rng_) * SPACING) {
        float surface = terrain_.getTerrainHeightAt(x);
        float y = surface - MIN_HOVER - unit(rng_) * HOVER_RANGE;
        addPickup(glm::vec2(x, y), rollType(x));
        placed++;
    }
    
    LANDER_LOG_INFO("Placed %zu collectibles between %.0f and %.0f", placed, startX, endX);
    return placed;
}

CollectibleType CollectibleField::rollType(float x) {
    bool russia = isInRussia(x);
    
    std::vector<CollectibleType> types;
    std::vector<double> weights;
    for (const auto& info : getCollectibleCatalog()) {
        if (info.rarity <= 0.0f) continue;
        if (info.russianOnly && !russia) continue;
        types.push_back(info.type);
        weights.push_back(info.rarity);
    }
    
    if (types.empty()) return CollectibleType::Burger;
    
    std::discrete_distribution<size_t> pick(weights.begin(), weights.end());
    return types[pick(rng_)];
}

WorldPickup& CollectibleField::addPickup(const glm::vec2& position, CollectibleType type) {
    WorldPickup pickup;
    pickup.position = position;
    pickup.type = type;
    pickup.count = unitsPerPickup(type);
    pickup.pickupRadius = PICKUP_RADIUS;
    pickups_.push_back(pickup);
    return pickups_.back();
}

void CollectibleField::spawnDrop(const SecondaryDrop& drop, TimeMs now) {
    if (drop.kind == "classified_files") {
        // Files flutter down and wait on the ground for a landed shuttle
        for (const auto& pos : drop.positions) {
            WorldPickup& file = addPickup(glm::vec2(pos.x, terrain_.getTerrainHeightAt(pos.x) - GROUND_OFFSET),
                                          CollectibleType::ClassifiedDocs);
            file.source = PickupSource::ClassifiedFiles;
            file.pickupRadius = GROUND_PICKUP_RADIUS;
            file.requiresLanding = true;
            file.despawnAt = now + DROP_LIFETIME_MS;
        }
    } else if (drop.kind == "fish_package") {
        // Whatever the boat was smuggling floats on the surface
        for (const auto& pos : drop.positions) {
            WorldPickup& package = addPickup(glm::vec2(pos.x, terrain_.getTerrainHeightAt(pos.x) - FLOAT_OFFSET),
                                             rollType(pos.x));
            package.source = PickupSource::FishPackage;
            package.despawnAt = now + DROP_LIFETIME_MS;
        }
    } else {
        LANDER_LOG_WARN("Unknown secondary drop '%s'", drop.kind.c_str());
    }
}

// ============================================================================
// PICKUP
// ============================================================================

std::vector<PickupEvent> CollectibleField::collect(const Shuttle& shuttle, InventorySystem& inventory, TimeMs now) {
    std::vector<PickupEvent> events;
    if (!shuttle.isActive()) return events;
    
    const glm::vec2& pos = shuttle.getPosition();
    bool landed = shuttle.getSpeed() < LANDED_SPEED;
    
    for (auto& pickup : pickups_) {
        if (pickup.collected || now >= pickup.despawnAt) continue;
        if (pickup.requiresLanding && !landed) continue;
        if (glm::length(pos - pickup.position) >= pickup.pickupRadius) continue;
    
        pickup.collected = true;
        inventory.add(pickup.type, pickup.count);
        events.push_back({pickup.type, pickup.count, pickup.position});
    
        if (audio_) {
            audio_->playSound(pickup.requiresLanding ? "boing" : "pickup");
        }
        LANDER_LOG_DEBUG("Picked up %d x %s", pickup.count, getCollectibleInfo(pickup.type).name);
    }
    
    return events;
}

void CollectibleField::update(TimeMs now) {
    size_t before = pickups_.size();
    pickups_.erase(std::remove_if(pickups_.begin(), pickups_.end(),
                                  [now](const WorldPickup& pickup) {
                                      return pickup.collected || now >= pickup.despawnAt;
                                  }),
                   pickups_.end());
    
    if (pickups_.size() != before) {
        LANDER_LOG_DEBUG("Removed %zu collectibles", before - pickups_.size());
    }
}

void CollectibleField::clear() {
    pickups_.clear();
}

int CollectibleField::unitsPerPickup(CollectibleType type) {
    return isBombDroppable(type) ? FOOD_PICKUP_AMOUNT : 1;
}

bool CollectibleField::isInRussia(float x) const {
    return layout_.countryAt(x).name == "Russia";
}

} // namespace Lander
