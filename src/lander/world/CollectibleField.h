/**
 * CollectibleField.h
 *
 * Collectibles lying around the world and their pickup by shuttles
 *
 * Features:
 * - Journey spawn with rarity-weighted types; Russian goods only in Russia
 * - Food pickups grant a bundle of bomb payloads
 * - Secondary drops from destroyed vehicles become pickups
 * - Ground drops need a near-stationary shuttle and despawn after a while
 */

#pragma once

#include "../core/Types.h"
#include "../economy/CollectibleCatalog.h"
#include <glm/glm.hpp>
#include <limits>
#include <random>
#include <vector>

namespace Lander {

class WorldLayout;
class TerrainQuery;
class AudioCue;
class InventorySystem;
class Shuttle;
struct SecondaryDrop;

enum class PickupSource {
    Journey,            // Placed along the route at session start
    ClassifiedFiles,    // Thrown clear of the golf cart
    FishPackage         // Floated up from the fisher boat
};

/**
 * One collectible in the world
 */
struct WorldPickup {
    glm::vec2 position{0.0f};
    CollectibleType type = CollectibleType::Burger;
    int count = 1;
    PickupSource source = PickupSource::Journey;
    
    float pickupRadius = 30.0f;
    bool requiresLanding = false;           // Shuttle must be nearly stopped
    TimeMs despawnAt = std::numeric_limits<double>::infinity();
    bool collected = false;
};

/**
 * Result of one pickup, for the host's popup text
 */
struct PickupEvent {
    CollectibleType type = CollectibleType::Burger;
    int count = 0;
    glm::vec2 position{0.0f};
};

class CollectibleField {
public:
    static constexpr float SPACING = 300.0f;
    static constexpr float EDGE_MARGIN = 200.0f;
    static constexpr float MIN_HOVER = 50.0f;
    static constexpr float HOVER_RANGE = 150.0f;
    static constexpr float PICKUP_RADIUS = 30.0f;
    static constexpr float GROUND_PICKUP_RADIUS = 60.0f;
    static constexpr float LANDED_SPEED = 0.5f;
    static constexpr float GROUND_OFFSET = 15.0f;
    static constexpr float FLOAT_OFFSET = 20.0f;
    static constexpr TimeMs DROP_LIFETIME_MS = 12000.0;
    
    CollectibleField(const WorldLayout& layout, const TerrainQuery& terrain, AudioCue* audio,
                     uint32_t seed = std::random_device{}());
    
    /**
     * Scatter collectibles between startX and endX, one every SPACING to
     * 2 * SPACING, floating above the surface
     * @return Number placed
     */
    size_t populate(float startX, float endX);
    
    /** Rarity-weighted type for a spot; Russian-only goods need x inside Russia */
    CollectibleType rollType(float x);
    
    /** Add a pickup directly (journey rules, no despawn) */
    WorldPickup& addPickup(const glm::vec2& position, CollectibleType type);
    
    /** Turn a destroyed vehicle's drop into pickups */
    void spawnDrop(const SecondaryDrop& drop, TimeMs now);
    
    /**
     * Hand every pickup the shuttle touches to the inventory
     * @return What was picked up this call
     */
    std::vector<PickupEvent> collect(const Shuttle& shuttle, InventorySystem& inventory, TimeMs now);
    
    /** Drop collected and expired pickups */
    void update(TimeMs now);
    
    const std::vector<WorldPickup>& getPickups() const { return pickups_; }
    size_t getPickupCount() const { return pickups_.size(); }
    
    void clear();
    
    /** Units one pickup of this type grants */
    static int unitsPerPickup(CollectibleType type);

private:
    bool isInRussia(float x) const;
    
    const WorldLayout& layout_;
    const TerrainQuery& terrain_;
    AudioCue* audio_;
    std::mt19937 rng_;
    
    std::vector<WorldPickup> pickups_;
};

} // namespace Lander
