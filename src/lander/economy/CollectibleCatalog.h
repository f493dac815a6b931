/**
 * CollectibleCatalog.h
 * 
 * Collectible item types and their fixed fuel values
 */

#pragma once

#include <array>
#include <optional>
#include <string>

namespace Lander {

enum class CollectibleType {
    // Food (droppable as bombs)
    Burger,
    Hamberder,
    DietCoke,
    TrumpSteak,
    Vodka,
    
    // Trade goods
    Dollar,
    Covfefe,
    HairSpray,
    Twitter,
    CasinoChip,
    MagaHat,
    Nft,
    Bitcoin,
    ClassifiedDocs,
    GoldenToilet,
    Matryoshka,
    OligarchGold,
    TanSuit,
    
    // Power-ups
    TrumpTower,
    RedTie,
    
    Count
};

constexpr size_t COLLECTIBLE_TYPE_COUNT = static_cast<size_t>(CollectibleType::Count);

enum class PowerUpEffect {
    None,
    BribeCannons,
    SpeedBoost
};

struct CollectibleInfo {
    CollectibleType type;
    const char* id;
    const char* name;
    int fuelValue;
    float rarity;
    bool mystery;
    bool russianOnly;
    PowerUpEffect special;
};

/** Food types in the order bombs are drawn from the inventory */
constexpr std::array<CollectibleType, 5> BOMB_DROPPABLE_TYPES = {
    CollectibleType::Burger,
    CollectibleType::Hamberder,
    CollectibleType::DietCoke,
    CollectibleType::TrumpSteak,
    CollectibleType::Vodka
};

/** Units granted by one food pickup */
constexpr int FOOD_PICKUP_AMOUNT = 3;

const CollectibleInfo& getCollectibleInfo(CollectibleType type);

const std::array<CollectibleInfo, COLLECTIBLE_TYPE_COUNT>& getCollectibleCatalog();

bool isBombDroppable(CollectibleType type);
bool isMysteryType(CollectibleType type);

std::optional<CollectibleType> collectibleFromId(const std::string& id);

inline size_t collectibleIndex(CollectibleType type) { return static_cast<size_t>(type); }

} // namespace Lander
