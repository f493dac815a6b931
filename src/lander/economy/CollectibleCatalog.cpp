/**
 * CollectibleCatalog.cpp
 */

#include "CollectibleCatalog.h"
#include <algorithm>

namespace Lander {

namespace {

using T = CollectibleType;
using P = PowerUpEffect;

const std::array<CollectibleInfo, COLLECTIBLE_TYPE_COUNT> kCatalog = {{
    {T::Burger,         "BURGER",          "Burger",          10,  0.15f,  false, false, P::None},
    {T::Hamberder,      "HAMBERDER",       "Hamberder",       12,  0.12f,  false, false, P::None},
    {T::DietCoke,       "DIET_COKE",       "Diet Coke",       15,  0.12f,  false, false, P::None},
    {T::TrumpSteak,     "TRUMP_STEAK",     "Trump Steak",     55,  0.05f,  false, false, P::None},
    {T::Vodka,          "VODKA",           "Vodka",           45,  0.05f,  false, true,  P::None},
    {T::Dollar,         "DOLLAR",          "Dollar",          25,  0.10f,  false, false, P::None},
    {T::Covfefe,        "COVFEFE",         "Covfefe",         30,  0.08f,  false, false, P::None},
    {T::HairSpray,      "HAIR_SPRAY",      "Hair Spray",      35,  0.07f,  false, false, P::None},
    {T::Twitter,        "TWITTER",         "Twitter Bird",    50,  0.06f,  false, false, P::None},
    {T::CasinoChip,     "CASINO_CHIP",     "Casino Chip",     0,   0.04f,  true,  false, P::None},
    {T::MagaHat,        "MAGA_HAT",        "MAGA Hat",        100, 0.03f,  false, false, P::None},
    {T::Nft,            "NFT",             "NFT",             5,   0.04f,  false, false, P::None},
    {T::Bitcoin,        "BITCOIN",         "Bitcoin",         80,  0.03f,  false, false, P::None},
    {T::ClassifiedDocs, "CLASSIFIED_DOCS", "Classified Docs", 120, 0.02f,  false, false, P::None},
    {T::GoldenToilet,   "GOLDEN_TOILET",   "Golden Toilet",   200, 0.01f,  false, false, P::None},
    {T::Matryoshka,     "MATRYOSHKA",      "Matryoshka",      60,  0.04f,  false, true,  P::None},
    {T::OligarchGold,   "OLIGARCH_GOLD",   "Oligarch Gold",   150, 0.015f, false, true,  P::None},
    {T::TanSuit,        "TAN_SUIT",        "Tan Suit",        40,  0.02f,  false, false, P::None},
    {T::TrumpTower,     "TRUMP_TOWER",     "Trump Tower",     0,   0.008f, false, false, P::BribeCannons},
    {T::RedTie,         "RED_TIE",         "Red Tie",         0,   0.01f,  false, false, P::SpeedBoost},
}};

} // namespace

const CollectibleInfo& getCollectibleInfo(CollectibleType type) {
    size_t index = collectibleIndex(type);
    if (index >= kCatalog.size()) index = 0;
    return kCatalog[index];
}

const std::array<CollectibleInfo, COLLECTIBLE_TYPE_COUNT>& getCollectibleCatalog() {
    return kCatalog;
}

bool isBombDroppable(CollectibleType type) {
    return std::find(BOMB_DROPPABLE_TYPES.begin(), BOMB_DROPPABLE_TYPES.end(), type) != BOMB_DROPPABLE_TYPES.end();
}

bool isMysteryType(CollectibleType type) {
    return getCollectibleInfo(type).mystery;
}

std::optional<CollectibleType> collectibleFromId(const std::string& id) {
    for (const auto& info : kCatalog) {
        if (id == info.id) return info.type;
    }
    return std::nullopt;
}

} // namespace Lander
