/**
 * InventorySystem.cpp
 */

#include "InventorySystem.h"
#include <algorithm>
#include <numeric>

namespace Lander {

InventorySystem::InventorySystem(uint32_t seed)
    : rng_(seed) {
}

void InventorySystem::add(CollectibleType type, int count) {
    if (count <= 0 || collectibleIndex(type) >= COLLECTIBLE_TYPE_COUNT) return;
    
    counts_[collectibleIndex(type)] += count;
    
    if (isMysteryType(type)) {
        for (int i = 0; i < count; ++i) {
            casinoChipValues_.push_back(rollCasinoChipValue());
        }
    }
    
    notifyChange();
}

void InventorySystem::addCasinoChips(const std::vector<int>& values) {
    if (values.empty()) return;
    
    counts_[collectibleIndex(CollectibleType::CasinoChip)] += static_cast<int>(values.size());
    casinoChipValues_.insert(casinoChipValues_.end(), values.begin(), values.end());
    notifyChange();
}

bool InventorySystem::remove(CollectibleType type, int count) {
    if (count <= 0 || collectibleIndex(type) >= COLLECTIBLE_TYPE_COUNT) return false;
    
    int& current = counts_[collectibleIndex(type)];
    if (current < count) return false;
    
    current -= count;
    
    if (isMysteryType(type)) {
        for (int i = 0; i < count && !casinoChipValues_.empty(); ++i) {
            casinoChipValues_.pop_front();
        }
    }
    
    notifyChange();
    return true;
}

int InventorySystem::getCount(CollectibleType type) const {
    size_t index = collectibleIndex(type);
    return index < COLLECTIBLE_TYPE_COUNT ? counts_[index] : 0;
}

int InventorySystem::getCasinoChipTotalValue(int count) const {
    if (count <= 0) return 0;
    
    size_t n = std::min(static_cast<size_t>(count), casinoChipValues_.size());
    return std::accumulate(casinoChipValues_.begin(), casinoChipValues_.begin() + static_cast<std::ptrdiff_t>(n), 0);
}

int InventorySystem::getTotalFuelValue() const {
    int total = 0;
    for (const auto& info : getCollectibleCatalog()) {
        if (info.mystery) continue;
        total += counts_[collectibleIndex(info.type)] * info.fuelValue;
    }
    total += std::accumulate(casinoChipValues_.begin(), casinoChipValues_.end(), 0);
    return total;
}

std::vector<InventoryItem> InventorySystem::getItems() const {
    std::vector<InventoryItem> result;
    for (const auto& info : getCollectibleCatalog()) {
        int count = counts_[collectibleIndex(info.type)];
        if (count > 0) {
            result.push_back({info.type, count, info.fuelValue});
        }
    }
    return result;
}

std::vector<InventoryItem> InventorySystem::getAllItems() const {
    std::vector<InventoryItem> result;
    result.reserve(COLLECTIBLE_TYPE_COUNT);
    for (const auto& info : getCollectibleCatalog()) {
        result.push_back({info.type, counts_[collectibleIndex(info.type)], info.fuelValue});
    }
    return result;
}

std::optional<CollectibleType> InventorySystem::findBombPayload() const {
    for (CollectibleType type : BOMB_DROPPABLE_TYPES) {
        if (getCount(type) > 0) return type;
    }
    return std::nullopt;
}

void InventorySystem::clear() {
    counts_.fill(0);
    casinoChipValues_.clear();
    notifyChange();
}

int InventorySystem::rollCasinoChipValue() {
    std::discrete_distribution<size_t> tierPick({
        CASINO_CHIP_TIERS[0].weight,
        CASINO_CHIP_TIERS[1].weight,
        CASINO_CHIP_TIERS[2].weight,
        CASINO_CHIP_TIERS[3].weight
    });
    const CasinoChipTier& tier = CASINO_CHIP_TIERS[tierPick(rng_)];
    std::uniform_int_distribution<int> value(tier.minValue, tier.maxValue);
    return value(rng_);
}

void InventorySystem::notifyChange() {
    if (onChange_) {
        onChange_(*this);
    }
}

} // namespace Lander
