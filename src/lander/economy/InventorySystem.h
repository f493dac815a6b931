/**
 * InventorySystem.h
 * 
 * Per-player collectible counts
 * 
 * Features:
 * - Count per collectible type
 * - Casino chips carry individual random values, consumed oldest first
 * - All-or-nothing removal
 * - Change notification
 */

#pragma once

#include "CollectibleCatalog.h"
#include <array>
#include <deque>
#include <functional>
#include <random>
#include <vector>

namespace Lander {

struct InventoryItem {
    CollectibleType type = CollectibleType::Burger;
    int count = 0;
    int fuelValue = 0;
};

/**
 * Four-tier chip value distribution, heavily weighted toward the low tier
 */
struct CasinoChipTier {
    int minValue;
    int maxValue;
    double weight;
};

constexpr std::array<CasinoChipTier, 4> CASINO_CHIP_TIERS = {{
    {5, 15, 60.0},
    {20, 40, 25.0},
    {50, 100, 10.0},
    {150, 250, 5.0}
}};

class InventorySystem {
public:
    using ChangeCallback = std::function<void(const InventorySystem&)>;
    
    explicit InventorySystem(uint32_t seed = std::random_device{}());
    
    /** Add units. Casino chips draw one random value per unit */
    void add(CollectibleType type, int count = 1);
    
    /** Add casino chips with known values, in order */
    void addCasinoChips(const std::vector<int>& values);
    
    /**
     * Remove units. Fails without change if fewer than count are held.
     * Casino chips leave oldest first.
     */
    bool remove(CollectibleType type, int count = 1);
    
    int getCount(CollectibleType type) const;
    
    /** Sum of the oldest count chip values, without removing them */
    int getCasinoChipTotalValue(int count) const;
    
    const std::deque<int>& getCasinoChipValues() const { return casinoChipValues_; }
    
    /** Fuel value of everything held (chips at their own values) */
    int getTotalFuelValue() const;
    
    /** Types with count > 0 */
    std::vector<InventoryItem> getItems() const;
    
    /** Every type, including empty ones */
    std::vector<InventoryItem> getAllItems() const;
    
    /** First droppable food in drop order, if any */
    std::optional<CollectibleType> findBombPayload() const;
    
    void clear();
    
    void setOnChange(ChangeCallback callback) { onChange_ = std::move(callback); }
    
    /** Draw one chip value from the tier distribution */
    int rollCasinoChipValue();
    
private:
    void notifyChange();
    
    std::array<int, COLLECTIBLE_TYPE_COUNT> counts_{};
    std::deque<int> casinoChipValues_;
    std::mt19937 rng_;
    ChangeCallback onChange_;
};

} // namespace Lander
