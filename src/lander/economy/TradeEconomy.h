/**
 * TradeEconomy.h
 * 
 * Selling inventory for fuel at landing pads
 * 
 * Features:
 * - Sellable-item filter (contraband food is never sold)
 * - Landing-quality fuel bonus
 * - Two auto-sell allocation strategies; the executor keeps the one that
 *   wastes the least fuel
 * - Manual orders with the same pricing
 * - Plans execute at most once
 * 
 * Fuel granted is floor(base * bonus) while the score lost is the base value.
 */

#pragma once

#include "CollectibleCatalog.h"
#include <optional>
#include <vector>

namespace Lander {

class InventorySystem;
class FuelTank;

enum class LandingQuality {
    Perfect,
    Good,
    Rough
};

const char* landingQualityName(LandingQuality quality);

/** Fuel multiplier for the landing that opened the trade */
float getLandingBonus(LandingQuality quality);

enum class TradeStrategy {
    None,
    CheapestFirst,      // Cheapest units across all types
    SingleType          // Shortest covering run of one type
};

const char* tradeStrategyName(TradeStrategy strategy);

struct TradeLine {
    CollectibleType type = CollectibleType::Dollar;
    int count = 0;
    int baseValue = 0;
};

/**
 * Units chosen for sale. Built by planAutoTrade() or from a manual order,
 * consumed by TradeEconomy::execute().
 */
struct TradePlan {
    TradeStrategy strategy = TradeStrategy::None;
    std::vector<TradeLine> lines;
    int baseValue = 0;
    bool coversDeficit = false;
    bool executed = false;
    
    bool isEmpty() const { return lines.empty(); }
    int getUnitCount() const;
    int getCount(CollectibleType type) const;
};

struct TradeResult {
    int fuelGranted = 0;
    int scoreLost = 0;
    int unitsSold = 0;
};

/**
 * Player-selected sale quantities
 */
struct TradeOrder {
    std::vector<std::pair<CollectibleType, int>> quantities;
    
    void set(CollectibleType type, int count);
};

class TradeEconomy {
public:
    /** count > 0, has value (or is the mystery type), and not bomb food */
    static bool isSellable(const InventorySystem& inventory, CollectibleType type);
    
    /**
     * Choose units to cover a fuel deficit.
     * Both strategies are evaluated; the smaller covering total wins, ties go to
     * the single-type plan. Without any covering plan the larger partial is kept.
     */
    static TradePlan planAutoTrade(const InventorySystem& inventory, float deficit);
    
    /** Cheapest-unit-first accumulation across every sellable type */
    static TradePlan planCheapestFirst(const InventorySystem& inventory, float deficit);
    
    /** Smallest covering prefix of a single type */
    static TradePlan planSingleType(const InventorySystem& inventory, float deficit);
    
    /** Plan for a manual order; quantities above the held count are clamped */
    static TradePlan planOrder(const InventorySystem& inventory, const TradeOrder& order);
    
    /**
     * Remove the planned units and add the bonus-scaled fuel.
     * @return std::nullopt if the plan already ran, is empty, or the inventory
     *         no longer holds the planned units
     */
    static std::optional<TradeResult> execute(TradePlan& plan, InventorySystem& inventory,
                                              FuelTank& fuel, LandingQuality quality);
    
    /** Fuel the plan would grant at the given landing quality */
    static int previewFuel(const TradePlan& plan, LandingQuality quality);
};

} // namespace Lander
