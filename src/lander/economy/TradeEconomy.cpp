/**
 * TradeEconomy.cpp
 */

#include "TradeEconomy.h"
#include "InventorySystem.h"
#include "FuelTank.h"
#include "../core/Log.h"
#include <algorithm>
#include <cmath>

namespace Lander {

namespace {

/**
 * Per-unit values of one sellable type in the order they would be sold.
 * Casino chips keep their stored (oldest first) order.
 */
struct UnitQueue {
    CollectibleType type;
    bool mystery;
    std::vector<int> values;
    size_t next = 0;
    
    bool hasNext() const { return next < values.size(); }
    int head() const { return values[next]; }
};

std::vector<UnitQueue> buildUnitQueues(const InventorySystem& inventory) {
    std::vector<UnitQueue> queues;
    
    for (const auto& info : getCollectibleCatalog()) {
        if (!TradeEconomy::isSellable(inventory, info.type)) continue;
        
        UnitQueue queue{info.type, info.mystery, {}, 0};
        int count = inventory.getCount(info.type);
        
        if (info.mystery) {
            const auto& chips = inventory.getCasinoChipValues();
            size_t n = std::min(static_cast<size_t>(count), chips.size());
            queue.values.assign(chips.begin(), chips.begin() + static_cast<std::ptrdiff_t>(n));
        } else {
            queue.values.assign(static_cast<size_t>(count), info.fuelValue);
        }
        
        if (!queue.values.empty()) {
            queues.push_back(std::move(queue));
        }
    }
    
    return queues;
}

void addUnit(TradePlan& plan, CollectibleType type, int value) {
    for (auto& line : plan.lines) {
        if (line.type == type) {
            line.count++;
            line.baseValue += value;
            plan.baseValue += value;
            return;
        }
    }
    plan.lines.push_back({type, 1, value});
    plan.baseValue += value;
}

// Strictly cheaper head wins; on equal value regular goods go before the mystery type
bool sellsBefore(const UnitQueue& a, const UnitQueue& b) {
    if (a.head() != b.head()) return a.head() < b.head();
    return !a.mystery && b.mystery;
}

} // anonymous namespace

// ============================================================================
// LANDING BONUS
// ============================================================================

const char* landingQualityName(LandingQuality quality) {
    switch (quality) {
        case LandingQuality::Perfect: return "perfect";
        case LandingQuality::Good: return "good";
        case LandingQuality::Rough: return "rough";
    }
    return "rough";
}

float getLandingBonus(LandingQuality quality) {
    switch (quality) {
        case LandingQuality::Perfect: return 1.5f;
        case LandingQuality::Good: return 1.25f;
        case LandingQuality::Rough: return 1.0f;
    }
    return 1.0f;
}

const char* tradeStrategyName(TradeStrategy strategy) {
    switch (strategy) {
        case TradeStrategy::None: return "none";
        case TradeStrategy::CheapestFirst: return "cheapest_first";
        case TradeStrategy::SingleType: return "single_type";
    }
    return "none";
}

// ============================================================================
// PLANS
// ============================================================================

int TradePlan::getUnitCount() const {
    int total = 0;
    for (const auto& line : lines) {
        total += line.count;
    }
    return total;
}

int TradePlan::getCount(CollectibleType type) const {
    for (const auto& line : lines) {
        if (line.type == type) return line.count;
    }
    return 0;
}

void TradeOrder::set(CollectibleType type, int count) {
    for (auto& entry : quantities) {
        if (entry.first == type) {
            entry.second = count;
            return;
        }
    }
    quantities.emplace_back(type, count);
}

bool TradeEconomy::isSellable(const InventorySystem& inventory, CollectibleType type) {
    if (collectibleIndex(type) >= COLLECTIBLE_TYPE_COUNT) return false;
    
    const CollectibleInfo& info = getCollectibleInfo(type);
    return inventory.getCount(type) > 0 &&
           (info.fuelValue > 0 || info.mystery) &&
           !isBombDroppable(type);
}

TradePlan TradeEconomy::planCheapestFirst(const InventorySystem& inventory, float deficit) {
    TradePlan plan;
    plan.strategy = TradeStrategy::CheapestFirst;
    
    if (deficit <= 0.0f) {
        plan.coversDeficit = true;
        return plan;
    }
    
    std::vector<UnitQueue> queues = buildUnitQueues(inventory);
    
    while (static_cast<float>(plan.baseValue) < deficit) {
        UnitQueue* cheapest = nullptr;
        for (auto& queue : queues) {
            if (!queue.hasNext()) continue;
            if (!cheapest || sellsBefore(queue, *cheapest)) {
                cheapest = &queue;
            }
        }
        
        if (!cheapest) break;
        
        addUnit(plan, cheapest->type, cheapest->head());
        cheapest->next++;
    }
    
    plan.coversDeficit = static_cast<float>(plan.baseValue) >= deficit;
    return plan;
}

TradePlan TradeEconomy::planSingleType(const InventorySystem& inventory, float deficit) {
    TradePlan plan;
    plan.strategy = TradeStrategy::SingleType;
    
    if (deficit <= 0.0f) {
        plan.coversDeficit = true;
        return plan;
    }
    
    std::vector<UnitQueue> queues = buildUnitQueues(inventory);
    
    const UnitQueue* bestCovering = nullptr;
    size_t bestCoveringCount = 0;
    int bestCoveringValue = 0;
    
    const UnitQueue* bestPartial = nullptr;
    int bestPartialValue = 0;
    
    for (const auto& queue : queues) {
        int total = 0;
        size_t used = 0;
        while (used < queue.values.size() && static_cast<float>(total) < deficit) {
            total += queue.values[used];
            used++;
        }
        
        if (static_cast<float>(total) >= deficit) {
            bool better = !bestCovering || total < bestCoveringValue ||
                          (total == bestCoveringValue && bestCovering->mystery && !queue.mystery);
            if (better) {
                bestCovering = &queue;
                bestCoveringCount = used;
                bestCoveringValue = total;
            }
        } else if (!bestPartial || total > bestPartialValue) {
            bestPartial = &queue;
            bestPartialValue = total;
        }
    }
    
    const UnitQueue* chosen = bestCovering ? bestCovering : bestPartial;
    if (!chosen) return plan;
    
    size_t count = bestCovering ? bestCoveringCount : chosen->values.size();
    for (size_t i = 0; i < count; ++i) {
        addUnit(plan, chosen->type, chosen->values[i]);
    }
    
    plan.coversDeficit = bestCovering != nullptr;
    return plan;
}

TradePlan TradeEconomy::planAutoTrade(const InventorySystem& inventory, float deficit) {
    TradePlan cheapest = planCheapestFirst(inventory, deficit);
    TradePlan single = planSingleType(inventory, deficit);
    
    if (cheapest.coversDeficit && single.coversDeficit) {
        return single.baseValue <= cheapest.baseValue ? single : cheapest;
    }
    if (single.coversDeficit) return single;
    if (cheapest.coversDeficit) return cheapest;
    
    return single.baseValue >= cheapest.baseValue ? single : cheapest;
}

TradePlan TradeEconomy::planOrder(const InventorySystem& inventory, const TradeOrder& order) {
    TradePlan plan;
    plan.strategy = TradeStrategy::None;
    
    for (const auto& [type, requested] : order.quantities) {
        if (requested <= 0 || !isSellable(inventory, type)) continue;
        
        int count = std::min(requested, inventory.getCount(type));
        const CollectibleInfo& info = getCollectibleInfo(type);
        int value = info.mystery ? inventory.getCasinoChipTotalValue(count) : count * info.fuelValue;
        
        plan.lines.push_back({type, count, value});
        plan.baseValue += value;
    }
    
    plan.coversDeficit = !plan.lines.empty();
    return plan;
}

// ============================================================================
// EXECUTION
// ============================================================================

int TradeEconomy::previewFuel(const TradePlan& plan, LandingQuality quality) {
    return static_cast<int>(std::floor(static_cast<float>(plan.baseValue) * getLandingBonus(quality)));
}

std::optional<TradeResult> TradeEconomy::execute(TradePlan& plan, InventorySystem& inventory,
                                                 FuelTank& fuel, LandingQuality quality) {
    if (plan.executed) {
        LANDER_LOG_WARN("Trade plan already executed");
        return std::nullopt;
    }
    if (plan.isEmpty()) return std::nullopt;
    
    // All lines must still be held before anything is removed
    for (const auto& line : plan.lines) {
        if (inventory.getCount(line.type) < line.count) {
            LANDER_LOG_WARN("Trade plan is stale: %s no longer held", getCollectibleInfo(line.type).name);
            return std::nullopt;
        }
    }
    
    TradeResult result;
    for (const auto& line : plan.lines) {
        int value = isMysteryType(line.type) ? inventory.getCasinoChipTotalValue(line.count)
                                             : line.count * getCollectibleInfo(line.type).fuelValue;
        inventory.remove(line.type, line.count);
        result.scoreLost += value;
        result.unitsSold += line.count;
    }
    
    result.fuelGranted = static_cast<int>(std::floor(static_cast<float>(result.scoreLost) * getLandingBonus(quality)));
    fuel.add(static_cast<float>(result.fuelGranted));
    plan.executed = true;
    
    LANDER_LOG_DEBUG("Trade (%s): sold %d units for %d fuel, -%d score",
                     tradeStrategyName(plan.strategy), result.unitsSold, result.fuelGranted, result.scoreLost);
    return result;
}

} // namespace Lander
