/**
 * SessionScore.cpp
 */

#include "SessionScore.h"
#include "../economy/InventorySystem.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace Lander {

// ============================================================================
// DESTRUCTION LEDGER
// ============================================================================

void DestructionLedger::addDestructionScore(int points) {
    destructionScore_ += points;
}

void DestructionLedger::addDestroyedBuilding(const std::string& name, const std::string& country) {
    destroyed_.push_back({name, country});
}

void DestructionLedger::deductTrade(int baseValue) {
    if (baseValue > 0) {
        tradeDeductions_ += baseValue;
    }
}

void DestructionLedger::reset() {
    destructionScore_ = 0;
    tradeDeductions_ = 0;
    destroyed_.clear();
}

// ============================================================================
// SESSION SCORE
// ============================================================================

int SessionScore::getItemPoints(CollectibleType type) {
    switch (type) {
        case CollectibleType::MagaHat: return 500;
        case CollectibleType::Twitter: return 200;
        case CollectibleType::Dollar: return 100;
        case CollectibleType::Burger: return 50;
        default: return DEFAULT_ITEM_POINTS;
    }
}

int SessionScore::computeTimeBonus(TimeMs elapsedMs) {
    int seconds = static_cast<int>(std::floor(std::max(0.0, elapsedMs) / 1000.0));
    return std::max(0, TIME_BONUS_CAP - seconds * TIME_BONUS_PER_SECOND);
}

int SessionScore::computeItemsTotal(const std::vector<DeliveredItem>& delivered) {
    int total = 0;
    for (const auto& item : delivered) {
        if (item.count <= 0) continue;
        total += getItemPoints(item.type) * item.count;
    }
    return total;
}

SessionReport SessionScore::compute(TimeMs elapsedMs, const std::vector<DeliveredItem>& delivered,
                                    bool deliveredPeaceMedal) {
    SessionReport report;
    report.elapsedSeconds = static_cast<int>(std::floor(std::max(0.0, elapsedMs) / 1000.0));
    report.timeBonus = computeTimeBonus(elapsedMs);
    report.itemsTotal = computeItemsTotal(delivered);
    report.milestoneBonus = deliveredPeaceMedal ? PEACE_MEDAL_BONUS : 0;
    report.total = report.timeBonus + report.itemsTotal + report.milestoneBonus;
    return report;
}

std::vector<DeliveredItem> SessionScore::deliveredFrom(const InventorySystem& inventory) {
    std::vector<DeliveredItem> delivered;
    for (const auto& item : inventory.getItems()) {
        delivered.push_back({item.type, item.count});
    }
    return delivered;
}

std::string SessionScore::formatTime(TimeMs elapsedMs) {
    int totalSeconds = static_cast<int>(std::floor(std::max(0.0, elapsedMs) / 1000.0));
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%d:%02d", totalSeconds / 60, totalSeconds % 60);
    return buffer;
}

} // namespace Lander
