/**
 * SessionScore.h
 * 
 * End-of-run scoring and the running destruction ledger
 * 
 * Features:
 * - Time bonus that shrinks with every second in the air
 * - Delivered goods scored with their own point table (not fuel values)
 * - Peace medal milestone bonus
 * - Destruction score and destroyed-building list fed by the bomb resolver
 */

#pragma once

#include "../core/Collaborators.h"
#include "../core/Types.h"
#include "../economy/CollectibleCatalog.h"
#include <string>
#include <vector>

namespace Lander {

class InventorySystem;

struct DeliveredItem {
    CollectibleType type;
    int count = 0;
};

struct DestroyedBuilding {
    std::string name;
    std::string country;
};

/**
 * Everything the game-over screen shows
 */
struct SessionReport {
    bool victory = false;
    std::string message;
    int elapsedSeconds = 0;
    int timeBonus = 0;
    int itemsTotal = 0;
    int milestoneBonus = 0;
    int total = 0;
    
    int destructionScore = 0;
    int tradeDeductions = 0;
    std::vector<DestroyedBuilding> destroyedBuildings;
    float fuelRemaining = 0.0f;
};

// ============================================================================
// DESTRUCTION LEDGER
// ============================================================================

/**
 * Running score kept while the session plays
 */
class DestructionLedger : public ScoreSink {
public:
    void addDestructionScore(int points) override;
    void addDestroyedBuilding(const std::string& name, const std::string& country) override;
    
    /** Score given up when goods are sold for fuel */
    void deductTrade(int baseValue);
    
    int getDestructionScore() const { return destructionScore_; }
    int getTradeDeductions() const { return tradeDeductions_; }
    int getScore() const { return destructionScore_ - tradeDeductions_; }
    const std::vector<DestroyedBuilding>& getDestroyedBuildings() const { return destroyed_; }
    
    void reset();
    
private:
    int destructionScore_ = 0;
    int tradeDeductions_ = 0;
    std::vector<DestroyedBuilding> destroyed_;
};

// ============================================================================
// SESSION SCORE
// ============================================================================

class SessionScore {
public:
    static constexpr int TIME_BONUS_CAP = 5000;
    static constexpr int TIME_BONUS_PER_SECOND = 10;
    static constexpr int DEFAULT_ITEM_POINTS = 50;
    static constexpr int PEACE_MEDAL_BONUS = 10000;
    
    /** Score points per unit; independent of the fuel table */
    static int getItemPoints(CollectibleType type);
    
    static int computeTimeBonus(TimeMs elapsedMs);
    static int computeItemsTotal(const std::vector<DeliveredItem>& delivered);
    
    static SessionReport compute(TimeMs elapsedMs, const std::vector<DeliveredItem>& delivered,
                                 bool deliveredPeaceMedal);
    
    /** Held goods at the end of a run */
    static std::vector<DeliveredItem> deliveredFrom(const InventorySystem& inventory);
    
    /** "m:ss" */
    static std::string formatTime(TimeMs elapsedMs);
};

} // namespace Lander
