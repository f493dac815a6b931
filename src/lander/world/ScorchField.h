/**
 * ScorchField.h
 * 
 * Persistent scorch marks and ocean pollution
 * 
 * Features:
 * - Thrust raycast that scorches terrain, buildings and pad tops
 * - Thrust over open water raises the pollution level instead
 * - Bomb craters
 * - Preset-driven mark cap, evicting marks furthest from the player
 * - Clearing marks under a destroyed building
 */

#pragma once

#include "../core/Types.h"
#include "../core/WorldLayout.h"
#include <glm/glm.hpp>
#include <random>
#include <vector>

namespace Lander {

class TerrainQuery;
struct QualityPreset;

enum class ScorchType {
    Thrust,
    Crater
};

struct ScorchMark {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
    ScorchType type = ScorchType::Thrust;
    float intensity = 1.0f;
    uint32_t seed = 0;
    
    Rect extent() const { return Rect{x - width * 0.5f, y - height * 0.5f, width, height}; }
};

/**
 * Exhaust state of the player vehicle this frame
 */
struct ThrustInfo {
    bool isThrusting = false;
    glm::vec2 position{0.0f};
    glm::vec2 direction{0.0f, 1.0f};
    float vehicleX = 0.0f;
};

class ScorchField {
public:
    static constexpr size_t DEFAULT_MAX_MARKS = 150;
    static constexpr float RAY_START = 20.0f;
    static constexpr float RAY_LENGTH = 150.0f;
    static constexpr float RAY_STEP = 5.0f;
    static constexpr float POLLUTION_PER_HIT = 0.0025f;
    
    explicit ScorchField(const WorldLayout& layout, uint32_t seed = std::random_device{}());
    
    /**
     * Raycast along the exhaust, at most once per preset raycast interval
     * @return true if the ray touched anything
     */
    bool update(TimeMs now, const ThrustInfo& thrust, const QualityPreset& preset,
                const TerrainQuery& terrain, const std::vector<Rect>& buildingBounds);
    
    /** Large mark left by a bomb hitting the ground */
    void addCrater(float x, float y);
    
    /**
     * Remove marks overlapping an area
     * @return Number removed
     */
    size_t clearInArea(const Rect& area);
    
    /** Pollution rises with exhaust hitting water; closer hits pollute more */
    void addWaterPollution(float distance);
    
    float getWaterPollution() const { return waterPollution_; }
    void setWaterPollution(float level);
    
    const std::vector<ScorchMark>& getMarks() const { return marks_; }
    
    void reset();
    
private:
    void addThrustMark(float x, float y, float distance, const QualityPreset& preset, float vehicleX);
    void enforceCap(size_t maxMarks, float vehicleX);
    float random01();
    
    const WorldLayout& layout_;
    std::mt19937 rng_;
    std::vector<ScorchMark> marks_;
    float waterPollution_ = 0.0f;
    TimeMs lastRaycastTime_ = -1.0e9;
};

} // namespace Lander
