/**
 * ScorchField.cpp
 */

#include "ScorchField.h"
#include "../core/Collaborators.h"
#include "../settings/QualityPresets.h"
#include <algorithm>
#include <cmath>

namespace Lander {

ScorchField::ScorchField(const WorldLayout& layout, uint32_t seed)
    : layout_(layout)
    , rng_(seed) {
}

bool ScorchField::update(TimeMs now, const ThrustInfo& thrust, const QualityPreset& preset,
                         const TerrainQuery& terrain, const std::vector<Rect>& buildingBounds) {
    if (!preset.scorchMarks || !thrust.isThrusting) return false;
    if (now - lastRaycastTime_ < preset.scorchRaycastIntervalMs) return false;
    lastRaycastTime_ = now;
    
    for (float dist = RAY_START; dist < RAY_LENGTH; dist += RAY_STEP) {
        glm::vec2 check = thrust.position + thrust.direction * dist;
        
        float terrainY = terrain.getTerrainHeightAt(check.x);
        if (check.y >= terrainY - 5.0f) {
            if (layout_.isOverWater(check.x)) {
                addWaterPollution(dist);
            } else {
                addThrustMark(check.x, terrainY, dist, preset, thrust.vehicleX);
            }
            return true;
        }
        
        for (const Rect& bounds : buildingBounds) {
            if (bounds.contains(check)) {
                addThrustMark(check.x, check.y, dist, preset, thrust.vehicleX);
                return true;
            }
        }
        
        for (const LandingPadInfo& pad : layout_.getLandingPads()) {
            float padY = terrain.getTerrainHeightAt(pad.x);
            float padTop = padY - 5.0f;
            if (check.x >= pad.x - pad.width * 0.5f && check.x <= pad.x + pad.width * 0.5f &&
                check.y >= padTop && check.y <= padY + 10.0f) {
                addThrustMark(check.x, padTop, dist, preset, thrust.vehicleX);
                return true;
            }
        }
    }
    
    return false;
}

void ScorchField::addThrustMark(float x, float y, float distance, const QualityPreset& preset, float vehicleX) {
    size_t maxMarks = preset.maxScorchMarks > 0 ? static_cast<size_t>(preset.maxScorchMarks) : DEFAULT_MAX_MARKS;
    enforceCap(maxMarks, vehicleX);
    
    bool duplicate = std::any_of(marks_.begin(), marks_.end(),
                                 [x, y](const ScorchMark& m) { return m.x == x && m.y == y; });
    if (duplicate) return;
    
    // Closer exhaust leaves a bigger, darker mark
    float intensity = std::max(0.3f, 1.0f - distance / RAY_LENGTH);
    
    ScorchMark mark;
    mark.x = x;
    mark.y = y;
    mark.width = (10.0f + random01() * 15.0f) * 1.5f;
    mark.height = (4.0f + random01() * 6.0f) * 1.5f;
    mark.type = ScorchType::Thrust;
    mark.intensity = intensity;
    mark.seed = rng_();
    marks_.push_back(mark);
}

void ScorchField::enforceCap(size_t maxMarks, float vehicleX) {
    if (marks_.size() < maxMarks) return;
    
    std::sort(marks_.begin(), marks_.end(), [vehicleX](const ScorchMark& a, const ScorchMark& b) {
        return std::abs(a.x - vehicleX) > std::abs(b.x - vehicleX);
    });
    
    size_t removeCount = std::max<size_t>(1, static_cast<size_t>(std::floor(maxMarks * 0.2)));
    removeCount = std::min(removeCount, marks_.size());
    marks_.erase(marks_.begin(), marks_.begin() + static_cast<std::ptrdiff_t>(removeCount));
}

void ScorchField::addCrater(float x, float y) {
    float radius = 35.0f + random01() * 15.0f;
    
    ScorchMark mark;
    mark.x = x;
    mark.y = y;
    mark.width = radius * 4.0f;
    mark.height = radius * 2.0f;
    mark.type = ScorchType::Crater;
    mark.intensity = 1.0f;
    mark.seed = rng_();
    marks_.push_back(mark);
}

size_t ScorchField::clearInArea(const Rect& area) {
    size_t before = marks_.size();
    marks_.erase(std::remove_if(marks_.begin(), marks_.end(),
                                [&area](const ScorchMark& m) { return m.extent().overlaps(area); }),
                 marks_.end());
    return before - marks_.size();
}

void ScorchField::addWaterPollution(float distance) {
    float intensity = std::max(0.2f, 1.0f - distance / RAY_LENGTH);
    waterPollution_ = std::min(1.0f, waterPollution_ + POLLUTION_PER_HIT * intensity);
}

void ScorchField::setWaterPollution(float level) {
    waterPollution_ = std::clamp(level, 0.0f, 1.0f);
}

void ScorchField::reset() {
    marks_.clear();
    waterPollution_ = 0.0f;
    lastRaycastTime_ = -1.0e9;
}

float ScorchField::random01() {
    return std::uniform_real_distribution<float>(0.0f, 1.0f)(rng_);
}

} // namespace Lander
