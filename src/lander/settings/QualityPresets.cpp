/**
 * QualityPresets.cpp
 */

#include "QualityPresets.h"

namespace Lander {

// ============================================================================
// PRESETS
// ============================================================================

QualityPreset QualityPresets::Ultra() {
    QualityPreset p;
    p.level = QualityLevel::Ultra;
    p.name = "Ultra";
    return p;
}

QualityPreset QualityPresets::High() {
    QualityPreset p;
    p.level = QualityLevel::High;
    p.name = "High";
    p.weather = WeatherQuality::Light;
    p.chemtrailLifespanMs = 8000.0f;
    p.maxScorchMarks = 100;
    p.particleMultiplier = 0.75f;
    return p;
}

QualityPreset QualityPresets::Medium() {
    QualityPreset p;
    p.level = QualityLevel::Medium;
    p.name = "Medium";
    p.weather = WeatherQuality::Off;
    p.chemtrails = false;
    p.chemtrailLifespanMs = 0.0f;
    p.maxScorchMarks = 50;
    p.explosionDebrisCount = 6;
    p.explosionSmoke = false;
    p.particleMultiplier = 0.5f;
    p.rainSplash = false;
    p.windDebris = false;
    p.flagAnimations = false;
    p.cannonMultiplier = 0.75f;
    p.collisionCheckIntervalMs = 16.0f;
    p.scorchRaycastIntervalMs = 100.0f;
    return p;
}

QualityPreset QualityPresets::Low() {
    QualityPreset p;
    p.level = QualityLevel::Low;
    p.name = "Low";
    p.weather = WeatherQuality::Off;
    p.chemtrails = false;
    p.chemtrailLifespanMs = 0.0f;
    p.scorchMarks = false;
    p.maxScorchMarks = 0;
    p.explosionDebrisCount = 4;
    p.explosionSmoke = false;
    p.particleMultiplier = 0.25f;
    p.waterSplash = false;
    p.rainSplash = false;
    p.windDebris = false;
    p.flagAnimations = false;
    p.decorations = false;
    p.cameraShake = false;
    p.achievementAnimations = false;
    p.speedTrails = false;
    p.cannonMultiplier = 0.5f;
    p.collisionCheckIntervalMs = 33.0f;
    p.scorchRaycastIntervalMs = 200.0f;
    p.entityUpdates = false;
    p.oceanWaves = false;
    p.altitudeOverlay = false;
    p.projectileCollisions = false;
    return p;
}

QualityPreset QualityPresets::Potato() {
    QualityPreset p = Low();
    p.level = QualityLevel::Potato;
    p.name = "Potato";
    p.explosionDebris = false;
    p.explosionDebrisCount = 0;
    p.particleMultiplier = 0.15f;
    p.powerupVisuals = false;
    p.cannonMultiplier = 0.25f;
    p.collisionCheckIntervalMs = 50.0f;
    p.scorchRaycastIntervalMs = 500.0f;
    return p;
}

QualityPreset QualityPresets::fromLevel(QualityLevel level) {
    switch (level) {
        case QualityLevel::Ultra: return Ultra();
        case QualityLevel::High: return High();
        case QualityLevel::Medium: return Medium();
        case QualityLevel::Low: return Low();
        case QualityLevel::Potato: return Potato();
        default: return Ultra();
    }
}

const QualityPreset& QualityPresets::get(QualityLevel level) {
    static const std::array<QualityPreset, 5> presets = {
        Ultra(), High(), Medium(), Low(), Potato()
    };
    int index = qualityIndex(level);
    if (index < 0 || index >= static_cast<int>(presets.size())) index = 0;
    return presets[index];
}

// ============================================================================
// NAMES
// ============================================================================

const char* qualityLevelToString(QualityLevel level) {
    switch (level) {
        case QualityLevel::Ultra: return "ultra";
        case QualityLevel::High: return "high";
        case QualityLevel::Medium: return "medium";
        case QualityLevel::Low: return "low";
        case QualityLevel::Potato: return "potato";
        default: return "ultra";
    }
}

std::optional<QualityLevel> qualityLevelFromString(const std::string& name) {
    for (QualityLevel level : QUALITY_LADDER) {
        if (name == qualityLevelToString(level)) return level;
    }
    return std::nullopt;
}

} // namespace Lander
