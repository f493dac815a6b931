/**
 * QualityPresets.h
 * 
 * Discrete quality levels and the fidelity/cost knobs each one selects
 * 
 * Features:
 * - Ordered ladder from Ultra (best) to Potato (cheapest)
 * - One immutable preset per level
 * - Level <-> string conversion for persisted settings
 */

#pragma once

#include <array>
#include <optional>
#include <string>

namespace Lander {

enum class QualityLevel {
    Ultra,
    High,
    Medium,
    Low,
    Potato
};

constexpr std::array<QualityLevel, 5> QUALITY_LADDER = {
    QualityLevel::Ultra,
    QualityLevel::High,
    QualityLevel::Medium,
    QualityLevel::Low,
    QualityLevel::Potato
};

enum class WeatherQuality {
    Full,
    Light,
    Off
};

/**
 * Knobs read by every subsystem each frame
 */
struct QualityPreset {
    QualityLevel level = QualityLevel::Ultra;
    std::string name;
    
    // Weather
    WeatherQuality weather = WeatherQuality::Full;
    
    // Trails
    bool chemtrails = true;
    float chemtrailLifespanMs = 15000.0f;
    
    // Scorching
    bool scorchMarks = true;
    int maxScorchMarks = 150;
    
    // Explosions
    bool explosionDebris = true;
    int explosionDebrisCount = 12;
    bool explosionSmoke = true;
    
    // Particles
    bool thrusterParticles = true;
    float particleMultiplier = 1.0f;
    bool waterSplash = true;
    bool rainSplash = true;
    bool windDebris = true;
    
    // Decorative animation
    bool flagAnimations = true;
    bool decorations = true;
    bool cameraShake = true;
    bool achievementAnimations = true;
    bool powerupVisuals = true;
    bool speedTrails = true;
    
    // Simulation cost
    float cannonMultiplier = 1.0f;
    float collisionCheckIntervalMs = 0.0f;   // 0 = every frame
    float scorchRaycastIntervalMs = 50.0f;
    bool entityUpdates = true;
    bool oceanWaves = true;
    bool altitudeOverlay = true;
    bool projectileCollisions = true;
};

struct QualityPresets {
    static QualityPreset Ultra();
    static QualityPreset High();
    static QualityPreset Medium();
    static QualityPreset Low();
    static QualityPreset Potato();
    
    static QualityPreset fromLevel(QualityLevel level);
    
    /** Shared immutable instance for a level */
    static const QualityPreset& get(QualityLevel level);
};

const char* qualityLevelToString(QualityLevel level);
std::optional<QualityLevel> qualityLevelFromString(const std::string& name);

/** Position on the ladder, 0 = best */
inline int qualityIndex(QualityLevel level) { return static_cast<int>(level); }

} // namespace Lander
