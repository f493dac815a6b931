/**
 * Types.h
 * 
 * Shared value types and world constants for the simulation core
 */

#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <string>

namespace Lander {

/**
 * Simulation timestamp in milliseconds
 */
using TimeMs = double;

/**
 * Player number (1 or 2)
 */
using PlayerId = int;

constexpr float GAME_WIDTH = 1280.0f;
constexpr float GAME_HEIGHT = 720.0f;
constexpr float WORLD_START_X = -2800.0f;
constexpr float WORLD_WIDTH = 20000.0f;

enum class GameMode {
    Single,
    TwoPlayer,
    Dogfight    // Two pilots racing to a kill count
};

inline const char* gameModeName(GameMode mode) {
    switch (mode) {
        case GameMode::Single: return "single";
        case GameMode::TwoPlayer: return "two_player";
        case GameMode::Dogfight: return "dogfight";
    }
    return "single";
}

// ============================================================================
// GEOMETRY
// ============================================================================

/**
 * Axis-aligned rectangle in world space (y grows downward)
 */
struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
    
    float left() const { return x; }
    float right() const { return x + width; }
    float top() const { return y; }
    float bottom() const { return y + height; }
    
    /** Inclusive point containment */
    bool contains(float px, float py) const {
        return px >= x && px <= x + width && py >= y && py <= y + height;
    }
    
    bool contains(const glm::vec2& p) const { return contains(p.x, p.y); }
    
    bool overlaps(const Rect& other) const {
        return !(other.right() < x || other.x > right() ||
                 other.bottom() < y || other.y > bottom());
    }
};

/**
 * How a collision box hangs off an entity's anchor point
 */
enum class BoundsAlignment {
    Top,     // Box stands on the anchor (anchor at its bottom edge)
    Center   // Box straddles the anchor
};

/**
 * Collision box configuration, turned into a Rect from the current position
 */
struct BoundsConfig {
    float width = 0.0f;
    float height = 0.0f;
    BoundsAlignment alignment = BoundsAlignment::Top;
    float extraHeight = 0.0f;   // Extends the box downward (submerged part)
    
    Rect at(const glm::vec2& anchor) const {
        Rect r;
        r.x = anchor.x - width * 0.5f;
        r.y = alignment == BoundsAlignment::Top ? anchor.y - height : anchor.y - height * 0.5f;
        r.width = width;
        r.height = height + extraHeight;
        return r;
    }
};

} // namespace Lander
