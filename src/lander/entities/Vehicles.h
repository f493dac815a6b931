/**
 * Vehicles.h
 * 
 * Moving and floating destructibles
 * 
 * Features:
 * - Golf cart that patrols and flees from the player, scattering files when hit
 * - Fisher boat that bobs on the waves and may carry a package
 * - Greenland ice floe that bobs and can be carried away
 * - Propaganda biplane that crosses the sky and drops a banner when hit
 */

#pragma once

#include "Destructible.h"
#include "../core/Collaborators.h"
#include <array>

namespace Lander {

class TerrainQuery;

// ============================================================================
// GOLF CART
// ============================================================================

class GolfCart : public Destructible {
public:
    static constexpr int POINTS = 500;
    static constexpr float PATROL_SPEED = 0.5f;
    static constexpr float FLEE_SPEED = 2.5f;
    static constexpr float FLEE_DISTANCE = 300.0f;
    static constexpr TimeMs FLEE_DURATION_MS = 2000.0;
    
    GolfCart(float x, float patrolMinX, float patrolMaxX, EffectSink* effects = nullptr);
    
    /** Patrol between the bounds, or flee when the player comes close */
    void update(const TerrainQuery& terrain, const glm::vec2& playerPosition, TimeMs now);
    
    /** Where the classified files land when the cart is destroyed */
    std::array<glm::vec2, 3> getScatterPositions() const;
    
    bool isFleeing(TimeMs now) const { return now < fleeingUntil_; }
    int getDirection() const { return direction_; }
    
protected:
    void onExplode() override;
    
private:
    float patrolMinX_;
    float patrolMaxX_;
    int direction_ = 1;
    int fleeDirection_ = 1;
    TimeMs fleeingUntil_ = 0.0;
};

// ============================================================================
// FLOATING OBJECTS
// ============================================================================

class FisherBoat : public Destructible {
public:
    static constexpr int POINTS = 300;
    
    FisherBoat(float x, float waterY, EffectSink* effects = nullptr);
    
    void update(float waveOffset) { bobbing_.apply(state_, waveOffset); }
    
    bool hasPackage() const { return hasPackage_ && !packageCollected_; }
    void setHasPackage(bool hasPackage) { hasPackage_ = hasPackage; }
    void collectPackage() { packageCollected_ = true; }
    
    const BobbingMotion& getBobbing() const { return bobbing_; }
    
protected:
    void onExplode() override;
    
private:
    BobbingMotion bobbing_;
    bool hasPackage_ = false;
    bool packageCollected_ = false;
};

class GreenlandIce : public Destructible {
public:
    static constexpr int POINTS = 100;
    
    GreenlandIce(float x, float waterY, EffectSink* effects = nullptr);
    
    void update(float waveOffset) { bobbing_.apply(state_, waveOffset); }
    
    /** Hooked to a carrier; bobbing stops and bombs pass it by */
    void attach() { bobbing_.setAttached(true); }
    bool isAttached() const { return bobbing_.isAttached(); }
    
protected:
    void onExplode() override;
    
private:
    BobbingMotion bobbing_;
};

// ============================================================================
// BIPLANE
// ============================================================================

class Biplane : public Destructible {
public:
    static constexpr int POINTS = 1000;
    static constexpr float SPEED = 2.5f;
    static constexpr float EXIT_MARGIN = 2000.0f;
    static constexpr TimeMs REENTRY_DELAY_MS = 5000.0;
    
    /**
     * @param country Country whose propaganda the banner carries
     * @param direction 1 flies right, -1 flies left
     */
    Biplane(const glm::vec2& spawn, const std::string& country, const std::string& message,
            int direction, EffectSink* effects = nullptr);
    
    void update(TimeMs now, float cameraX);
    
    bool isWaiting() const { return waiting_; }
    int getDirection() const { return direction_; }
    const std::string& getMessage() const { return message_; }
    const std::string& getPropagandaType() const { return propagandaType_; }
    
    /** Banner released at the crash site */
    BannerDrop getBannerDrop() const;
    
protected:
    void onExplode() override;
    
private:
    std::string message_;
    std::string propagandaType_;
    uint32_t accentColor_;
    int direction_;
    float baseY_;
    bool waiting_ = false;
    TimeMs waitUntil_ = 0.0;
};

} // namespace Lander
