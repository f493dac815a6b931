/**
 * Shark.h
 * 
 * Atlantic shark driven by water pollution and feeding
 * 
 * States:
 * - Alive: patrols between bounds, chases food in range
 * - Coughing: same as alive at half speed, with bubble bursts
 * - Dead (terminal): floats belly-up to the surface and eventually fumes
 */

#pragma once

#include "../entities/Destructible.h"
#include <memory>
#include <vector>

namespace Lander {

class TimerQueue;

enum class SharkState {
    Alive,
    Coughing,
    Dead
};

const char* sharkStateName(SharkState state);

struct SharkExplosion {
    std::string name;
    int points = 0;
    bool wasDead = false;
};

class Shark : public Destructible {
public:
    static constexpr int POINTS = 500;
    static constexpr int FATAL_FOOD_COUNT = 5;
    static constexpr float LETHAL_POLLUTION = 0.6f;
    static constexpr float COUGH_POLLUTION = 0.3f;
    static constexpr float SPEED = 1.5f;
    static constexpr float CHASE_FACTOR = 1.3f;
    static constexpr float DETECTION_RANGE = 200.0f;
    static constexpr int COUGH_INTERVAL_TICKS = 60;
    static constexpr float FLOAT_STEP = 0.01f;
    static constexpr int SURFACE_FUME_DELAY_TICKS = 600;
    static constexpr int FUME_INTERVAL_TICKS = 10;
    static constexpr TimeMs BURP_DELAY_MS = 400.0;
    
    /** Surface line of the ocean */
    static float waterSurface() { return GAME_HEIGHT * 0.75f; }
    
    /**
     * @param depth How far below the surface the shark swims
     */
    Shark(float x, float depth, float patrolMinX, float patrolMaxX, EffectSink* effects = nullptr);
    
    /**
     * One tick: pollution transitions first, then movement for the current state
     */
    void update(float waveOffset, float pollutionLevel, const std::vector<glm::vec2>& foodTargets);
    
    bool canEatBomb() const { return mood_ == SharkState::Alive || mood_ == SharkState::Coughing; }
    
    /**
     * Swallow one food item. Reaching the fatal count kills the shark at once.
     * @return false if the shark cannot eat
     */
    bool eatBomb(TimerQueue& timers, TimeMs now);
    
    /** Area in which the shark can snap up food */
    Rect getEatingBounds() const;
    
    /** explode() that also reports whether the shark was already dead */
    SharkExplosion explodeShark();
    
    SharkState getState() const { return mood_; }
    int getFoodEaten() const { return foodEaten_; }
    float getFloatProgress() const { return floatProgress_; }
    int getDirection() const { return direction_; }
    float getBaseY() const { return baseY_; }
    bool hasReachedSurface() const { return reachedSurface_; }
    const glm::vec2* getTargetFood() const { return hasTarget_ ? &targetFood_ : nullptr; }
    
protected:
    void onExplode() override;
    
private:
    void updatePollutionState(float pollutionLevel);
    void findNearestFood(const std::vector<glm::vec2>& foodTargets);
    void floatToSurface(float waveOffset);
    void die();
    glm::vec2 mouthPosition() const;
    
    SharkState mood_ = SharkState::Alive;
    float baseY_;
    float patrolMinX_;
    float patrolMaxX_;
    int direction_ = 1;
    
    int foodEaten_ = 0;
    float floatProgress_ = 0.0f;
    bool reachedSurface_ = false;
    int surfaceTimer_ = 0;
    int fumeTimer_ = 0;
    int coughTimer_ = 0;
    
    bool hasTarget_ = false;
    glm::vec2 targetFood_{0.0f};
    
    // Deferred callbacks check this before touching the shark
    std::shared_ptr<bool> lifeToken_ = std::make_shared<bool>(true);
};

} // namespace Lander
