/**
 * FuelTank.h
 * 
 * Bounded fuel store burned by thrust and refilled by trading
 */

#pragma once

#include <functional>

namespace Lander {

class FuelTank {
public:
    static constexpr float DEFAULT_CAPACITY = 100.0f;
    static constexpr float CONSUMPTION_RATE = 0.15f;        // Per frame of thrust
    static constexpr float LEGS_EXTENDED_FACTOR = 1.2f;
    
    using ChangeCallback = std::function<void(float fuel, float maxFuel)>;
    
    explicit FuelTank(float maxFuel = DEFAULT_CAPACITY);
    
    /**
     * Burn fuel, flooring at zero
     * @return false if the tank was already empty
     */
    bool consume(float amount);
    
    /** Refill, clamped to capacity */
    void add(float amount);
    
    float getFuel() const { return fuel_; }
    float getMaxFuel() const { return maxFuel_; }
    float getDeficit() const { return maxFuel_ - fuel_; }
    
    /** Clamped to [0, max] */
    void setFuel(float fuel);
    
    float getPercentage() const { return maxFuel_ > 0.0f ? fuel_ / maxFuel_ * 100.0f : 0.0f; }
    bool isEmpty() const { return fuel_ <= 0.0f; }
    bool isFull() const { return fuel_ >= maxFuel_; }
    
    void reset();
    
    void setOnChange(ChangeCallback callback) { onChange_ = std::move(callback); }
    
private:
    void notifyChange();
    
    float fuel_;
    float maxFuel_;
    ChangeCallback onChange_;
};

} // namespace Lander
