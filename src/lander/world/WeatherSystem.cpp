/**
 * WeatherSystem.cpp
 */

#include "WeatherSystem.h"
#include "../core/Collaborators.h"
#include "../entities/Shuttle.h"
#include "../core/Log.h"

#include <algorithm>
#include <cmath>

namespace Lander {

const char* weatherStateName(WeatherState state) {
    switch (state) {
        case WeatherState::Clear: return "clear";
        case WeatherState::Cloudy: return "cloudy";
        case WeatherState::Stormy: return "stormy";
        case WeatherState::Unstable: return "unstable";
    }
    return "clear";
}

const char* rainIntensityName(RainIntensity intensity) {
    switch (intensity) {
        case RainIntensity::None: return "none";
        case RainIntensity::Light: return "light";
        case RainIntensity::Medium: return "medium";
        case RainIntensity::Heavy: return "heavy";
    }
    return "none";
}

WeatherSystem::WeatherSystem(const TerrainQuery& terrain, TimerQueue& timers, AudioCue* audio,
                             EffectSink* effects, uint32_t seed)
    : terrain_(terrain)
    , timers_(timers)
    , audio_(audio)
    , effects_(effects)
    , rng_(seed) {
}

WeatherSystem::~WeatherSystem() {
    cancelPendingStrike();
}

// ============================================================================
// SETUP
// ============================================================================

void WeatherSystem::initialize(TimeMs now) {
    // 50% unstable, 10% stormy, 15% cloudy, 25% clear
    float weatherRoll = roll();
    WeatherState state = WeatherState::Clear;
    if (weatherRoll < 0.50f) {
        state = WeatherState::Unstable;
    } else if (weatherRoll < 0.60f) {
        state = WeatherState::Stormy;
    } else if (weatherRoll < 0.75f) {
        state = WeatherState::Cloudy;
    }
    
    wind_ = (roll() - 0.5f) * 1.6f;
    windTarget_ = wind_;
    lastWindChange_ = now;
    nextWindDelay_ = MIN_WIND_DELAY_MS + roll() * 10000.0;
    
    setWeatherState(state, now);
}

void WeatherSystem::setWeatherState(WeatherState state, TimeMs now) {
    cancelPendingStrike();
    state_ = state;
    rain_ = RainIntensity::None;
    
    if (state_ == WeatherState::Unstable) {
        lastShift_ = now;
        nextShiftDelay_ = MIN_SHIFT_DELAY_MS + roll() * 5000.0;
        rain_ = static_cast<RainIntensity>(static_cast<int>(roll() * 4.0f) % 4);
    } else if (state_ == WeatherState::Stormy) {
        rain_ = RainIntensity::Heavy;
    }
    
    createClouds();
    
    LANDER_LOG_INFO("Weather: %s, rain %s, wind %.2f%s", weatherStateName(state_), rainIntensityName(rain_),
                    wind_, state_ == WeatherState::Stormy ? " - watch out for lightning!" : "");
}

void WeatherSystem::createClouds() {
    int count = 15;
    float stormChance = 0.0f;
    switch (state_) {
        case WeatherState::Clear: count = 15; stormChance = 0.0f; break;
        case WeatherState::Cloudy: count = 25; stormChance = 0.15f; break;
        case WeatherState::Stormy: count = 35; stormChance = 0.4f; break;
        case WeatherState::Unstable: count = 30; stormChance = 0.25f; break;
    }
    
    clouds_.clear();
    clouds_.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        Cloud cloud;
        cloud.x = roll() * GAME_WIDTH * 5.0f;
        if (roll() < stormChance) {
            cloud.storm = true;
            cloud.y = 80.0f + roll() * 120.0f;
            cloud.scale = 1.0f + roll();
        } else {
            cloud.y = 30.0f + roll() * 220.0f;
            cloud.scale = 0.3f + roll() * 1.0f;
        }
        clouds_.push_back(cloud);
    }
}

void WeatherSystem::addStormCloud(float x, float y, float scale) {
    Cloud cloud;
    cloud.x = x;
    cloud.y = y;
    cloud.scale = scale;
    cloud.storm = true;
    clouds_.push_back(cloud);
}

// ============================================================================
// UPDATE
// ============================================================================

void WeatherSystem::update(TimeMs now, float cameraX, const QualityPreset& preset,
                           const std::vector<PlayerId>& pilots) {
    cameraX_ = cameraX;
    
    if (preset.weather == WeatherQuality::Off) {
        cancelPendingStrike();
        return;
    }
    
    checkLightning(now, preset, pilots);
    updateUnstable(now);
    updateWind(now);
}

void WeatherSystem::updateUnstable(TimeMs now) {
    if (state_ != WeatherState::Unstable) return;
    if (now - lastShift_ < nextShiftDelay_) return;
    
    lastShift_ = now;
    nextShiftDelay_ = MIN_SHIFT_DELAY_MS + roll() * 5000.0;
    
    // 40% heavier, 40% lighter, 20% unchanged
    int index = static_cast<int>(rain_);
    float changeRoll = roll();
    if (changeRoll < 0.4f) {
        index = std::min(index + 1, static_cast<int>(RainIntensity::Heavy));
    } else if (changeRoll < 0.8f) {
        index = std::max(index - 1, static_cast<int>(RainIntensity::None));
    }
    
    RainIntensity next = static_cast<RainIntensity>(index);
    if (next != rain_) {
        LANDER_LOG_INFO("Unstable weather shift: %s -> %s", rainIntensityName(rain_), rainIntensityName(next));
        rain_ = next;
    }
}

void WeatherSystem::updateWind(TimeMs now) {
    if (now - lastWindChange_ >= nextWindDelay_) {
        lastWindChange_ = now;
        nextWindDelay_ = MIN_WIND_DELAY_MS + roll() * 10000.0;
        windTarget_ = (roll() - 0.5f) * 2.0f;
        LANDER_LOG_DEBUG("Wind shifting to %.2f", windTarget_);
    }
    
    wind_ += (windTarget_ - wind_) * WIND_EASING;
}

// ============================================================================
// LIGHTNING
// ============================================================================

void WeatherSystem::checkLightning(TimeMs now, const QualityPreset& preset, const std::vector<PlayerId>& pilots) {
    if (state_ != WeatherState::Stormy) return;
    if (now - lastCheck_ < CHECK_INTERVAL_MS) return;
    lastCheck_ = now;
    
    // One warned strike at a time; its timer settles it
    if (pending_) return;
    
    std::vector<size_t> visible;
    for (size_t i = 0; i < clouds_.size(); ++i) {
        if (!clouds_[i].storm) continue;
        float screenX = cloudScreenX(clouds_[i], cameraX_);
        if (screenX > -VISIBLE_MARGIN && screenX < GAME_WIDTH + VISIBLE_MARGIN) {
            visible.push_back(i);
        }
    }
    if (visible.empty()) return;
    
    for (PlayerId pilot : pilots) {
        const Shuttle* shuttle = lookup_ ? lookup_(pilot) : nullptr;
        if (!shuttle || !shuttle->isActive()) continue;
    
        float shuttleScreenX = shuttle->getPosition().x - cameraX_;
        float shuttleScreenY = shuttle->getPosition().y;
    
        for (size_t index : visible) {
            Cloud& cloud = clouds_[index];
            if (now - cloud.lastLightning < MIN_CLOUD_COOLDOWN_MS + roll() * 5000.0) continue;
    
            float dx = std::abs(shuttleScreenX - cloudScreenX(cloud, cameraX_));
            float dy = shuttleScreenY - cloud.getVisualCenterY();
            float warningTop = cloud.getRadius() + 10.0f;
    
            bool underCloud = dx < WARNING_HALF_WIDTH && dy > warningTop && dy < warningTop + WARNING_DEPTH;
            if (underCloud && roll() < WARNING_CHANCE) {
                PendingStrike strike;
                strike.target = pilot;
                strike.cloudIndex = index;
                strike.warnedAt = now;
                TimeMs delay = MIN_STRIKE_DELAY_MS + roll() * STRIKE_DELAY_RANGE_MS;
                strike.strikeAt = now + delay;
                strike.timer = timers_.schedule(now, delay, [this, strikeAt = strike.strikeAt]() {
                    resolveStrike(strikeAt);
                });
                pending_ = strike;
                cloud.lastLightning = now;
    
                if (effects_) {
                    effects_->spawnEffect(EffectKind::LightningWarning, shuttle->getPosition().x,
                                          shuttle->getPosition().y);
                }
                if (audio_) audio_->playSound("thunder_rumble");
                LANDER_LOG_INFO("Lightning warning for P%d, get to safety!", pilot);
                return;
            }
        }
    }
    
    if (preset.weather != WeatherQuality::Full) return;
    
    for (size_t index : visible) {
        Cloud& cloud = clouds_[index];
        if (now - cloud.lastLightning < MIN_CLOUD_COOLDOWN_MS + roll() * 5000.0) continue;
        if (roll() < AMBIENT_CHANCE) {
            ambientFlash(cloud);
            cloud.lastLightning = now;
            return;
        }
    }
}

void WeatherSystem::resolveStrike(TimeMs now) {
    if (!pending_) return;
    PendingStrike strike = *pending_;
    pending_.reset();
    
    const Shuttle* shuttle = lookup_ ? lookup_(strike.target) : nullptr;
    if (!shuttle || !shuttle->isActive() || strike.cloudIndex >= clouds_.size()) return;
    
    const Cloud& cloud = clouds_[strike.cloudIndex];
    const glm::vec2& pos = shuttle->getPosition();
    float dx = std::abs((pos.x - cameraX_) - cloudScreenX(cloud, cameraX_));
    float dy = pos.y - cloud.getVisualCenterY();
    
    bool grounded = terrain_.getTerrainHeightAt(pos.x) - pos.y < GROUNDED_HEIGHT;
    bool inRange = dx < STRIKE_HALF_WIDTH && dy > 0.0f && dy < cloud.getRadius() + STRIKE_REACH;
    
    if (grounded || !inRange) {
        LANDER_LOG_INFO("Lightning missed P%d (%s)", strike.target, grounded ? "landed" : "out of range");
        ambientFlash(cloud);
        return;
    }
    
    strikes_++;
    if (effects_) {
        effects_->spawnEffect(EffectKind::LightningBolt, pos.x, pos.y);
        effects_->shakeCamera(300.0f, 0.02f);
    }
    if (audio_) audio_->playSound("thunder");
    LANDER_LOG_INFO("Lightning strike on P%d", strike.target);
    
    if (onStrike_) onStrike_(strike.target, now);
}

void WeatherSystem::ambientFlash(const Cloud& cloud) {
    if (effects_) {
        effects_->spawnEffect(EffectKind::LightningBolt, cloudScreenX(cloud, cameraX_) + cameraX_,
                              cloud.getVisualCenterY(), 0.5f);
    }
    if (audio_) audio_->playSound("thunder_distant", 0.5f);
}

void WeatherSystem::cancelPendingStrike() {
    if (!pending_) return;
    timers_.cancel(pending_->timer);
    pending_.reset();
}

} // namespace Lander
