/**
 * WeatherSystem.h
 *
 * Sky state, wind and lightning strikes on airborne shuttles
 *
 * Features:
 * - Weather rolled per session (clear, cloudy, stormy, unstable)
 * - Unstable skies shift rain intensity every 15-20 seconds
 * - Wind drifting toward a new target every 20-30 seconds
 * - Storm clouds warn a shuttle below them, then strike 2-3 seconds later
 *   unless it has landed or flown clear
 * - Gated by the quality preset's weather knob
 */

#pragma once

#include "../core/TimerQueue.h"
#include "../core/Types.h"
#include "../settings/QualityPresets.h"
#include <functional>
#include <limits>
#include <optional>
#include <random>
#include <vector>

namespace Lander {

class TerrainQuery;
class EffectSink;
class AudioCue;
class Shuttle;

enum class WeatherState {
    Clear,
    Cloudy,
    Stormy,
    Unstable
};

enum class RainIntensity {
    None,
    Light,
    Medium,
    Heavy
};

const char* weatherStateName(WeatherState state);
const char* rainIntensityName(RainIntensity intensity);

/**
 * Cloud in parallax screen space
 */
struct Cloud {
    float x = 0.0f;
    float y = 0.0f;
    float scale = 1.0f;
    bool storm = false;
    TimeMs lastLightning = 0.0;
    
    float getRadius() const { return scale * 35.0f; }
    float getVisualCenterY() const { return y + 5.0f * scale; }
};

/**
 * Warned strike waiting for its deadline
 */
struct PendingStrike {
    PlayerId target = 1;
    size_t cloudIndex = 0;
    TimeMs warnedAt = 0.0;
    TimeMs strikeAt = 0.0;
    TimerHandle timer = INVALID_TIMER;
};

class WeatherSystem {
public:
    using StrikeHandler = std::function<void(PlayerId, TimeMs)>;
    using ShuttleLookup = std::function<const Shuttle*(PlayerId)>;
    
    static constexpr TimeMs CHECK_INTERVAL_MS = 500.0;
    static constexpr TimeMs MIN_STRIKE_DELAY_MS = 2000.0;
    static constexpr TimeMs STRIKE_DELAY_RANGE_MS = 1000.0;
    static constexpr TimeMs MIN_CLOUD_COOLDOWN_MS = 5000.0;
    static constexpr TimeMs MIN_SHIFT_DELAY_MS = 15000.0;
    static constexpr TimeMs MIN_WIND_DELAY_MS = 20000.0;
    static constexpr float CLOUD_PARALLAX = 0.02f;
    static constexpr float VISIBLE_MARGIN = 100.0f;
    static constexpr float WARNING_HALF_WIDTH = 180.0f;
    static constexpr float WARNING_DEPTH = 180.0f;
    static constexpr float STRIKE_HALF_WIDTH = 250.0f;
    static constexpr float STRIKE_REACH = 200.0f;
    static constexpr float GROUNDED_HEIGHT = 50.0f;
    static constexpr float WARNING_CHANCE = 0.35f;
    static constexpr float AMBIENT_CHANCE = 0.02f;
    static constexpr float WIND_EASING = 0.01f;
    
    WeatherSystem(const TerrainQuery& terrain, TimerQueue& timers, AudioCue* audio, EffectSink* effects,
                  uint32_t seed = std::random_device{}());
    ~WeatherSystem();
    
    WeatherSystem(const WeatherSystem&) = delete;
    WeatherSystem& operator=(const WeatherSystem&) = delete;
    
    /** Roll the session's weather, wind and clouds */
    void initialize(TimeMs now);
    
    /** Force a state and regenerate the clouds for it */
    void setWeatherState(WeatherState state, TimeMs now);
    
    void setStrikeHandler(StrikeHandler handler) { onStrike_ = std::move(handler); }
    void setShuttleLookup(ShuttleLookup lookup) { lookup_ = std::move(lookup); }
    
    /**
     * One tick of weather
     * @param pilots Players whose shuttles can be warned this tick
     */
    void update(TimeMs now, float cameraX, const QualityPreset& preset, const std::vector<PlayerId>& pilots);
    
    /** Drop any warned strike (round restart, weather switched off) */
    void cancelPendingStrike();
    
    WeatherState getWeatherState() const { return state_; }
    RainIntensity getRainIntensity() const { return rain_; }
    float getWindStrength() const { return wind_; }
    float getWindTarget() const { return windTarget_; }
    const std::vector<Cloud>& getClouds() const { return clouds_; }
    const std::optional<PendingStrike>& getPendingStrike() const { return pending_; }
    int getStrikeCount() const { return strikes_; }
    
    /** Add a storm cloud at a screen position */
    void addStormCloud(float x, float y, float scale);
    
    /** Screen x of a cloud for the given camera */
    static float cloudScreenX(const Cloud& cloud, float cameraX) { return cloud.x - cameraX * CLOUD_PARALLAX; }

private:
    void createClouds();
    void updateUnstable(TimeMs now);
    void updateWind(TimeMs now);
    void checkLightning(TimeMs now, const QualityPreset& preset, const std::vector<PlayerId>& pilots);
    void resolveStrike(TimeMs now);
    void ambientFlash(const Cloud& cloud);
    
    float roll() { return unit_(rng_); }
    
    const TerrainQuery& terrain_;
    TimerQueue& timers_;
    AudioCue* audio_;
    EffectSink* effects_;
    std::mt19937 rng_;
    std::uniform_real_distribution<float> unit_{0.0f, 1.0f};
    
    StrikeHandler onStrike_;
    ShuttleLookup lookup_;
    
    WeatherState state_ = WeatherState::Clear;
    RainIntensity rain_ = RainIntensity::None;
    std::vector<Cloud> clouds_;
    std::optional<PendingStrike> pending_;
    
    TimeMs lastCheck_ = -std::numeric_limits<double>::infinity();
    TimeMs lastShift_ = 0.0;
    TimeMs nextShiftDelay_ = 0.0;
    TimeMs lastWindChange_ = 0.0;
    TimeMs nextWindDelay_ = 0.0;
    float wind_ = 0.0f;
    float windTarget_ = 0.0f;
    float cameraX_ = 0.0f;
    int strikes_ = 0;
};

} // namespace Lander
