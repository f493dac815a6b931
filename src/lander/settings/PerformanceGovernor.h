/**
 * PerformanceGovernor.h
 * 
 * Closed-loop quality scaling driven by measured frame rate
 * 
 * Features:
 * - Warm-up window that ignores scene-load stalls
 * - Rolling FPS window with mean-based downgrade/upgrade decisions
 * - Cooldown between adjustments to avoid thrashing
 * - User-pinned levels block automatic upgrades only
 * - Persistence through a SettingsStore
 * - Change listeners
 */

#pragma once

#include "QualityPresets.h"
#include "../core/Types.h"
#include <deque>
#include <functional>
#include <vector>

namespace Lander {

class SettingsStore;

constexpr const char* PERFORMANCE_SETTINGS_KEY = "lander_performance_settings";

struct GovernorConfig {
    TimeMs warmupMs = 5000.0;
    TimeMs cooldownMs = 2000.0;
    size_t windowSize = 60;
    float downgradeThreshold = 30.0f;
    float upgradeThreshold = 45.0f;
};

class PerformanceGovernor {
public:
    using ChangeListener = std::function<void(const QualityPreset&)>;
    using ListenerID = uint32_t;
    
    explicit PerformanceGovernor(SettingsStore& store, const GovernorConfig& config = {});
    
    /** Read persisted settings (defaults on missing or malformed data) */
    void initialize(TimeMs now);
    
    /**
     * Feed one frame's FPS measurement.
     * @return true if the quality level changed
     */
    bool updateFPS(float fps, TimeMs now);
    
    /** Restart the warm-up window, e.g. when a new scene begins */
    void resetWarmup(TimeMs now);
    
    /**
     * Current preset. Re-read every frame; it can change between frames.
     */
    const QualityPreset& getPreset() const { return QualityPresets::get(level_); }
    QualityLevel getQualityLevel() const { return level_; }
    
    /** Manual selection. userSet pins the level against automatic upgrades */
    void setQualityLevel(QualityLevel level, bool userSet = true);
    
    bool isAutoAdjustEnabled() const { return autoAdjust_; }
    
    /** Enabling auto-adjust also clears the user pin */
    void setAutoAdjust(bool enabled);
    
    bool isUserPinned() const { return userSetQuality_; }
    
    /** Ultra, auto-adjust on, unpinned */
    void reset();
    
    /** First-run default: Medium on mobile, Ultra on desktop */
    void setDefaultForDevice(bool isMobile);
    
    float getAverageFPS() const;
    size_t getSampleCount() const { return fpsHistory_.size(); }
    
    ListenerID addListener(ChangeListener listener);
    void removeListener(ListenerID id);
    
private:
    bool stepDown();
    bool stepUp();
    void resetWindow(TimeMs now);
    void save();
    void notifyListeners();
    
    SettingsStore& store_;
    GovernorConfig config_;
    
    QualityLevel level_ = QualityLevel::Ultra;
    bool autoAdjust_ = true;
    bool userSetQuality_ = false;
    
    std::deque<float> fpsHistory_;
    TimeMs warmupStart_ = 0.0;
    TimeMs lastAdjustmentTime_ = 0.0;
    
    std::vector<std::pair<ListenerID, ChangeListener>> listeners_;
    ListenerID nextListenerId_ = 1;
};

} // namespace Lander
