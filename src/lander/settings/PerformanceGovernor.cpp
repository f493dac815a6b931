/**
 * PerformanceGovernor.cpp
 */

#include "PerformanceGovernor.h"
#include "SettingsStore.h"
#include "../core/Log.h"
#include <algorithm>
#include <numeric>

namespace Lander {

PerformanceGovernor::PerformanceGovernor(SettingsStore& store, const GovernorConfig& config)
    : store_(store)
    , config_(config) {
}

void PerformanceGovernor::initialize(TimeMs now) {
    warmupStart_ = now;
    
    if (auto stored = store_.load(PERFORMANCE_SETTINGS_KEY)) {
        const json& doc = *stored;
        try {
            std::string levelName = doc.value("qualityLevel", std::string("ultra"));
            level_ = qualityLevelFromString(levelName).value_or(QualityLevel::Ultra);
            autoAdjust_ = doc.value("autoAdjust", true);
            userSetQuality_ = doc.value("userSetQuality", false);
        } catch (const std::exception& e) {
            LANDER_LOG_WARN("[PERF] Failed to load performance settings: %s", e.what());
            level_ = QualityLevel::Ultra;
            autoAdjust_ = true;
            userSetQuality_ = false;
        }
    }
    
    LANDER_LOG_INFO("[PERF] Starting with quality: %s (auto-adjust: %s)",
                    getPreset().name.c_str(), autoAdjust_ ? "on" : "off");
}

bool PerformanceGovernor::updateFPS(float fps, TimeMs now) {
    if (now - warmupStart_ < config_.warmupMs) {
        return false;
    }
    
    fpsHistory_.push_back(fps);
    while (fpsHistory_.size() > config_.windowSize) {
        fpsHistory_.pop_front();
    }
    
    if (!autoAdjust_) return false;
    if (fpsHistory_.size() < config_.windowSize) return false;
    if (now - lastAdjustmentTime_ < config_.cooldownMs) return false;
    
    float avgFPS = getAverageFPS();
    
    if (avgFPS < config_.downgradeThreshold) {
        bool changed = stepDown();
        if (changed) {
            LANDER_LOG_INFO("[PERF] Auto-downgraded to %s (avg FPS: %.1f)", getPreset().name.c_str(), avgFPS);
        } else {
            LANDER_LOG_DEBUG("[PERF] FPS low (%.1f) but already at %s", avgFPS, getPreset().name.c_str());
        }
        // The bottom of the ladder still restarts the window and cooldown
        resetWindow(now);
        return changed;
    }
    
    if (avgFPS > config_.upgradeThreshold && !userSetQuality_) {
        if (stepUp()) {
            resetWindow(now);
            LANDER_LOG_INFO("[PERF] Auto-upgraded to %s (avg FPS: %.1f)", getPreset().name.c_str(), avgFPS);
            return true;
        }
    }
    
    return false;
}

void PerformanceGovernor::resetWarmup(TimeMs now) {
    warmupStart_ = now;
    fpsHistory_.clear();
    lastAdjustmentTime_ = 0.0;
}

void PerformanceGovernor::setQualityLevel(QualityLevel level, bool userSet) {
    if (level_ == level) return;
    
    level_ = level;
    if (userSet) {
        userSetQuality_ = true;
    }
    save();
    notifyListeners();
    LANDER_LOG_INFO("[PERF] Quality set to: %s", getPreset().name.c_str());
}

void PerformanceGovernor::setAutoAdjust(bool enabled) {
    autoAdjust_ = enabled;
    if (enabled) {
        userSetQuality_ = false;
    }
    save();
    notifyListeners();
    LANDER_LOG_INFO("[PERF] Auto-adjust: %s", enabled ? "enabled" : "disabled");
}

void PerformanceGovernor::reset() {
    level_ = QualityLevel::Ultra;
    autoAdjust_ = true;
    userSetQuality_ = false;
    fpsHistory_.clear();
    lastAdjustmentTime_ = 0.0;
    save();
    notifyListeners();
}

void PerformanceGovernor::setDefaultForDevice(bool isMobile) {
    if (userSetQuality_) return;
    
    // A stored record means a returning user; their choice stands
    if (store_.contains(PERFORMANCE_SETTINGS_KEY)) return;
    
    level_ = isMobile ? QualityLevel::Medium : QualityLevel::Ultra;
    LANDER_LOG_INFO("[PERF] %s detected, defaulting to %s quality",
                    isMobile ? "Mobile" : "Desktop", getPreset().name.c_str());
    save();
    notifyListeners();
}

float PerformanceGovernor::getAverageFPS() const {
    if (fpsHistory_.empty()) return 0.0f;
    float sum = std::accumulate(fpsHistory_.begin(), fpsHistory_.end(), 0.0f);
    return sum / static_cast<float>(fpsHistory_.size());
}

PerformanceGovernor::ListenerID PerformanceGovernor::addListener(ChangeListener listener) {
    ListenerID id = nextListenerId_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void PerformanceGovernor::removeListener(ListenerID id) {
    listeners_.erase(
        std::remove_if(listeners_.begin(), listeners_.end(),
                       [id](const auto& entry) { return entry.first == id; }),
        listeners_.end());
}

bool PerformanceGovernor::stepDown() {
    int index = qualityIndex(level_);
    if (index >= static_cast<int>(QUALITY_LADDER.size()) - 1) return false;
    
    level_ = QUALITY_LADDER[index + 1];
    save();
    notifyListeners();
    return true;
}

bool PerformanceGovernor::stepUp() {
    int index = qualityIndex(level_);
    if (index <= 0) return false;
    
    level_ = QUALITY_LADDER[index - 1];
    save();
    notifyListeners();
    return true;
}

void PerformanceGovernor::resetWindow(TimeMs now) {
    lastAdjustmentTime_ = now;
    fpsHistory_.clear();
}

void PerformanceGovernor::save() {
    json doc;
    doc["qualityLevel"] = qualityLevelToString(level_);
    doc["autoAdjust"] = autoAdjust_;
    doc["userSetQuality"] = userSetQuality_;
    
    if (!store_.save(PERFORMANCE_SETTINGS_KEY, doc)) {
        LANDER_LOG_WARN("[PERF] Failed to save performance settings");
    }
}

void PerformanceGovernor::notifyListeners() {
    const QualityPreset& preset = getPreset();
    for (auto& [id, listener] : listeners_) {
        listener(preset);
    }
}

} // namespace Lander
