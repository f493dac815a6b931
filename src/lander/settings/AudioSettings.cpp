/**
 * AudioSettings.cpp
 */

#include "AudioSettings.h"
#include "SettingsStore.h"
#include "../core/Log.h"
#include <glm/common.hpp>

namespace Lander {

AudioSettings::AudioSettings(SettingsStore& store)
    : store_(store) {
}

void AudioSettings::load() {
    auto stored = store_.load(AUDIO_SETTINGS_KEY);
    if (!stored) return;
    
    try {
        musicVolume_ = glm::clamp(stored->value("musicVolume", DEFAULT_MUSIC_VOLUME), 0.0f, 1.0f);
        speechVolume_ = glm::clamp(stored->value("speechVolume", DEFAULT_SPEECH_VOLUME), 0.0f, 1.0f);
    } catch (const std::exception& e) {
        LANDER_LOG_WARN("Failed to load audio settings: %s", e.what());
        musicVolume_ = DEFAULT_MUSIC_VOLUME;
        speechVolume_ = DEFAULT_SPEECH_VOLUME;
    }
}

void AudioSettings::setMusicVolume(float volume) {
    musicVolume_ = glm::clamp(volume, 0.0f, 1.0f);
    save();
    notifyListeners();
}

void AudioSettings::setSpeechVolume(float volume) {
    speechVolume_ = glm::clamp(volume, 0.0f, 1.0f);
    save();
    notifyListeners();
}

void AudioSettings::reset() {
    musicVolume_ = DEFAULT_MUSIC_VOLUME;
    speechVolume_ = DEFAULT_SPEECH_VOLUME;
    save();
    notifyListeners();
}

void AudioSettings::save() {
    json doc;
    doc["musicVolume"] = musicVolume_;
    doc["speechVolume"] = speechVolume_;
    
    if (!store_.save(AUDIO_SETTINGS_KEY, doc)) {
        LANDER_LOG_WARN("Failed to save audio settings");
    }
}

void AudioSettings::notifyListeners() {
    for (auto& listener : listeners_) {
        listener();
    }
}

} // namespace Lander
