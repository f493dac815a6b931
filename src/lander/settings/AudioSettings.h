/**
 * AudioSettings.h
 * 
 * Persisted music and speech volumes
 */

#pragma once

#include <functional>
#include <vector>

namespace Lander {

class SettingsStore;

constexpr const char* AUDIO_SETTINGS_KEY = "lander_audio_settings";

class AudioSettings {
public:
    static constexpr float DEFAULT_MUSIC_VOLUME = 0.3f;
    static constexpr float DEFAULT_SPEECH_VOLUME = 0.7f;
    
    using ChangeListener = std::function<void()>;
    
    explicit AudioSettings(SettingsStore& store);
    
    void load();
    
    float getMusicVolume() const { return musicVolume_; }
    float getSpeechVolume() const { return speechVolume_; }
    
    /** Clamped to [0, 1] */
    void setMusicVolume(float volume);
    void setSpeechVolume(float volume);
    
    void reset();
    
    void addListener(ChangeListener listener) { listeners_.push_back(std::move(listener)); }
    
private:
    void save();
    void notifyListeners();
    
    SettingsStore& store_;
    float musicVolume_ = DEFAULT_MUSIC_VOLUME;
    float speechVolume_ = DEFAULT_SPEECH_VOLUME;
    std::vector<ChangeListener> listeners_;
};

} // namespace Lander
