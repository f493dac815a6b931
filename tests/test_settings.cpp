/**
 * test_settings.cpp
 * 
 * Tests for quality presets, the performance governor and persisted settings
 * 
 * Tests cover:
 * - Preset ladder and level name round trip
 * - Warm-up, window, cooldown and threshold rules of the governor
 * - User pin blocks automatic upgrades
 * - Malformed stored records fall back to defaults
 * - Audio volumes clamp and persist
 */

#include "TestHarness.h"
#include "lander/settings/AudioSettings.h"
#include "lander/settings/PerformanceGovernor.h"
#include "lander/settings/SettingsStore.h"

using namespace Lander;

namespace {

GovernorConfig fastConfig() {
    GovernorConfig config;
    config.warmupMs = 1000.0;
    config.cooldownMs = 500.0;
    config.windowSize = 10;
    return config;
}

// Feed `count` samples spaced 16ms apart, returning the time after the last one
TimeMs feed(PerformanceGovernor& governor, float fps, int count, TimeMs start, int* changes = nullptr) {
    TimeMs now = start;
    for (int i = 0; i < count; ++i) {
        if (governor.updateFPS(fps, now) && changes) ++(*changes);
        now += 16.0;
    }
    return now;
}

} // namespace

// =============================================================================
// Presets
// =============================================================================

static void test_preset_ladder()
{
    const QualityPreset& ultra = QualityPresets::get(QualityLevel::Ultra);
    const QualityPreset& potato = QualityPresets::get(QualityLevel::Potato);
    
    TEST_ASSERT(ultra.name == "Ultra", "ultra name");
    TEST_ASSERT(ultra.collisionCheckIntervalMs == 0.0f, "ultra checks every frame");
    TEST_ASSERT(ultra.cannonMultiplier == 1.0f, "ultra keeps every cannon");
    TEST_ASSERT(!potato.entityUpdates && !potato.projectileCollisions, "potato skips entity work");
    TEST_ASSERT(potato.cannonMultiplier == 0.25f, "potato keeps a quarter of the cannons");
    TEST_ASSERT(QualityPresets::get(QualityLevel::Low).maxScorchMarks == 0, "low has no scorch marks");
    
    for (QualityLevel level : QUALITY_LADDER) {
        auto parsed = qualityLevelFromString(qualityLevelToString(level));
        TEST_ASSERT(parsed && *parsed == level, "level name round trip");
    }
    TEST_ASSERT(!qualityLevelFromString("extreme"), "unknown level name");
}

// =============================================================================
// Governor
// =============================================================================

static void test_governor_ignores_warmup()
{
    MemorySettingsStore store;
    PerformanceGovernor governor(store, fastConfig());
    governor.initialize(0.0);
    
    feed(governor, 10.0f, 50, 0.0);
    TEST_ASSERT(governor.getSampleCount() == 0, "warm-up samples discarded");
    TEST_ASSERT(governor.getQualityLevel() == QualityLevel::Ultra, "no change during warm-up");
}

static void test_governor_steps_down_once_per_window()
{
    MemorySettingsStore store;
    PerformanceGovernor governor(store, fastConfig());
    governor.initialize(0.0);
    
    int changes = 0;
    int notified = 0;
    governor.addListener([&](const QualityPreset&) { ++notified; });
    
    TimeMs now = feed(governor, 20.0f, 9, 1000.0, &changes);
    TEST_ASSERT(changes == 0, "partial window does not adjust");
    
    feed(governor, 20.0f, 1, now, &changes);
    TEST_ASSERT(changes == 1, "full window of low FPS steps down");
    TEST_ASSERT(governor.getQualityLevel() == QualityLevel::High, "one rung per adjustment");
    TEST_ASSERT(notified == 1, "listener notified");
    TEST_ASSERT(governor.getSampleCount() == 0, "window restarted");
    
    auto stored = store.load(PERFORMANCE_SETTINGS_KEY);
    TEST_ASSERT(stored && (*stored)["qualityLevel"] == "high", "new level persisted");
}

static void test_governor_cooldown_blocks_adjustment()
{
    MemorySettingsStore store;
    PerformanceGovernor governor(store, fastConfig());
    governor.initialize(0.0);
    
    int changes = 0;
    TimeMs now = feed(governor, 20.0f, 10, 1000.0, &changes);
    TEST_ASSERT(changes == 1, "first step down");
    
    // The next full window lands 160ms later, inside the 500ms cooldown
    now = feed(governor, 20.0f, 10, now, &changes);
    TEST_ASSERT(changes == 1, "cooldown holds the level");
    
    feed(governor, 20.0f, 1, now + 1000.0, &changes);
    TEST_ASSERT(changes == 2, "steps again after the cooldown");
    TEST_ASSERT(governor.getQualityLevel() == QualityLevel::Medium, "two rungs down");
}

static void test_governor_upgrade_respects_user_pin()
{
    MemorySettingsStore store;
    PerformanceGovernor governor(store, fastConfig());
    governor.initialize(0.0);
    
    governor.setQualityLevel(QualityLevel::Low, true);
    TEST_ASSERT(governor.isUserPinned(), "manual choice pins");
    
    int changes = 0;
    feed(governor, 60.0f, 30, 2000.0, &changes);
    TEST_ASSERT(changes == 0, "pinned level never upgrades");
    
    governor.setAutoAdjust(true);
    TEST_ASSERT(!governor.isUserPinned(), "enabling auto-adjust clears the pin");
    feed(governor, 60.0f, 10, 3000.0, &changes);
    TEST_ASSERT(governor.getQualityLevel() == QualityLevel::Medium, "upgrades one rung");
}

static void test_governor_bottom_of_ladder()
{
    MemorySettingsStore store;
    PerformanceGovernor governor(store, fastConfig());
    governor.initialize(0.0);
    governor.setQualityLevel(QualityLevel::Potato, false);
    
    int changes = 0;
    feed(governor, 5.0f, 10, 2000.0, &changes);
    TEST_ASSERT(changes == 0, "nothing below potato");
    TEST_ASSERT(governor.getSampleCount() == 0, "window still restarts");
}

static void test_governor_loads_and_tolerates_bad_records()
{
    MemorySettingsStore store;
    json record;
    record["qualityLevel"] = "low";
    record["autoAdjust"] = false;
    record["userSetQuality"] = true;
    store.save(PERFORMANCE_SETTINGS_KEY, record);
    
    PerformanceGovernor governor(store);
    governor.initialize(0.0);
    TEST_ASSERT(governor.getQualityLevel() == QualityLevel::Low, "stored level restored");
    TEST_ASSERT(!governor.isAutoAdjustEnabled() && governor.isUserPinned(), "flags restored");
    
    MemorySettingsStore broken;
    broken.putRaw(PERFORMANCE_SETTINGS_KEY, "{not json");
    PerformanceGovernor fallback(broken);
    fallback.initialize(0.0);
    TEST_ASSERT(fallback.getQualityLevel() == QualityLevel::Ultra, "malformed record gives defaults");
    TEST_ASSERT(fallback.isAutoAdjustEnabled(), "auto-adjust default on");
    
    MemorySettingsStore wrongType;
    wrongType.putRaw(PERFORMANCE_SETTINGS_KEY, "{\"qualityLevel\": 3}");
    PerformanceGovernor typed(wrongType);
    typed.initialize(0.0);
    TEST_ASSERT(typed.getQualityLevel() == QualityLevel::Ultra, "wrong field type gives defaults");
}

static void test_governor_device_default()
{
    MemorySettingsStore store;
    PerformanceGovernor governor(store);
    governor.initialize(0.0);
    governor.setDefaultForDevice(true);
    TEST_ASSERT(governor.getQualityLevel() == QualityLevel::Medium, "mobile starts at medium");
    
    // The record now exists, so a returning user keeps it
    PerformanceGovernor again(store);
    again.initialize(0.0);
    again.setDefaultForDevice(false);
    TEST_ASSERT(again.getQualityLevel() == QualityLevel::Medium, "stored choice wins over device default");
}

// =============================================================================
// Audio
// =============================================================================

static void test_audio_settings_clamp_and_persist()
{
    MemorySettingsStore store;
    AudioSettings audio(store);
    audio.load();
    TEST_NEAR(audio.getMusicVolume(), AudioSettings::DEFAULT_MUSIC_VOLUME, 0.0001f, "default music");
    
    int notified = 0;
    audio.addListener([&] { ++notified; });
    audio.setMusicVolume(1.7f);
    audio.setSpeechVolume(-0.5f);
    TEST_NEAR(audio.getMusicVolume(), 1.0f, 0.0001f, "music clamped high");
    TEST_NEAR(audio.getSpeechVolume(), 0.0f, 0.0001f, "speech clamped low");
    TEST_ASSERT(notified == 2, "each change notifies");
    
    AudioSettings reloaded(store);
    reloaded.load();
    TEST_NEAR(reloaded.getMusicVolume(), 1.0f, 0.0001f, "music persisted");
    
    MemorySettingsStore broken;
    broken.putRaw(AUDIO_SETTINGS_KEY, "{\"musicVolume\": \"loud\"}");
    AudioSettings fallback(broken);
    fallback.load();
    TEST_NEAR(fallback.getMusicVolume(), AudioSettings::DEFAULT_MUSIC_VOLUME, 0.0001f, "bad field falls back");
}

int main()
{
    std::printf("=== Settings Tests ===\n\n");
    
    std::printf("Presets:\n");
    RUN_TEST(test_preset_ladder);
    
    std::printf("\nGovernor:\n");
    RUN_TEST(test_governor_ignores_warmup);
    RUN_TEST(test_governor_steps_down_once_per_window);
    RUN_TEST(test_governor_cooldown_blocks_adjustment);
    RUN_TEST(test_governor_upgrade_respects_user_pin);
    RUN_TEST(test_governor_bottom_of_ladder);
    RUN_TEST(test_governor_loads_and_tolerates_bad_records);
    RUN_TEST(test_governor_device_default);
    
    std::printf("\nAudio:\n");
    RUN_TEST(test_audio_settings_clamp_and_persist);
    
    return TEST_RESULTS();
}
