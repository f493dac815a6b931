/**
 * test_world.cpp
 * 
 * Tests for the shuttle, landing rules, sharks, scorching and the ocean
 */

#include "TestHarness.h"
#include "RecordingCollaborators.h"
#include "lander/combat/BombManager.h"
#include "lander/core/TimerQueue.h"
#include "lander/core/WorldLayout.h"
#include "lander/economy/FuelTank.h"
#include "lander/entities/Shuttle.h"
#include "lander/entities/WorldEntities.h"
#include "lander/session/LandingEvaluator.h"
#include "lander/settings/QualityPresets.h"
#include "lander/world/OceanManager.h"
#include "lander/world/ScorchField.h"

#include <glm/gtc/constants.hpp>

using namespace Lander;

namespace {

const WorldLayout& layout() { return WorldLayout::standard(); }

CoastalTerrain coast() {
    return CoastalTerrain(600.0f, Shark::waterSurface(), layout().getWaterStart(), layout().getWaterEnd());
}

ThrustInfo downwardThrust(float x, float y) {
    ThrustInfo thrust;
    thrust.isThrusting = true;
    thrust.position = glm::vec2(x, y);
    thrust.direction = glm::vec2(0.0f, 1.0f);
    thrust.vehicleX = x;
    return thrust;
}

} // namespace

// =============================================================================
// Shuttle
// =============================================================================

static void test_shuttle_parked_until_thrust()
{
    Shuttle shuttle({0.0f, 100.0f});
    FuelTank fuel;
    
    shuttle.update(ShuttleControls{}, fuel);
    TEST_ASSERT(shuttle.isParked() && !shuttle.hasLaunched(), "no thrust keeps it parked");
    TEST_NEAR(shuttle.getPosition().y, 100.0f, 0.0001f, "parked shuttle does not fall");
    
    ShuttleControls thrust;
    thrust.thrust = true;
    shuttle.update(thrust, fuel);
    TEST_ASSERT(shuttle.hasLaunched() && !shuttle.isParked(), "thrust launches");
    TEST_NEAR(shuttle.getVelocity().y, (-Shuttle::THRUST_ACCELERATION + Shuttle::GRAVITY) * Shuttle::AIR_DRAG,
              0.0001f, "thrust against gravity with drag");
    TEST_NEAR(fuel.getFuel(), 100.0f - FuelTank::CONSUMPTION_RATE, 0.0001f, "fuel burned");
}

static void test_shuttle_cannot_thrust_on_empty_tank()
{
    Shuttle shuttle({0.0f, 100.0f});
    FuelTank fuel;
    fuel.setFuel(0.0f);
    
    ShuttleControls thrust;
    thrust.thrust = true;
    shuttle.update(thrust, fuel);
    TEST_ASSERT(shuttle.isParked(), "empty tank cannot lift off");
}

static void test_landing_safety_grades()
{
    Shuttle shuttle({0.0f, 0.0f});
    
    LandingSafety noLegs = shuttle.checkLandingSafety();
    TEST_ASSERT(!noLegs.safe && noLegs.reason == "Landing gear not deployed!", "legs required");
    
    shuttle.setLegsExtended(true);
    shuttle.setRotation(0.6f);
    TEST_ASSERT(shuttle.checkLandingSafety().reason == "Bad angle!", "tilted");
    
    shuttle.setRotation(glm::two_pi<float>() + 0.1f);
    shuttle.setVelocity({0.0f, 2.0f});
    LandingSafety perfect = shuttle.checkLandingSafety();
    TEST_ASSERT(perfect.safe && *perfect.quality == LandingQuality::Perfect, "full turn wraps back to level");
    
    shuttle.setVelocity({3.0f, 3.0f});
    LandingSafety good = shuttle.checkLandingSafety();
    TEST_ASSERT(good.safe && *good.quality == LandingQuality::Good, "moderate speed is good");
    
    shuttle.setVelocity({0.0f, 5.5f});
    LandingSafety fast = shuttle.checkLandingSafety();
    TEST_ASSERT(!fast.safe && fast.reason == "Too fast!", "too fast");
    TEST_ASSERT(!fast.quality, "no grade when unsafe");
}

static void test_landing_position_and_type()
{
    auto onPad = LandingEvaluator::isValidLandingPosition(1800.0f, 582.0f, 1800.0f, 600.0f, 120.0f);
    TEST_ASSERT(onPad.valid, "bottom on the deck");
    
    auto offside = LandingEvaluator::isValidLandingPosition(1870.0f, 582.0f, 1800.0f, 600.0f, 120.0f);
    TEST_ASSERT(!offside.valid && offside.reason == "not horizontally aligned", "beside the pad");
    
    auto hovering = LandingEvaluator::isValidLandingPosition(1800.0f, 560.0f, 1800.0f, 600.0f, 120.0f);
    TEST_ASSERT(!hovering.valid && hovering.reason == "not on pad surface", "too high");
    
    const auto& pads = layout().getLandingPads();
    const LandingPadInfo& washington = pads.front();
    const LandingPadInfo& palace = pads.back();
    
    TEST_ASSERT(LandingEvaluator::getLandingType(palace, false, false, GameMode::Single) == LandingType::Victory, "final pad wins");
    TEST_ASSERT(LandingEvaluator::getLandingType(palace, false, false, GameMode::Dogfight) == LandingType::Normal, "no victory in dogfight");
    TEST_ASSERT(LandingEvaluator::getLandingType(washington, false, true, GameMode::Single) == LandingType::WashingtonIce, "ice delivery");
    TEST_ASSERT(LandingEvaluator::getLandingType(washington, false, false, GameMode::Single) == LandingType::WashingtonMedal, "medal");
    TEST_ASSERT(LandingEvaluator::getLandingType(washington, true, false, GameMode::Single) == LandingType::Normal, "medal only once");
    
    TEST_ASSERT(LandingEvaluator::shouldDebounce(1000.0, 1999.0), "inside the debounce window");
    TEST_ASSERT(!LandingEvaluator::shouldDebounce(1000.0, 2000.0), "debounce over");
    TEST_ASSERT(LandingEvaluator::shouldIgnoreStartPad(0, 0, 0.2f), "slow on the start pad");
    TEST_ASSERT(!LandingEvaluator::shouldIgnoreStartPad(1, 0, 0.2f), "other pads count");
    TEST_ASSERT(LandingEvaluator::getLandingSoundKey(LandingQuality::Good) == "landing_good", "sound key");
}

// =============================================================================
// Shark
// =============================================================================

static void test_shark_dies_on_fifth_meal()
{
    RecordingEffects effects;
    TimerQueue timers;
    Shark shark(3000.0f, 100.0f, 2050.0f, 3950.0f, &effects);
    
    for (int i = 0; i < Shark::FATAL_FOOD_COUNT - 1; ++i) {
        TEST_ASSERT(shark.eatBomb(timers, 0.0), "hungry shark eats");
    }
    TEST_ASSERT(shark.getState() == SharkState::Alive, "four meals are fine");
    
    TEST_ASSERT(shark.eatBomb(timers, 0.0), "fifth meal eaten");
    TEST_ASSERT(shark.getState() == SharkState::Dead, "fifth meal is fatal");
    TEST_ASSERT(!shark.eatBomb(timers, 0.0), "dead sharks do not eat");
    TEST_ASSERT(effects.count(EffectKind::SharkGulp) == 5, "one gulp per meal");
    
    timers.processDue(Shark::BURP_DELAY_MS - 1.0);
    TEST_ASSERT(effects.count(EffectKind::BurpBubbles) == 0, "burp waits");
    timers.processDue(Shark::BURP_DELAY_MS);
    TEST_ASSERT(effects.count(EffectKind::BurpBubbles) == 5, "deferred burps");
}

static void test_destroyed_shark_skips_burp()
{
    RecordingEffects effects;
    TimerQueue timers;
    {
        auto shark = std::make_unique<Shark>(3000.0f, 100.0f, 2050.0f, 3950.0f, &effects);
        shark->eatBomb(timers, 0.0);
    }
    timers.processDue(1000.0);
    TEST_ASSERT(effects.count(EffectKind::BurpBubbles) == 0, "no burp from a freed shark");
    
    Shark blown(3000.0f, 100.0f, 2050.0f, 3950.0f, &effects);
    blown.eatBomb(timers, 0.0);
    blown.explodeShark();
    timers.processDue(1000.0);
    TEST_ASSERT(effects.count(EffectKind::BurpBubbles) == 0, "no burp from an exploded shark");
}

static void test_shark_pollution_moods()
{
    Shark shark(3000.0f, 100.0f, 2050.0f, 3950.0f);
    
    shark.update(0.0f, 0.35f, {});
    TEST_ASSERT(shark.getState() == SharkState::Coughing, "dirty water makes it cough");
    shark.update(0.0f, 0.1f, {});
    TEST_ASSERT(shark.getState() == SharkState::Alive, "recovers in clean water");
    
    shark.update(0.0f, Shark::LETHAL_POLLUTION, {});
    TEST_ASSERT(shark.getState() == SharkState::Dead, "lethal pollution kills");
    shark.update(0.0f, 0.0f, {});
    TEST_ASSERT(shark.getState() == SharkState::Dead, "death is permanent");
    
    for (int i = 0; i < 120; ++i) {
        shark.update(0.0f, 0.0f, {});
    }
    TEST_ASSERT(shark.hasReachedSurface(), "carcass floats up");
    TEST_NEAR(shark.getY(), Shark::waterSurface() + 5.0f, 0.001f, "floats at the surface");
    
    SharkExplosion result = shark.explodeShark();
    TEST_ASSERT(result.wasDead && result.points == Shark::POINTS, "dead shark still pays");
}

static void test_shark_chases_food()
{
    Shark shark(3000.0f, 100.0f, 2050.0f, 3950.0f);
    float startX = shark.getX();
    
    shark.update(0.0f, 0.0f, {glm::vec2(startX - 100.0f, shark.getY())});
    TEST_ASSERT(shark.getTargetFood() != nullptr, "food in range is targeted");
    TEST_NEAR(shark.getX(), startX - Shark::SPEED * Shark::CHASE_FACTOR, 0.001f, "swims toward it at chase speed");
    TEST_ASSERT(shark.getDirection() == -1, "turns to face the food");
    
    shark.update(0.0f, 0.0f, {glm::vec2(startX + 1000.0f, shark.getY())});
    TEST_ASSERT(shark.getTargetFood() == nullptr, "far food ignored");
}

// =============================================================================
// Scorching
// =============================================================================

static void test_thrust_scorches_land()
{
    ScorchField scorch(layout(), 7);
    CoastalTerrain terrain = coast();
    const QualityPreset& ultra = QualityPresets::get(QualityLevel::Ultra);
    
    TEST_ASSERT(scorch.update(0.0, downwardThrust(1000.0f, 550.0f), ultra, terrain, {}), "ray hits the ground");
    TEST_ASSERT(scorch.getMarks().size() == 1, "one mark");
    TEST_NEAR(scorch.getMarks()[0].y, 600.0f, 0.001f, "mark on the surface");
    TEST_ASSERT(scorch.getMarks()[0].intensity > 0.3f, "close exhaust is dark");
    
    TEST_ASSERT(!scorch.update(10.0, downwardThrust(1100.0f, 550.0f), ultra, terrain, {}), "raycast throttled");
    
    ThrustInfo idle = downwardThrust(1200.0f, 550.0f);
    idle.isThrusting = false;
    TEST_ASSERT(!scorch.update(1000.0, idle, ultra, terrain, {}), "no thrust, no mark");
    
    TEST_ASSERT(!scorch.update(2000.0, downwardThrust(1300.0f, 550.0f), QualityPresets::get(QualityLevel::Low),
                               terrain, {}), "disabled on low quality");
}

static void test_thrust_over_water_pollutes()
{
    ScorchField scorch(layout(), 7);
    CoastalTerrain terrain = coast();
    
    scorch.update(0.0, downwardThrust(3000.0f, Shark::waterSurface() - 50.0f),
                  QualityPresets::get(QualityLevel::Ultra), terrain, {});
    TEST_ASSERT(scorch.getMarks().empty(), "water takes no marks");
    TEST_ASSERT(scorch.getWaterPollution() > 0.0f, "pollution rises");
    
    scorch.setWaterPollution(3.0f);
    TEST_NEAR(scorch.getWaterPollution(), 1.0f, 0.0001f, "pollution clamped");
}

static void test_scorch_cap_drops_farthest()
{
    ScorchField scorch(layout(), 7);
    CoastalTerrain terrain = coast();
    const QualityPreset& high = QualityPresets::get(QualityLevel::High);
    
    TimeMs now = 0.0;
    for (int i = 0; i < 120; ++i) {
        scorch.update(now, downwardThrust(100.0f + static_cast<float>(i) * 10.0f, 550.0f), high, terrain, {});
        now += 1000.0;
    }
    
    TEST_ASSERT(scorch.getMarks().size() <= static_cast<size_t>(high.maxScorchMarks), "cap holds");
    for (const auto& mark : scorch.getMarks()) {
        TEST_ASSERT(mark.x != 100.0f, "oldest, farthest mark pruned");
    }
}

static void test_craters_and_clearing()
{
    ScorchField scorch(layout(), 7);
    scorch.addCrater(500.0f, 600.0f);
    scorch.addCrater(900.0f, 600.0f);
    TEST_ASSERT(scorch.getMarks()[0].type == ScorchType::Crater, "crater type");
    
    size_t cleared = scorch.clearInArea(Rect{450.0f, 550.0f, 100.0f, 100.0f});
    TEST_ASSERT(cleared == 1, "one crater under the new building");
    TEST_ASSERT(scorch.getMarks().size() == 1, "other crater kept");
    
    scorch.reset();
    TEST_ASSERT(scorch.getMarks().empty() && scorch.getWaterPollution() == 0.0f, "reset");
}

// =============================================================================
// Ocean
// =============================================================================

static void test_ocean_population()
{
    TimerQueue timers;
    WorldEntities single;
    OceanManager ocean(layout(), single, timers, nullptr, 3);
    ocean.populate(GameMode::Single);
    
    TEST_ASSERT(single.sharks.size() >= 2 && single.sharks.size() <= 3, "two or three sharks");
    TEST_ASSERT(single.fisherBoat != nullptr, "boat present");
    TEST_ASSERT(single.greenlandIce != nullptr, "ice present outside dogfight");
    for (const auto& shark : single.sharks) {
        TEST_ASSERT(shark->getX() >= layout().getOceanStart() && shark->getX() <= layout().getOceanEnd(), "shark in the ocean");
    }
    
    WorldEntities dogfight;
    OceanManager arena(layout(), dogfight, timers, nullptr, 3);
    arena.populate(GameMode::Dogfight);
    TEST_ASSERT(!dogfight.greenlandIce, "no ice in dogfight");
}

static void test_ocean_waves_and_boat_proximity()
{
    TimerQueue timers;
    WorldEntities entities;
    entities.fisherBoat = std::make_unique<FisherBoat>(OceanManager::FISHER_BOAT_X, Shark::waterSurface());
    OceanManager ocean(layout(), entities, timers, nullptr, 3);
    CoastalTerrain terrain = coast();
    
    glm::vec2 boat = entities.fisherBoat->getPosition();
    ocean.update(0.0, QualityPresets::get(QualityLevel::Ultra), 0.0f, terrain, {boat + glm::vec2(100.0f, -50.0f)}, {});
    TEST_NEAR(ocean.getWaveOffset(), OceanManager::WAVE_STEP, 0.0001f, "waves advance");
    TEST_ASSERT(ocean.isShuttleNearBoat(), "shuttle hovering by the boat");
    
    float bobbedY = entities.fisherBoat->getY();
    ocean.update(16.0, QualityPresets::get(QualityLevel::Low), 0.0f, terrain, {boat + glm::vec2(400.0f, 0.0f)}, {});
    TEST_NEAR(ocean.getWaveOffset(), OceanManager::WAVE_STEP, 0.0001f, "calm sea on low quality");
    TEST_ASSERT(!ocean.isShuttleNearBoat(), "shuttle moved away");
    TEST_NEAR(entities.fisherBoat->getY(), bobbedY, 0.0001f, "no bobbing without entity updates");
}

static void test_sharks_eat_sunken_food()
{
    TimerQueue timers;
    RecordingEffects effects;
    WorldEntities entities;
    entities.sharks.push_back(std::make_unique<Shark>(3000.0f, 100.0f, 2050.0f, 3950.0f, &effects));
    OceanManager ocean(layout(), entities, timers, &effects, 3);
    CoastalTerrain terrain = coast();
    
    const Shark& shark = *entities.sharks.front();
    ocean.addSunkenFood(shark.getPosition(), CollectibleType::Burger);
    ocean.update(0.0, QualityPresets::get(QualityLevel::Ultra), 0.0f, terrain, {}, {});
    
    TEST_ASSERT(ocean.getSunkenFood().empty(), "food eaten");
    TEST_ASSERT(shark.getFoodEaten() == 1, "shark counted the meal");
    TEST_ASSERT(effects.count(EffectKind::SharkGulp) == 1, "gulp effect");
}

static void test_sunken_food_dropped_once_sharks_are_gone()
{
    TimerQueue timers;
    WorldEntities entities;
    entities.sharks.push_back(std::make_unique<Shark>(3000.0f, 100.0f, 2050.0f, 3950.0f));
    OceanManager ocean(layout(), entities, timers, nullptr, 3);
    CoastalTerrain terrain = coast();
    
    // Out of reach of the shark's mouth
    ocean.addSunkenFood(glm::vec2(2100.0f, 760.0f), CollectibleType::Burger);
    ocean.addSunkenFood(glm::vec2(2150.0f, 760.0f), CollectibleType::Vodka);
    TEST_ASSERT(ocean.getSunkenFood().size() == 2, "food waiting");
    
    Shark& shark = *entities.sharks.front();
    for (int i = 0; i < Shark::FATAL_FOOD_COUNT; ++i) {
        shark.eatBomb(timers, 0.0);
    }
    TEST_ASSERT(!ocean.hasHungrySharks(), "overfed shark is dead");
    
    ocean.update(16.0, QualityPresets::get(QualityLevel::Ultra), 0.0f, terrain, {}, {});
    TEST_ASSERT(ocean.getSunkenFood().empty(), "nothing left to hunt it");
    
    ocean.addSunkenFood(glm::vec2(2100.0f, 760.0f), CollectibleType::Burger);
    TEST_ASSERT(ocean.getSunkenFood().empty(), "new food is not kept");
}

int main()
{
    std::printf("=== World Tests ===\n\n");
    
    std::printf("Shuttle and landing:\n");
    RUN_TEST(test_shuttle_parked_until_thrust);
    RUN_TEST(test_shuttle_cannot_thrust_on_empty_tank);
    RUN_TEST(test_landing_safety_grades);
    RUN_TEST(test_landing_position_and_type);
    
    std::printf("\nShark:\n");
    RUN_TEST(test_shark_dies_on_fifth_meal);
    RUN_TEST(test_destroyed_shark_skips_burp);
    RUN_TEST(test_shark_pollution_moods);
    RUN_TEST(test_shark_chases_food);
    
    std::printf("\nScorching:\n");
    RUN_TEST(test_thrust_scorches_land);
    RUN_TEST(test_thrust_over_water_pollutes);
    RUN_TEST(test_scorch_cap_drops_farthest);
    RUN_TEST(test_craters_and_clearing);
    
    std::printf("\nOcean:\n");
    RUN_TEST(test_ocean_population);
    RUN_TEST(test_ocean_waves_and_boat_proximity);
    RUN_TEST(test_sharks_eat_sunken_food);
    RUN_TEST(test_sunken_food_dropped_once_sharks_are_gone);
    
    return TEST_RESULTS();
}
