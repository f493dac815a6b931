/**
 * test_cannons.cpp
 *
 * Tests for the cannon battery
 *
 * Tests cover:
 * - Nearest-target selection and the fire interval
 * - Off-screen cannons stay idle
 * - Bribes silence every cannon for a fixed window
 * - Projectile intercepts, building absorption and hull hits
 */

#include "TestHarness.h"
#include "RecordingCollaborators.h"
#include "lander/combat/CannonBattery.h"
#include "lander/entities/WorldEntities.h"
#include "lander/settings/QualityPresets.h"

#include <memory>

using namespace Lander;

namespace {

Cannon& addCannon(WorldEntities& entities, float x, float y = 585.0f) {
    entities.cannons.push_back(std::make_unique<Cannon>(glm::vec2(x, y), "USA"));
    return *entities.cannons.back();
}

void addProjectile(Cannon& cannon, float x, float y) {
    CannonProjectile projectile;
    projectile.position = glm::vec2(x, y);
    projectile.velocity = glm::vec2(0.0f);
    projectile.spriteKey = "burger";
    cannon.getProjectiles().push_back(projectile);
}

} // namespace

// =============================================================================
// Targeting
// =============================================================================

static void test_targets_nearest_and_fires_after_interval()
{
    WorldEntities entities;
    CannonBattery battery(entities, nullptr, 1);
    Cannon& cannon = addCannon(entities, 600.0f);
    
    std::vector<glm::vec2> targets = {glm::vec2(100.0f, 300.0f), glm::vec2(650.0f, 400.0f)};
    
    battery.update(1000.0, 0.0f, targets);
    TEST_ASSERT(cannon.getTarget().has_value(), "target acquired");
    TEST_NEAR(cannon.getTarget()->x, 650.0f, 0.001f, "nearest target chosen");
    TEST_ASSERT(battery.getProjectileCount() == 0, "no shot before the interval");
    
    battery.update(2500.0, 0.0f, targets);
    TEST_ASSERT(battery.getProjectileCount() == 1, "first shot");
    
    // Fired from the muzzle toward the target, then advanced one step
    const CannonProjectile& shot = cannon.getProjectiles().front();
    TEST_ASSERT(shot.position.y < 585.0f - Cannon::MUZZLE_OFFSET, "left the muzzle upward");
    TEST_NEAR(glm::length(shot.velocity), Cannon::PROJECTILE_SPEED, 0.001f, "projectile speed");
    
    battery.update(3000.0, 0.0f, targets);
    TEST_ASSERT(battery.getProjectileCount() == 1, "interval not yet elapsed");
    
    battery.update(4501.0, 0.0f, targets);
    TEST_ASSERT(battery.getProjectileCount() == 2, "second shot");
}

static void test_off_screen_cannon_stays_idle()
{
    WorldEntities entities;
    CannonBattery battery(entities, nullptr, 1);
    Cannon& cannon = addCannon(entities, 3000.0f);
    
    battery.update(5000.0, 0.0f, {glm::vec2(600.0f, 300.0f)});
    TEST_ASSERT(!cannon.getTarget().has_value(), "no target off screen");
    TEST_ASSERT(battery.getProjectileCount() == 0, "no shot off screen");
    
    // Within the camera margin counts as on screen
    battery.update(5000.0, 3000.0f - GAME_WIDTH - 100.0f, {glm::vec2(2900.0f, 300.0f)});
    TEST_ASSERT(cannon.getTarget().has_value(), "target inside the margin");
}

static void test_no_targets_means_no_fire()
{
    WorldEntities entities;
    CannonBattery battery(entities, nullptr, 1);
    addCannon(entities, 600.0f);
    
    battery.update(5000.0, 0.0f, {});
    TEST_ASSERT(battery.getProjectileCount() == 0, "nothing to shoot at");
}

// =============================================================================
// Bribes
// =============================================================================

static void test_bribe_silences_cannons()
{
    WorldEntities entities;
    CannonBattery battery(entities, nullptr, 1);
    Cannon& cannon = addCannon(entities, 600.0f);
    std::vector<glm::vec2> targets = {glm::vec2(600.0f, 300.0f)};
    
    battery.update(100.0, 0.0f, targets);
    TEST_ASSERT(cannon.getTarget().has_value(), "target before the bribe");
    
    battery.bribe(200.0);
    TEST_ASSERT(battery.isBribed(200.0), "bribed now");
    TEST_ASSERT(battery.isBribed(200.0 + CannonBattery::BRIBE_DURATION_MS - 1.0), "bribed near the end");
    TEST_ASSERT(!battery.isBribed(200.0 + CannonBattery::BRIBE_DURATION_MS), "bribe expires");
    
    battery.update(2500.0, 0.0f, targets);
    TEST_ASSERT(!cannon.getTarget().has_value(), "target cleared");
    TEST_ASSERT(battery.getProjectileCount() == 0, "no shot while bribed");
    
    battery.update(10300.0, 0.0f, targets);
    TEST_ASSERT(cannon.getTarget().has_value(), "target reacquired");
    TEST_ASSERT(battery.getProjectileCount() == 1, "firing resumes");
}

// =============================================================================
// Projectiles
// =============================================================================

static void test_projectiles_intercept_each_other()
{
    WorldEntities entities;
    RecordingEffects effects;
    CannonBattery battery(entities, &effects, 1);
    Cannon& first = addCannon(entities, 600.0f);
    Cannon& second = addCannon(entities, 900.0f);
    
    addProjectile(first, 300.0f, 300.0f);
    addProjectile(second, 310.0f, 300.0f);
    addProjectile(second, 500.0f, 300.0f);
    
    InterceptStats stats = battery.resolveIntercepts(QualityPresets::get(QualityLevel::Ultra));
    TEST_ASSERT(stats.shotDown == 2, "pair shot down");
    TEST_ASSERT(stats.absorbedByBuildings == 0, "no buildings");
    TEST_ASSERT(battery.getProjectileCount() == 1, "lone projectile survives");
    TEST_ASSERT(effects.count(EffectKind::ProjectileBurst) == 1, "one burst per pair");
}

static void test_low_preset_skips_intercepts()
{
    WorldEntities entities;
    CannonBattery battery(entities, nullptr, 1);
    Cannon& cannon = addCannon(entities, 600.0f);
    
    addProjectile(cannon, 300.0f, 300.0f);
    addProjectile(cannon, 305.0f, 300.0f);
    
    InterceptStats stats = battery.resolveIntercepts(QualityPresets::get(QualityLevel::Low));
    TEST_ASSERT(stats.shotDown == 0, "pairwise test skipped");
    TEST_ASSERT(battery.getProjectileCount() == 2, "both survive");
}

static void test_buildings_absorb_projectiles()
{
    WorldEntities entities;
    RecordingEffects effects;
    CannonBattery battery(entities, &effects, 1);
    Cannon& cannon = addCannon(entities, 600.0f);
    entities.buildings.push_back(std::make_unique<Building>(
        glm::vec2(800.0f, 600.0f), 60.0f, 120.0f, "Tower", "USA", 5, false));
    
    addProjectile(cannon, 800.0f, 550.0f);   // inside the facade
    addProjectile(cannon, 900.0f, 550.0f);   // beside it
    
    InterceptStats stats = battery.resolveIntercepts(QualityPresets::get(QualityLevel::Low));
    TEST_ASSERT(stats.absorbedByBuildings == 1, "one absorbed");
    TEST_ASSERT(battery.getProjectileCount() == 1, "the other flies on");
    TEST_NEAR(cannon.getProjectiles().front().position.x, 900.0f, 0.001f, "survivor");
    TEST_ASSERT(effects.count(EffectKind::ProjectileBurst) == 1, "burst on the facade");
    
    // Destroyed buildings no longer shield
    entities.buildings.front()->explode();
    addProjectile(cannon, 800.0f, 550.0f);
    stats = battery.resolveIntercepts(QualityPresets::get(QualityLevel::Low));
    TEST_ASSERT(stats.absorbedByBuildings == 0, "rubble absorbs nothing");
}

static void test_hull_hits_consume_projectiles()
{
    WorldEntities entities;
    CannonBattery battery(entities, nullptr, 1);
    Cannon& cannon = addCannon(entities, 600.0f);
    
    addProjectile(cannon, 1000.0f, 300.0f);
    addProjectile(cannon, 1020.0f, 300.0f);
    addProjectile(cannon, 1100.0f, 300.0f);
    
    int hits = battery.collectHullHits(glm::vec2(1010.0f, 300.0f));
    TEST_ASSERT(hits == 2, "two within the hull radius");
    TEST_ASSERT(battery.getProjectileCount() == 1, "hits removed");
    
    battery.clearProjectiles();
    TEST_ASSERT(battery.getProjectileCount() == 0, "cleared");
}

int main()
{
    std::printf("=== Cannon Tests ===\n\n");
    
    std::printf("Targeting:\n");
    RUN_TEST(test_targets_nearest_and_fires_after_interval);
    RUN_TEST(test_off_screen_cannon_stays_idle);
    RUN_TEST(test_no_targets_means_no_fire);
    
    std::printf("\nBribes:\n");
    RUN_TEST(test_bribe_silences_cannons);
    
    std::printf("\nProjectiles:\n");
    RUN_TEST(test_projectiles_intercept_each_other);
    RUN_TEST(test_low_preset_skips_intercepts);
    RUN_TEST(test_buildings_absorb_projectiles);
    RUN_TEST(test_hull_hits_consume_projectiles);
    
    return TEST_RESULTS();
}
