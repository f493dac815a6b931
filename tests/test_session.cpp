/**
 * test_session.cpp
 *
 * Tests for scoring and the per-frame game session
 *
 * Tests cover:
 * - Time bonus, item points, milestone bonus and time formatting
 * - Destruction ledger and trade deductions
 * - Session start: world population and pilot spawning
 * - Pad landings with auto-trade, the start pad rule and debouncing
 * - Crashes into terrain, the void, bad landings and cannon fire
 * - Washington medal, final destination victory and the dogfight restart
 * - Collectible pickups, including classified files from the golf cart
 * - Lightning strikes and the weather quality knob
 * - Power-ups and the end-of-run report
 */

#include "TestHarness.h"
#include "RecordingCollaborators.h"
#include "lander/core/WorldLayout.h"
#include "lander/session/GameSession.h"
#include "lander/settings/SettingsStore.h"

using namespace Lander;

namespace {

struct SessionFixture {
    explicit SessionFixture(GameMode mode = GameMode::Single)
        : terrain(600.0f, Shark::waterSurface(), WorldLayout::standard().getWaterStart(),
                  WorldLayout::standard().getWaterEnd())
        , session(WorldLayout::standard(), terrain,
                  SessionServices{audio, effects, achievements, events, settings},
                  makeConfig(mode)) {
        session.start(0.0);
    }
    
    static SessionConfig makeConfig(GameMode mode) {
        SessionConfig config;
        config.mode = mode;
        config.seed = 11;
        return config;
    }
    
    // One frame with pilot 1 thrusting; lifts it off the start pad
    void launch(TimeMs now) {
        PilotInput thrust;
        thrust.flight.thrust = true;
        session.tick(now, 60.0f, {thrust});
    }
    
    void tick(TimeMs now) {
        session.tick(now, 60.0f, {});
    }
    
    // Hover just above a surface, sinking gently, gear down
    void placeAbove(float x, float surfaceY, float sinkRate = 1.0f) {
        Shuttle& shuttle = pilot().shuttle;
        shuttle.setPosition(glm::vec2(x, surfaceY - Shuttle::BOTTOM_OFFSET - 2.0f));
        shuttle.setVelocity(glm::vec2(0.0f, sinkRate));
        shuttle.setRotation(0.0f);
        shuttle.setLegsExtended(true);
    }
    
    PlayerState& pilot(PlayerId player = 1) { return *session.getPlayer(player); }
    
    RecordingAudio audio;
    RecordingEffects effects;
    RecordingAchievements achievements;
    RecordingMatchEvents events;
    MemorySettingsStore settings;
    CoastalTerrain terrain;
    GameSession session;
};

const LandingPadInfo& pad(int index) {
    return WorldLayout::standard().getLandingPads()[static_cast<size_t>(index)];
}

} // namespace

// =============================================================================
// Scoring
// =============================================================================

static void test_time_bonus()
{
    TEST_ASSERT(SessionScore::computeTimeBonus(0.0) == 5000, "full bonus at zero");
    TEST_ASSERT(SessionScore::computeTimeBonus(59999.0) == 5000 - 59 * 10, "whole seconds only");
    TEST_ASSERT(SessionScore::computeTimeBonus(120000.0) == 3800, "two minutes");
    TEST_ASSERT(SessionScore::computeTimeBonus(600000.0) == 0, "exhausted at ten minutes");
    TEST_ASSERT(SessionScore::computeTimeBonus(3600000.0) == 0, "never negative");
}

static void test_item_points_and_report()
{
    TEST_ASSERT(SessionScore::getItemPoints(CollectibleType::MagaHat) == 500, "hat");
    TEST_ASSERT(SessionScore::getItemPoints(CollectibleType::Twitter) == 200, "twitter");
    TEST_ASSERT(SessionScore::getItemPoints(CollectibleType::Dollar) == 100, "dollar");
    TEST_ASSERT(SessionScore::getItemPoints(CollectibleType::Burger) == 50, "burger");
    TEST_ASSERT(SessionScore::getItemPoints(CollectibleType::GoldenToilet) == SessionScore::DEFAULT_ITEM_POINTS,
                "everything else");
    
    std::vector<DeliveredItem> delivered = {
        {CollectibleType::MagaHat, 2},
        {CollectibleType::Dollar, 3},
        {CollectibleType::Burger, 0},
    };
    TEST_ASSERT(SessionScore::computeItemsTotal(delivered) == 1300, "items total");
    
    SessionReport report = SessionScore::compute(65000.0, delivered, true);
    TEST_ASSERT(report.elapsedSeconds == 65, "elapsed");
    TEST_ASSERT(report.timeBonus == 4350, "time bonus");
    TEST_ASSERT(report.itemsTotal == 1300, "items");
    TEST_ASSERT(report.milestoneBonus == SessionScore::PEACE_MEDAL_BONUS, "medal bonus");
    TEST_ASSERT(report.total == 4350 + 1300 + 10000, "total");
    
    report = SessionScore::compute(65000.0, delivered, false);
    TEST_ASSERT(report.milestoneBonus == 0, "no medal");
}

static void test_format_time()
{
    TEST_ASSERT(SessionScore::formatTime(0.0) == "0:00", "zero");
    TEST_ASSERT(SessionScore::formatTime(9999.0) == "0:09", "pads seconds");
    TEST_ASSERT(SessionScore::formatTime(125000.0) == "2:05", "minutes");
    TEST_ASSERT(SessionScore::formatTime(-500.0) == "0:00", "clamped");
}

static void test_destruction_ledger()
{
    DestructionLedger ledger;
    ScoreSink& sink = ledger;
    sink.addDestructionScore(300);
    sink.addDestructionScore(100);
    sink.addDestroyedBuilding("Big Ben", "United Kingdom");
    ledger.deductTrade(75);
    ledger.deductTrade(-10);
    
    TEST_ASSERT(ledger.getDestructionScore() == 400, "destruction");
    TEST_ASSERT(ledger.getTradeDeductions() == 75, "negative deductions ignored");
    TEST_ASSERT(ledger.getScore() == 325, "net score");
    TEST_ASSERT(ledger.getDestroyedBuildings().size() == 1, "building listed");
    TEST_ASSERT(ledger.getDestroyedBuildings()[0].country == "United Kingdom", "country kept");
    
    ledger.reset();
    TEST_ASSERT(ledger.getScore() == 0, "reset");
    TEST_ASSERT(ledger.getDestroyedBuildings().empty(), "list reset");
}

// =============================================================================
// Start
// =============================================================================

static void test_start_spawns_pilots_and_world()
{
    SessionFixture single;
    TEST_ASSERT(single.session.getMatch().getPlayerCount() == 1, "one pilot");
    TEST_ASSERT(single.pilot().shuttle.isParked(), "parked on the start pad");
    TEST_NEAR(single.pilot().shuttle.getPosition().x, pad(0).x, 0.001f, "over the start pad");
    TEST_ASSERT(single.pilot().shuttle.getBottom() < 600.0f, "above the deck");
    TEST_ASSERT(!single.session.getEntities().cannons.empty(), "cannons placed");
    TEST_ASSERT(!single.session.getEntities().buildings.empty(), "buildings placed");
    TEST_ASSERT(!single.session.getEntities().oilTowers.empty(), "oil towers placed");
    TEST_ASSERT(!single.session.getAirTraffic().getTargetCountry().empty(), "plane theme chosen");
    TEST_ASSERT(single.session.getPickups().getPickupCount() > 0, "collectibles placed");
    
    SessionFixture pair(GameMode::TwoPlayer);
    TEST_ASSERT(pair.session.getMatch().getPlayerCount() == 2, "two pilots");
    TEST_NEAR(pair.pilot(2).shuttle.getPosition().x, pad(0).x + GameSession::SECOND_PILOT_OFFSET, 0.001f,
              "second pilot beside the first");
}

static void test_parked_shuttle_waits_for_thrust()
{
    SessionFixture f;
    glm::vec2 spawn = f.pilot().shuttle.getPosition();
    
    for (int i = 1; i <= 30; ++i) {
        f.tick(i * 16.0);
    }
    TEST_ASSERT(f.pilot().shuttle.isParked(), "still parked");
    TEST_NEAR(f.pilot().shuttle.getPosition().y, spawn.y, 0.001f, "no gravity while parked");
    TEST_ASSERT(!f.session.getMatch().isOver(), "still playing");
    
    f.launch(600.0);
    TEST_ASSERT(!f.pilot().shuttle.isParked(), "lifted off");
    TEST_NEAR(f.pilot().invulnerableUntil, 600.0 + GameSession::INVULNERABILITY_MS, 0.001,
              "launch grace period");
}

// =============================================================================
// Landings
// =============================================================================

static void test_landing_trades_for_fuel()
{
    SessionFixture f;
    f.launch(0.0);
    f.pilot().inventory.add(CollectibleType::Dollar, 3);
    f.pilot().fuel.setFuel(40.0f);
    
    f.placeAbove(pad(1).x, 600.0f);
    f.tick(1000.0);
    
    const auto& landings = f.session.getLandings();
    TEST_ASSERT(landings.size() == 1, "landed");
    TEST_ASSERT(landings[0].padIndex == 1, "on the fuel stop");
    TEST_ASSERT(landings[0].quality == LandingQuality::Perfect, "gentle touchdown");
    TEST_ASSERT(landings[0].type == LandingType::Normal, "ordinary pad");
    TEST_ASSERT(landings[0].trade.has_value(), "goods sold");
    TEST_ASSERT(landings[0].trade->fuelGranted > 0, "fuel granted");
    TEST_ASSERT(f.pilot().fuel.getFuel() > 40.0f, "tank refilled");
    TEST_ASSERT(f.pilot().inventory.getCount(CollectibleType::Dollar) < 3, "dollars spent");
    TEST_ASSERT(f.session.getLedger().getTradeDeductions() == landings[0].trade->scoreLost, "score given up");
    TEST_ASSERT(f.audio.played("landing_perfect"), "landing cue");
    TEST_ASSERT(f.pilot().shuttle.isParked(), "settled on the deck");
    TEST_NEAR(f.pilot().shuttle.getBottom(), 600.0f, 0.001f, "resting on the surface");
}

static void test_slow_contact_with_start_pad_is_ignored()
{
    SessionFixture f;
    f.launch(0.0);
    
    f.placeAbove(pad(0).x, 600.0f, 0.2f);
    f.tick(1000.0);
    TEST_ASSERT(f.session.getLandings().empty(), "drifting on the start pad");
    TEST_ASSERT(f.pilot().startPadIndex == 0, "start pad still armed");
    TEST_ASSERT(f.pilot().isActive(), "no crash");
}

static void test_landings_are_debounced()
{
    SessionFixture f;
    f.launch(0.0);
    f.placeAbove(pad(1).x, 600.0f);
    f.tick(1000.0);
    TEST_ASSERT(f.session.getLandings().size() == 1, "first landing");
    
    // Hop and come straight back down inside the debounce window
    f.launch(1050.0);
    f.placeAbove(pad(1).x, 600.0f);
    f.tick(1900.0);
    TEST_ASSERT(f.session.getLandings().size() == 1, "debounced");
    TEST_ASSERT(f.pilot().isActive(), "held up by the deck");
    
    f.tick(2100.0);
    TEST_ASSERT(f.session.getLandings().size() == 2, "counts once the window passes");
}

static void test_washington_medal_and_report()
{
    SessionFixture f;
    f.launch(0.0);
    
    f.placeAbove(pad(0).x, 600.0f);
    f.tick(1000.0);
    
    TEST_ASSERT(f.session.getLandings().size() == 1, "landed back home");
    TEST_ASSERT(f.session.getLandings()[0].type == LandingType::WashingtonMedal, "medal awarded");
    TEST_ASSERT(f.pilot().hasPeaceMedal, "medal carried");
    TEST_ASSERT(f.pilot().startPadIndex == -1, "start pad consumed");
    
    SessionReport report = f.session.buildReport(65000.0);
    TEST_ASSERT(report.milestoneBonus == SessionScore::PEACE_MEDAL_BONUS, "medal bonus");
    TEST_ASSERT(report.timeBonus == 4350, "time bonus from session start");
    TEST_ASSERT(!report.victory, "not over");
}

static void test_final_destination_victory()
{
    SessionFixture f;
    f.launch(0.0);
    
    const LandingPadInfo& palace = WorldLayout::standard().getLandingPads().back();
    f.placeAbove(palace.x, 600.0f);
    f.tick(1000.0);
    
    TEST_ASSERT(f.session.getMatch().getPhase() == MatchPhase::Victory, "victory");
    TEST_ASSERT(f.session.getLandings().back().type == LandingType::Victory, "victory landing");
    TEST_ASSERT(!f.session.getLandings().back().trade.has_value(), "no trade on arrival");
    
    SessionReport report = f.session.buildReport(2000.0);
    TEST_ASSERT(report.victory, "report flags victory");
    TEST_ASSERT(report.message == "You've reached Putino's Palace! Peace delivered!", "victory message");
    
    // Frames after the end change nothing
    uint64_t frames = f.session.getFrameCount();
    f.tick(1016.0);
    TEST_ASSERT(f.session.getFrameCount() == frames + 1, "frame counted");
    TEST_ASSERT(f.session.getLandings().size() == 1, "no further landings");
}

// =============================================================================
// Crashes
// =============================================================================

static void test_terrain_crash_after_grace_period()
{
    SessionFixture f;
    f.launch(0.0);
    
    // Inside the grace period the ground is harmless
    f.pilot().shuttle.setPosition(glm::vec2(500.0f, 590.0f));
    f.tick(100.0);
    TEST_ASSERT(f.pilot().isActive(), "invulnerable");
    
    f.pilot().shuttle.setPosition(glm::vec2(500.0f, 590.0f));
    f.tick(1000.0);
    TEST_ASSERT(!f.pilot().isActive(), "crashed");
    TEST_ASSERT(f.events.crashes.size() == 1, "crash reported");
    TEST_ASSERT(f.events.crashes[0].cause == "terrain", "terrain cause");
    TEST_ASSERT(f.session.getMatch().getPhase() == MatchPhase::Crashed, "single pilot run over");
    
    SessionReport report = f.session.buildReport(1000.0);
    TEST_ASSERT(report.message == "You crashed into the terrain!", "death message");
    TEST_ASSERT(!report.victory, "no victory");
}

static void test_falling_into_the_void()
{
    SessionFixture f;
    f.launch(0.0);
    
    f.pilot().shuttle.setPosition(glm::vec2(500.0f, GameSession::VOID_DEPTH + 50.0f));
    f.tick(100.0);
    TEST_ASSERT(f.events.crashes.size() == 1, "crash even while invulnerable");
    TEST_ASSERT(f.events.crashes[0].cause == "void", "void cause");
}

static void test_bad_landing()
{
    SessionFixture f;
    f.launch(0.0);
    
    f.placeAbove(pad(1).x, 600.0f);
    f.pilot().shuttle.setLegsExtended(false);
    f.tick(1000.0);
    
    TEST_ASSERT(f.session.getLandings().empty(), "no landing");
    TEST_ASSERT(f.events.crashes.size() == 1, "crashed");
    TEST_ASSERT(f.events.crashes[0].cause == "bad_landing", "bad landing cause");
    TEST_ASSERT(f.events.crashes[0].message == "Crash landing! Landing gear not deployed!", "reason");
}

static void test_cannon_fire_downs_shuttle()
{
    SessionFixture f;
    f.launch(0.0);
    
    f.pilot().shuttle.setPosition(glm::vec2(500.0f, 300.0f));
    f.pilot().shuttle.setVelocity(glm::vec2(0.0f));
    
    CannonProjectile shot;
    shot.position = glm::vec2(500.0f, 300.0f);
    shot.spriteKey = "burger";
    f.session.getEntities().cannons.front()->getProjectiles().push_back(shot);
    
    f.tick(1000.0);
    TEST_ASSERT(f.events.projectileHits.size() == 1, "hit reported");
    TEST_ASSERT(f.events.crashes.size() == 1, "crashed");
    TEST_ASSERT(f.events.crashes[0].cause == "projectile", "projectile cause");
    TEST_ASSERT(f.session.getCannons().getProjectileCount() == 0, "projectile consumed");
}

static void test_dogfight_round_restarts()
{
    SessionFixture f(GameMode::Dogfight);
    f.launch(0.0);
    f.session.getMatch().restoreKills({4, 2});
    
    f.pilot().shuttle.setPosition(glm::vec2(500.0f, 590.0f));
    f.tick(1000.0);
    TEST_ASSERT(!f.pilot().isActive(), "pilot down");
    TEST_ASSERT(!f.session.getMatch().isOver(), "dogfight continues");
    TEST_ASSERT(f.session.getMatch().isRestartPending(), "restart scheduled");
    
    f.tick(2000.0);
    TEST_ASSERT(!f.pilot().isActive(), "not yet");
    
    f.tick(2600.0);
    TEST_ASSERT(f.pilot().isActive(), "respawned");
    TEST_ASSERT(f.pilot().shuttle.isParked(), "back on the start pad");
    TEST_ASSERT(f.pilot(2).isActive(), "opponent respawned too");
    TEST_ASSERT(f.session.getMatch().getKills().p1Kills == 4, "kills carried over");
    TEST_ASSERT(f.session.getMatch().getKills().p2Kills == 2, "kills carried over");
    TEST_ASSERT(f.pilot().deathMessage.empty(), "death message cleared");
}

// =============================================================================
// Pickups
// =============================================================================

static void test_pickups_fill_inventory()
{
    SessionFixture f;
    f.launch(0.0);
    f.session.getPickups().clear();
    f.session.getPickups().addPickup({500.0f, 300.0f}, CollectibleType::Burger);
    f.session.getPickups().addPickup({510.0f, 305.0f}, CollectibleType::Dollar);
    
    int burgers = f.pilot().inventory.getCount(CollectibleType::Burger);
    int dollars = f.pilot().inventory.getCount(CollectibleType::Dollar);
    
    f.pilot().shuttle.setPosition(glm::vec2(500.0f, 300.0f));
    f.pilot().shuttle.setVelocity(glm::vec2(0.0f));
    f.tick(100.0);
    
    TEST_ASSERT(f.pilot().inventory.getCount(CollectibleType::Burger) == burgers + FOOD_PICKUP_AMOUNT,
                "food bundle picked up");
    TEST_ASSERT(f.pilot().inventory.getCount(CollectibleType::Dollar) == dollars + 1, "dollar picked up");
    TEST_ASSERT(f.audio.played("pickup"), "pickup cue");
    TEST_ASSERT(f.session.getPickups().getPickupCount() == 0, "removed from the world");
}

static void test_golf_cart_files_become_pickups()
{
    SessionFixture f;
    auto& entities = f.session.getEntities();
    entities.buildings.clear();
    entities.cannons.clear();
    entities.golfCart = std::make_unique<GolfCart>(1000.0f, 800.0f, 1200.0f);
    entities.golfCart->setPosition({1000.0f, 600.0f});
    
    size_t before = f.session.getPickups().getPickupCount();
    
    Bomb bomb;
    bomb.position = glm::vec2(1000.0f, 580.0f);
    bomb.createdAt = 50.0;
    f.session.getBombs().addBomb(bomb);
    f.tick(100.0);
    
    TEST_ASSERT(f.events.drops.size() == 1, "host still told about the drop");
    TEST_ASSERT(f.session.getPickups().getPickupCount() == before + 3, "three files on the ground");
    
    int files = 0;
    for (const auto& pickup : f.session.getPickups().getPickups()) {
        if (pickup.source != PickupSource::ClassifiedFiles) continue;
        files++;
        TEST_ASSERT(pickup.type == CollectibleType::ClassifiedDocs, "classified docs");
        TEST_ASSERT(pickup.requiresLanding, "landing required");
        TEST_NEAR(pickup.despawnAt, 100.0 + CollectibleField::DROP_LIFETIME_MS, 0.001, "despawn from the blast");
    }
    TEST_ASSERT(files == 3, "all files tagged");
}

// =============================================================================
// Weather
// =============================================================================

namespace {

// Hover over the Atlantic with the cannons bribed, directly below a storm cloud
void holdUnderStorm(SessionFixture& f, TimeMs now)
{
    Shuttle& shuttle = f.pilot().shuttle;
    shuttle.setPosition(glm::vec2(3000.0f, 260.0f));
    shuttle.setVelocity(glm::vec2(0.0f));
    shuttle.setRotation(0.0f);
    f.session.getCannons().bribe(now);
}

TimeMs brewStorm(SessionFixture& f)
{
    f.launch(0.0);
    WeatherSystem& weather = f.session.getWeather();
    weather.setWeatherState(WeatherState::Stormy, 0.0);
    
    // Camera sits half a screen left of the shuttle
    float cameraX = 3000.0f - GAME_WIDTH * 0.5f;
    weather.addStormCloud(GAME_WIDTH * 0.5f + cameraX * WeatherSystem::CLOUD_PARALLAX, 100.0f, 1.5f);
    
    TimeMs now = 10000.0;
    for (int i = 0; i < 80 && !weather.getPendingStrike(); ++i, now += WeatherSystem::CHECK_INTERVAL_MS) {
        holdUnderStorm(f, now);
        f.tick(now);
    }
    return now;
}

} // namespace

static void test_lightning_downs_shuttle()
{
    SessionFixture f;
    brewStorm(f);
    
    const auto& pending = f.session.getWeather().getPendingStrike();
    TEST_ASSERT(pending.has_value(), "warning issued");
    TEST_ASSERT(f.effects.count(EffectKind::LightningWarning) == 1, "warning shown");
    TEST_ASSERT(f.pilot().isActive(), "still flying");
    
    TimeMs strikeAt = pending->strikeAt;
    holdUnderStorm(f, strikeAt);
    f.tick(strikeAt);
    
    TEST_ASSERT(f.events.crashes.size() == 1, "crashed");
    TEST_ASSERT(f.events.crashes[0].cause == "lightning", "lightning cause");
    TEST_ASSERT(f.events.crashes[0].message == "Struck by lightning!", "reason");
    TEST_ASSERT(f.session.getMatch().getPhase() == MatchPhase::Crashed, "run over");
    TEST_ASSERT(f.session.getWeather().getStrikeCount() == 1, "strike counted");
}

static void test_low_quality_calms_the_storm()
{
    SessionFixture f;
    TimeMs now = brewStorm(f);
    TEST_ASSERT(f.session.getWeather().getPendingStrike().has_value(), "warning issued");
    TimeMs strikeAt = f.session.getWeather().getPendingStrike()->strikeAt;
    
    f.session.getGovernor().setQualityLevel(QualityLevel::Low);
    holdUnderStorm(f, now + 100.0);
    f.tick(now + 100.0);
    TEST_ASSERT(!f.session.getWeather().getPendingStrike(), "strike dropped");
    
    holdUnderStorm(f, strikeAt + 100.0);
    f.tick(strikeAt + 100.0);
    TEST_ASSERT(f.events.crashes.empty(), "no strike");
    TEST_ASSERT(f.pilot().isActive(), "still flying");
}

// =============================================================================
// Power-ups
// =============================================================================

static void test_bribe_power_up()
{
    SessionFixture f;
    f.pilot().inventory.add(CollectibleType::TrumpTower, 1);
    f.pilot().inventory.add(CollectibleType::Dollar, 1);
    
    TEST_ASSERT(f.session.usePowerUp(1, CollectibleType::TrumpTower, 100.0), "bribe spent");
    TEST_ASSERT(f.session.getCannons().isBribed(5000.0), "cannons bribed");
    TEST_ASSERT(f.pilot().inventory.getCount(CollectibleType::TrumpTower) == 0, "consumed");
    
    TEST_ASSERT(!f.session.usePowerUp(1, CollectibleType::TrumpTower, 200.0), "none left");
    TEST_ASSERT(!f.session.usePowerUp(1, CollectibleType::Dollar, 200.0), "not a power-up");
    TEST_ASSERT(f.pilot().inventory.getCount(CollectibleType::Dollar) == 1, "dollar kept");
    TEST_ASSERT(!f.session.usePowerUp(2, CollectibleType::TrumpTower, 200.0), "no such pilot");
}

static void test_speed_boost_power_up()
{
    SessionFixture f;
    SessionFixture plain;
    f.pilot().inventory.add(CollectibleType::RedTie, 2);
    
    TEST_ASSERT(f.session.usePowerUp(1, CollectibleType::RedTie, 100.0), "tie worn");
    TEST_ASSERT(f.pilot().inventory.getCount(CollectibleType::RedTie) == 1, "consumed");
    TEST_NEAR(f.pilot().shuttle.getThrustMultiplier(), GameSession::SPEED_BOOST_THRUST, 0.001f, "boosted");
    TEST_NEAR(f.pilot().speedBoostUntil, 100.0 + GameSession::SPEED_BOOST_MS, 0.001, "six seconds");
    TEST_ASSERT(f.audio.played("powerup"), "power-up cue");
    
    // Same launch frame, more lift
    f.launch(116.0);
    plain.launch(116.0);
    TEST_ASSERT(f.pilot().shuttle.getVelocity().y < plain.pilot().shuttle.getVelocity().y, "stronger thrust");
    
    // A second tie restarts the clock
    TEST_ASSERT(f.session.usePowerUp(1, CollectibleType::RedTie, 3000.0), "second tie");
    TEST_NEAR(f.pilot().speedBoostUntil, 3000.0 + GameSession::SPEED_BOOST_MS, 0.001, "clock restarted");
    
    f.tick(6100.0);
    TEST_NEAR(f.pilot().shuttle.getThrustMultiplier(), GameSession::SPEED_BOOST_THRUST, 0.001f, "still running");
    
    f.tick(9000.0);
    TEST_NEAR(f.pilot().shuttle.getThrustMultiplier(), 1.0f, 0.001f, "worn off");
    TEST_NEAR(f.pilot().speedBoostUntil, 0.0, 0.001, "cleared");
}

int main()
{
    std::printf("=== Session Tests ===\n\n");
    
    std::printf("Scoring:\n");
    RUN_TEST(test_time_bonus);
    RUN_TEST(test_item_points_and_report);
    RUN_TEST(test_format_time);
    RUN_TEST(test_destruction_ledger);
    
    std::printf("\nStart:\n");
    RUN_TEST(test_start_spawns_pilots_and_world);
    RUN_TEST(test_parked_shuttle_waits_for_thrust);
    
    std::printf("\nLandings:\n");
    RUN_TEST(test_landing_trades_for_fuel);
    RUN_TEST(test_slow_contact_with_start_pad_is_ignored);
    RUN_TEST(test_landings_are_debounced);
    RUN_TEST(test_washington_medal_and_report);
    RUN_TEST(test_final_destination_victory);
    
    std::printf("\nCrashes:\n");
    RUN_TEST(test_terrain_crash_after_grace_period);
    RUN_TEST(test_falling_into_the_void);
    RUN_TEST(test_bad_landing);
    RUN_TEST(test_cannon_fire_downs_shuttle);
    RUN_TEST(test_dogfight_round_restarts);
    
    std::printf("\nPickups:\n");
    RUN_TEST(test_pickups_fill_inventory);
    RUN_TEST(test_golf_cart_files_become_pickups);
    
    std::printf("\nWeather:\n");
    RUN_TEST(test_lightning_downs_shuttle);
    RUN_TEST(test_low_quality_calms_the_storm);
    
    std::printf("\nPower-ups:\n");
    RUN_TEST(test_bribe_power_up);
    RUN_TEST(test_speed_boost_power_up);
    
    return TEST_RESULTS();
}
