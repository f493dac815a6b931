/**
 * main.cpp
 * 
 * Headless demo runner for the lander simulation.
 * Flies an autopilot east for a fixed number of frames and prints the report.
 * 
 * Usage:
 *   lander_sim [settings_dir] [ticks]
 *   lander_sim --settings ./settings --ticks 3600 --mode dogfight --seed 7
 */

#include "lander/core/Collaborators.h"
#include "lander/core/WorldLayout.h"
#include "lander/creatures/Shark.h"
#include "lander/session/GameSession.h"
#include "lander/settings/AudioSettings.h"
#include "lander/settings/SettingsStore.h"
#include "lander/core/Log.h"
#include <iostream>
#include <string>
#include <vector>

using namespace Lander;

// ============================================================================
// COMMAND LINE PARSING
// ============================================================================

struct SimOptions {
    std::string settingsDir = "lander_settings";
    int ticks = 3600;
    float fps = 60.0f;
    SessionConfig session;
};

void printUsage(const char* programName) {
    std::cout << "Lander headless simulation\n";
    std::cout << "\nUsage:\n";
    std::cout << "  " << programName << " [settings_dir] [ticks] [options]\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -s, --settings <dir>      Settings directory (default: lander_settings)\n";
    std::cout << "  -t, --ticks <n>           Frames to simulate (default: 3600)\n";
    std::cout << "  -m, --mode <mode>         single, two_player or dogfight\n";
    std::cout << "  --seed <n>                World seed\n";
    std::cout << "  --fps <f>                 Frame rate reported to the governor\n";
    std::cout << "\n";
}

bool parseMode(const std::string& text, GameMode& mode) {
    if (text == "single") mode = GameMode::Single;
    else if (text == "two_player") mode = GameMode::TwoPlayer;
    else if (text == "dogfight") mode = GameMode::Dogfight;
    else return false;
    return true;
}

bool parseArgs(int argc, char* argv[], SimOptions& options) {
    int positional = 0;
    
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            
            if (arg == "-h" || arg == "--help") {
                return false;
            } else if (arg == "-s" || arg == "--settings") {
                if (i + 1 >= argc) return false;
                options.settingsDir = argv[++i];
            } else if (arg == "-t" || arg == "--ticks") {
                if (i + 1 >= argc) return false;
                options.ticks = std::stoi(argv[++i]);
            } else if (arg == "-m" || arg == "--mode") {
                if (i + 1 >= argc || !parseMode(argv[++i], options.session.mode)) {
                    std::cerr << "Error: --mode expects single, two_player or dogfight\n";
                    return false;
                }
            } else if (arg == "--seed") {
                if (i + 1 >= argc) return false;
                options.session.seed = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--fps") {
                if (i + 1 >= argc) return false;
                options.fps = std::stof(argv[++i]);
            } else if (arg[0] != '-') {
                if (positional == 0) options.settingsDir = arg;
                else if (positional == 1) options.ticks = std::stoi(arg);
                else return false;
                positional++;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                return false;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: bad numeric argument (" << e.what() << ")\n";
        return false;
    }
    
    return options.ticks > 0;
}

// ============================================================================
// CONSOLE COLLABORATORS
// ============================================================================

class ConsoleMatchEvents : public MatchEvents {
public:
    void onVehicleCrash(PlayerId victim, const std::string& message, const std::string& cause) override {
        std::cout << "  [crash] P" << victim << ": " << message << " (" << cause << ")\n";
    }
    void onProjectileHit(PlayerId victim) override {
        std::cout << "  [hit] P" << victim << " hit by a cannon projectile\n";
    }
    void onDogfightWinner(PlayerId winner, int p1Kills, int p2Kills) override {
        std::cout << "  [dogfight] P" << winner << " wins " << p1Kills << " - " << p2Kills << "\n";
    }
    void onSecondaryDrop(const SecondaryDrop& drop) override {
        std::cout << "  [drop] " << drop.kind << " x" << drop.positions.size() << "\n";
    }
    void onBannerDrop(const BannerDrop& banner) override {
        std::cout << "  [banner] " << banner.message << "\n";
    }
};

class ConsoleAchievements : public AchievementSink {
public:
    void onBuildingDestroyed(const std::string& name, const std::string& country) override {
        std::cout << "  [destroyed] " << name << " (" << country << ")\n";
    }
    void onPlayerKill(PlayerId killer) override {
        std::cout << "  [kill] P" << killer << "\n";
    }
    void onSharkKilled(bool wasAlreadyDead) override {
        std::cout << "  [shark] " << (wasAlreadyDead ? "carcass blown up" : "shark blown up") << "\n";
    }
};

// ============================================================================
// AUTOPILOT
// ============================================================================

/**
 * Hold a shallow eastward tilt around a cruise altitude, bombing now and then
 */
PilotInput autopilot(const Shuttle& shuttle, uint64_t frame, int pilotIndex) {
    constexpr float CRUISE_Y = 320.0f;
    constexpr float CRUISE_TILT = 0.2f;
    
    PilotInput input;
    float tilt = pilotIndex == 0 ? CRUISE_TILT : -CRUISE_TILT;
    
    if (shuttle.getRotation() < tilt - 0.02f) input.flight.rotateRight = true;
    else if (shuttle.getRotation() > tilt + 0.02f) input.flight.rotateLeft = true;
    
    input.flight.thrust = shuttle.isParked() || shuttle.getPosition().y > CRUISE_Y ||
                          shuttle.getVelocity().y > 1.0f;
    input.dropBomb = frame % 90 == 45;
    return input;
}

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char* argv[]) {
    SimOptions options;
    
    if (!parseArgs(argc, argv, options)) {
        printUsage(argv[0]);
        return 1;
    }
    
    LogInfo("Settings directory: " + options.settingsDir);
    FileSettingsStore settings(options.settingsDir);
    AudioSettings audioSettings(settings);
    audioSettings.load();
    
    const WorldLayout& layout = WorldLayout::standard();
    CoastalTerrain terrain(600.0f, Shark::waterSurface(), layout.getWaterStart(), layout.getWaterEnd());
    
    NullAudioCue audio;
    NullEffectSink effects;
    ConsoleAchievements achievements;
    ConsoleMatchEvents events;
    
    GameSession session(layout, terrain, SessionServices{audio, effects, achievements, events, settings},
                        options.session);
    
    constexpr TimeMs FRAME_MS = 1000.0 / 60.0;
    TimeMs now = 0.0;
    session.start(now);
    
    std::cout << "Lander simulation\n";
    std::cout << "=================\n";
    std::cout << "Mode: " << gameModeName(options.session.mode) << ", seed " << options.session.seed
              << ", " << options.ticks << " frames\n";
    std::cout << "Music " << audioSettings.getMusicVolume() << ", speech " << audioSettings.getSpeechVolume() << "\n";
    std::cout << "Weather: " << weatherStateName(session.getWeather().getWeatherState()) << ", "
              << session.getPickups().getPickupCount() << " collectibles along the route\n\n";
    
    for (int frame = 0; frame < options.ticks; ++frame) {
        now += FRAME_MS;
        
        std::vector<PilotInput> inputs;
        for (const auto& player : session.getMatch().getPlayers()) {
            inputs.push_back(autopilot(player->shuttle, session.getFrameCount(),
                                       static_cast<int>(inputs.size())));
        }
        
        session.tick(now, options.fps, inputs);
        
        if (session.getMatch().isOver()) {
            std::cout << "\nMatch over after " << frame + 1 << " frames ("
                      << matchPhaseName(session.getMatch().getPhase()) << ")\n";
            break;
        }
    }
    
    SessionReport report = session.buildReport(now);
    
    std::cout << "\nReport\n";
    std::cout << "------\n";
    std::cout << "Result:        " << (report.victory ? "victory" : "no victory");
    if (!report.message.empty()) std::cout << " - " << report.message;
    std::cout << "\n";
    std::cout << "Time:          " << SessionScore::formatTime(now) << "\n";
    std::cout << "Time bonus:    " << report.timeBonus << "\n";
    std::cout << "Items:         " << report.itemsTotal << "\n";
    std::cout << "Medal bonus:   " << report.milestoneBonus << "\n";
    std::cout << "Total:         " << report.total << "\n";
    std::cout << "Destruction:   " << report.destructionScore << " (" << report.destroyedBuildings.size() << " targets)\n";
    std::cout << "Sold for fuel: " << report.tradeDeductions << "\n";
    std::cout << "Fuel left:     " << report.fuelRemaining << "\n";
    std::cout << "Collectibles:  " << session.getPickups().getPickupCount() << " left in the world\n";
    std::cout << "Lightning:     " << session.getWeather().getStrikeCount() << " strikes\n";
    std::cout << "Quality:       " << session.getGovernor().getPreset().name << "\n";
    
    LogInfo("Simulation finished after " + std::to_string(session.getFrameCount()) + " frames");
    return 0;
}
