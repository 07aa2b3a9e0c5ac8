/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Headless runner: loads a level, replays a key script, prints the result.

#include "core/GameErrors.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include "world/Level.hpp"
#include "world/LevelLoader.hpp"
#include "world/TurnController.hpp"
#include <format>
#include <iostream>
#include <string>
#include <string_view>

using namespace SneakEngine;

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--settings FILE] [--level FILE] [--actions KEYS] [--quiet]\n"
              << "  KEYS: w/a/s/d move, space or q interact, e or . wait, i inspect tile\n";
}

void printState(const Level& level) {
    std::cout << std::format("Level '{}' after {} turn(s)\n", level.getName(), level.turnNumber());
    for (const auto& entity : level.getEntities()) {
        std::string extra;
        if (const auto* door = entity->stateAs<DoorState>()) {
            extra = door->isOpen() ? " open" : " closed";
        } else if (const auto* button = entity->stateAs<ButtonState>()) {
            extra = button->isPressed() ? " pressed" : " released";
        } else if (const auto* guard = entity->stateAs<GuardState>()) {
            extra = std::format(" facing {} patrol index {}{}", Facing::toString(entity->getFacing()),
                                guard->getPatrolIndex(), guard->isHalted() ? " (halted)" : "");
        }
        std::cout << "  " << entity->toString() << extra << '\n';
    }
    if (const auto& outcome = level.getOutcome()) {
        std::cout << std::format("Outcome: {} at goal '{}' on turn {}\n",
                                 outcome->won ? "won" : "lost", outcome->goalId, outcome->turn);
    } else {
        std::cout << "Outcome: in progress\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::string settingsPath = "res/settings.json";
    std::string levelPath;
    std::string actions;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto nextValue = [&](std::string& out) {
            if (i + 1 >= argc) {
                return false;
            }
            out = argv[++i];
            return true;
        };

        bool ok = true;
        if (arg == "--settings") {
            ok = nextValue(settingsPath);
        } else if (arg == "--level") {
            ok = nextValue(levelPath);
        } else if (arg == "--actions") {
            ok = nextValue(actions);
        } else if (arg == "--quiet") {
            SNEAK_ENABLE_QUIET_MODE();
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            ok = false;
        }

        if (!ok) {
            printUsage(argv[0]);
            return 1;
        }
    }

    auto& settings = SettingsManager::Instance();
    if (!settings.loadFromFile(settingsPath)) {
        RUNNER_INFO("Continuing with built-in settings");
    }
    settings.applyDefaults();

    // Tile size is fixed at compile time; the setting is informational
    if (int tileSize = settings.get<int>("game", "tile_size", TILE_SIZE); tileSize != TILE_SIZE) {
        RUNNER_INFO(std::format("Ignoring game.tile_size {}; tiles are {} units", tileSize, TILE_SIZE));
    }

    if (levelPath.empty()) {
        levelPath = settings.get<std::string>("game", "start_level", "res/levels/level1.json");
    }

    try {
        Level level(LevelLoader::loadFromFile(levelPath));
        TurnController controller(level);

        for (char key : actions) {
            if (key == 'i' || key == 'I') {
                std::cout << level.describeEntitiesAt(level.player().getMapPosition()) << '\n';
                continue;
            }
            auto action = TurnController::actionForKey(key);
            if (!action) {
                RUNNER_ERROR(std::format("Unknown action key '{}'", key));
                return 1;
            }
            controller.perform(*action);
            if (level.isComplete()) {
                break;
            }
        }

        printState(level);
    } catch (const SneakError& e) {
        RUNNER_CRITICAL(e.what());
        std::cerr << e.what() << std::endl;
        return 1;
    }

    return 0;
}
