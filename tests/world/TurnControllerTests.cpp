/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE TurnControllerTests
#include <boost/test/unit_test.hpp>

#include "TestLevels.hpp"
#include "core/Logger.hpp"
#include "world/Level.hpp"
#include "world/TurnController.hpp"

using namespace SneakEngine;
using namespace SneakEngine::TestLevels;

namespace {

const std::vector<std::string> kRoom = {
    "#####",
    "#S..#",
    "#...#",
    "#####",
};

struct QuietFixture {
    QuietFixture() { SNEAK_ENABLE_QUIET_MODE(); }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(TurnControllerTests, QuietFixture)

BOOST_AUTO_TEST_CASE(MovesAndFacesTheStepDirection) {
    Level level(fromRows(kRoom));
    TurnController turns(level);
    Entity& player = level.player();

    BOOST_CHECK(turns.move(Direction::Down));
    BOOST_CHECK(player.getMapPosition() == Point(1, 2));
    BOOST_CHECK_EQUAL(player.getFacing(), Facing::DOWN);

    BOOST_CHECK(turns.move(Direction::Right));
    BOOST_CHECK(player.getMapPosition() == Point(2, 2));
    BOOST_CHECK_EQUAL(player.getFacing(), Facing::RIGHT);

    BOOST_CHECK_EQUAL(turns.getTurnsTaken(), 2u);
    BOOST_CHECK_EQUAL(level.turnNumber(), 2u);
}

BOOST_AUTO_TEST_CASE(BlockedMovesCostNothing) {
    Level level(fromRows(kRoom, {
        entity("Door", 2, 1, {{"id", JsonValue("d")}, {"open", JsonValue(false)}}),
    }));
    TurnController turns(level);
    Entity& player = level.player();

    BOOST_CHECK(!turns.move(Direction::Up));
    BOOST_CHECK(!turns.move(Direction::Left));
    BOOST_CHECK(!turns.move(Direction::Right));

    BOOST_CHECK(player.getMapPosition() == Point(1, 1));
    BOOST_CHECK_EQUAL(player.getFacing(), Facing::RIGHT);
    BOOST_CHECK_EQUAL(turns.getTurnsTaken(), 0u);
    BOOST_CHECK_EQUAL(level.turnNumber(), 0u);
}

BOOST_AUTO_TEST_CASE(InteractTriggersEverythingUnderfoot) {
    Level level(fromRows(kRoom, {
        entity("Button", 2, 1, {{"id", JsonValue("b")}, {"trigger", ids({"d"})}}),
        entity("Door", 3, 2, {{"id", JsonValue("d")}, {"open", JsonValue(false)}}),
    }));
    TurnController turns(level);
    const auto* door = level.entityWithID("d")->stateAs<DoorState>();

    // Walking onto a button does not press it
    BOOST_CHECK(turns.move(Direction::Right));
    BOOST_CHECK(!level.entityWithID("b")->stateAs<ButtonState>()->isPressed());
    BOOST_CHECK(!door->isOpen());

    BOOST_CHECK(turns.interact());
    BOOST_CHECK(level.entityWithID("b")->stateAs<ButtonState>()->isPressed());
    BOOST_CHECK(door->isOpen());
    BOOST_CHECK_EQUAL(turns.getTurnsTaken(), 2u);

    // Interacting on an empty tile still spends the turn
    BOOST_CHECK(turns.move(Direction::Down));
    BOOST_CHECK(turns.interact());
    BOOST_CHECK_EQUAL(turns.getTurnsTaken(), 4u);
}

BOOST_AUTO_TEST_CASE(WaitAdvancesTimers) {
    Level level(fromRows(kRoom, {
        entity("Door", 3, 2, {{"id", JsonValue("d")}, {"openTime", JsonValue(1)}}),
    }));
    TurnController turns(level);

    BOOST_CHECK(turns.wait());
    BOOST_CHECK(!level.entityWithID("d")->stateAs<DoorState>()->isOpen());
    BOOST_CHECK_EQUAL(turns.getTurnsTaken(), 1u);
}

BOOST_AUTO_TEST_CASE(SteppingOntoGoalEndsTheLevel) {
    Level level(fromRows(kRoom, {
        entity("LevelGoal", 3, 1, {{"id", JsonValue("exit")}}),
    }));
    TurnController turns(level);

    BOOST_CHECK(turns.perform(PlayerAction::move(Direction::Right)));
    BOOST_CHECK(!level.isComplete());
    BOOST_CHECK(turns.perform(PlayerAction::move(Direction::Right)));

    BOOST_REQUIRE(level.isComplete());
    BOOST_CHECK_EQUAL(level.getOutcome()->goalId, "exit");
    BOOST_CHECK(level.getOutcome()->won);
    BOOST_CHECK_EQUAL(level.getOutcome()->turn, 2u);

    // Nothing happens once the level is over
    BOOST_CHECK(!turns.perform(PlayerAction::move(Direction::Left)));
    BOOST_CHECK(!turns.perform(PlayerAction::wait()));
    BOOST_CHECK(!turns.perform(PlayerAction::interact()));
    BOOST_CHECK(level.player().getMapPosition() == Point(3, 1));
    BOOST_CHECK_EQUAL(turns.getTurnsTaken(), 2u);
}

BOOST_AUTO_TEST_CASE(RefusedMoveLeavesPlayerUntouched) {
    Level level(fromRows(kRoom, {
        entity("LevelGoal", 2, 1, {{"id", JsonValue("exit")}}),
    }));
    TurnController turns(level);
    Entity& player = level.player();

    // A handler acting on the level while it is being notified gets nowhere
    bool handlerMoved = true;
    bool steppingInHandler = true;
    level.addCompletionHandler([&](const LevelCompleteEvent&) {
        steppingInHandler = level.isStepping();
        handlerMoved = turns.move(Direction::Down);
    });

    BOOST_CHECK(!level.isStepping());
    BOOST_CHECK(turns.move(Direction::Right));
    BOOST_REQUIRE(level.isComplete());
    BOOST_CHECK(!steppingInHandler);
    BOOST_CHECK(!handlerMoved);
    BOOST_CHECK(!level.isStepping());

    BOOST_CHECK(!turns.move(Direction::Down));
    BOOST_CHECK(player.getMapPosition() == Point(2, 1));
    BOOST_CHECK_EQUAL(player.getFacing(), Facing::RIGHT);
    BOOST_CHECK_EQUAL(turns.getTurnsTaken(), 1u);
    BOOST_CHECK_EQUAL(level.turnNumber(), 1u);
}

BOOST_AUTO_TEST_CASE(KeyBindings) {
    auto check = [](char key, ActionType type, Direction direction) {
        auto action = TurnController::actionForKey(key);
        BOOST_REQUIRE_MESSAGE(action.has_value(), "no action for key " << key);
        BOOST_CHECK_EQUAL(action->type, type);
        if (type == ActionType::Move) {
            BOOST_CHECK_EQUAL(action->direction, direction);
        }
    };

    check('w', ActionType::Move, Direction::Up);
    check('S', ActionType::Move, Direction::Down);
    check('a', ActionType::Move, Direction::Left);
    check('d', ActionType::Move, Direction::Right);
    check(' ', ActionType::Interact, Direction::Right);
    check('q', ActionType::Interact, Direction::Right);
    check('e', ActionType::Wait, Direction::Right);
    check('.', ActionType::Wait, Direction::Right);

    BOOST_CHECK(!TurnController::actionForKey('x').has_value());
    BOOST_CHECK(!TurnController::actionForKey('i').has_value());
}

BOOST_AUTO_TEST_SUITE_END()
