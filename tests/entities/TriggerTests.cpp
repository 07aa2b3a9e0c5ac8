/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE TriggerTests
#include <boost/test/unit_test.hpp>

#include "TestLevels.hpp"
#include "core/Logger.hpp"
#include "world/Level.hpp"
#include <vector>

using namespace SneakEngine;
using namespace SneakEngine::TestLevels;

namespace {

// 4x4 room, player start at (1,2)
const std::vector<std::string> kRoom = {
    "####",
    "#..#",
    "#S.#",
    "####",
};

struct QuietFixture {
    QuietFixture() { SNEAK_ENABLE_QUIET_MODE(); }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(ButtonDoorTests, QuietFixture)

BOOST_AUTO_TEST_CASE(ButtonOpensLinkedDoor) {
    Level level(fromRows(kRoom, {
        entity("Button", 1, 1, {{"id", JsonValue("b1")}, {"trigger", JsonValue("d1")}}),
        entity("Door", 2, 1, {{"id", JsonValue("d1")}, {"open", JsonValue(false)}}),
    }));

    Entity* button = level.entityWithID("b1");
    Entity* door = level.entityWithID("d1");
    BOOST_REQUIRE(button && door);
    BOOST_CHECK(level.isBlockedAt(Point(2, 1)));

    button->trigger(level, &level.player());
    BOOST_CHECK(button->stateAs<ButtonState>()->isPressed());
    BOOST_CHECK(door->stateAs<DoorState>()->isOpen());
    BOOST_CHECK(!level.isBlockedAt(Point(2, 1)));

    // The player cannot reset a pressed button
    button->trigger(level, &level.player());
    BOOST_CHECK(button->stateAs<ButtonState>()->isPressed());
    BOOST_CHECK(door->stateAs<DoorState>()->isOpen());

    button->trigger(level, nullptr);
    BOOST_CHECK(!button->stateAs<ButtonState>()->isPressed());
    // Releasing does not fire the door again
    BOOST_CHECK(door->stateAs<DoorState>()->isOpen());
}

BOOST_AUTO_TEST_CASE(NonPlayerActivatorResetsButton) {
    Level level(fromRows(kRoom, {
        entity("Button", 1, 1, {{"id", JsonValue("b1")}, {"pressed", JsonValue(true)}}),
        entity("Door", 2, 1, {{"id", JsonValue("d1")}}),
    }));

    Entity* button = level.entityWithID("b1");
    BOOST_REQUIRE(button);
    BOOST_CHECK(button->stateAs<ButtonState>()->isPressed());

    button->trigger(level, level.entityWithID("d1"));
    BOOST_CHECK(!button->stateAs<ButtonState>()->isPressed());
    BOOST_CHECK_EQUAL(button->stateAs<ButtonState>()->getTurnsUntilToggle(), -1);
}

BOOST_AUTO_TEST_CASE(DoorToggleAndOccupancy) {
    Level level(fromRows(kRoom, {
        entity("Door", 2, 1, {{"id", JsonValue("d1")}}),
    }));

    Entity* door = level.entityWithID("d1");
    BOOST_REQUIRE(door);
    auto* state = door->stateAs<DoorState>();
    BOOST_CHECK(state->isOpen());
    BOOST_CHECK(!door->blocksActorMovement());

    door->trigger(level, nullptr);
    BOOST_CHECK(!state->isOpen());
    BOOST_CHECK(door->blocksActorMovement());

    door->trigger(level, nullptr);
    BOOST_CHECK(state->isOpen());

    // Someone standing in the doorway keeps it open
    level.player().setMapPosition(Point(2, 1));
    BOOST_CHECK(!state->toggle(*door, level));
    BOOST_CHECK(state->isOpen());

    level.player().setMapPosition(Point(1, 2));
    BOOST_CHECK(state->toggle(*door, level));
    BOOST_CHECK(!state->isOpen());
}

BOOST_AUTO_TEST_CASE(DoorTogglesOnTimer) {
    Level level(fromRows(kRoom, {
        entity("Door", 2, 1, {{"id", JsonValue("d1")}, {"openTime", JsonValue(2)},
                              {"closeTime", JsonValue(1)}}),
    }));

    auto* state = level.entityWithID("d1")->stateAs<DoorState>();
    BOOST_CHECK_EQUAL(state->getTurnsUntilToggle(), 2);

    level.stepAllEntities();
    BOOST_CHECK(state->isOpen());
    BOOST_CHECK_EQUAL(state->getTurnsUntilToggle(), 1);

    level.stepAllEntities();
    BOOST_CHECK(!state->isOpen());
    BOOST_CHECK_EQUAL(state->getTurnsUntilToggle(), 1);

    level.stepAllEntities();
    BOOST_CHECK(state->isOpen());
    BOOST_CHECK_EQUAL(state->getTurnsUntilToggle(), 2);
    BOOST_CHECK_EQUAL(level.turnNumber(), 3u);
}

BOOST_AUTO_TEST_CASE(DoorWithoutTimerNeverToggles) {
    Level level(fromRows(kRoom, {
        entity("Door", 2, 1, {{"id", JsonValue("d1")}, {"open", JsonValue(false)}}),
    }));

    for (int i = 0; i < 5; ++i) {
        level.stepAllEntities();
    }
    BOOST_CHECK(!level.entityWithID("d1")->stateAs<DoorState>()->isOpen());
}

BOOST_AUTO_TEST_CASE(ButtonReleasesAfterCycleTime) {
    Level level(fromRows(kRoom, {
        entity("Button", 1, 1, {{"id", JsonValue("b1")}, {"cycleTime", JsonValue(2)},
                                {"trigger", ids({"d1"})}}),
        entity("Door", 2, 1, {{"id", JsonValue("d1")}, {"open", JsonValue(false)}}),
    }));

    Entity* button = level.entityWithID("b1");
    auto* state = button->stateAs<ButtonState>();
    BOOST_CHECK_EQUAL(state->getTurnsUntilToggle(), -1);

    button->trigger(level, &level.player());
    BOOST_CHECK(state->isPressed());
    BOOST_CHECK_EQUAL(state->getTurnsUntilToggle(), 2);

    level.stepAllEntities();
    BOOST_CHECK(state->isPressed());

    level.stepAllEntities();
    BOOST_CHECK(!state->isPressed());
    BOOST_CHECK_EQUAL(state->getTurnsUntilToggle(), -1);

    // A fresh press fires the door again
    button->trigger(level, &level.player());
    BOOST_CHECK(!level.entityWithID("d1")->stateAs<DoorState>()->isOpen());
}

BOOST_AUTO_TEST_CASE(MissingTriggerTargetsAreSkipped) {
    Level level(fromRows(kRoom, {
        entity("Button", 1, 1, {{"id", JsonValue("b1")}, {"trigger", ids({"ghost", "d1"})}}),
        entity("Door", 2, 1, {{"id", JsonValue("d1")}, {"open", JsonValue(false)}}),
    }));

    level.entityWithID("b1")->trigger(level, &level.player());
    BOOST_CHECK(level.entityWithID("d1")->stateAs<DoorState>()->isOpen());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(LevelGoalTests, QuietFixture)

BOOST_AUTO_TEST_CASE(PlayerTriggerCompletesLevel) {
    Level level(fromRows(kRoom, {
        entity("LevelGoal", 2, 2, {{"id", JsonValue("exit")}}),
    }));

    std::vector<LevelCompleteEvent> events;
    level.addCompletionHandler([&](const LevelCompleteEvent& e) { events.push_back(e); });

    Entity* goal = level.entityWithID("exit");
    goal->trigger(level, nullptr);
    BOOST_CHECK(!level.isComplete());

    level.stepAllEntities();
    goal->trigger(level, &level.player());

    BOOST_REQUIRE(level.isComplete());
    BOOST_REQUIRE_EQUAL(events.size(), 1u);
    BOOST_CHECK_EQUAL(events[0].goalId, "exit");
    BOOST_CHECK(events[0].won);
    BOOST_CHECK(events[0].position == Point(2, 2));
    BOOST_CHECK_EQUAL(events[0].turn, 1u);
}

BOOST_AUTO_TEST_CASE(LosingGoalAndFirstOutcomeWins) {
    Level level(fromRows(kRoom, {
        entity("LevelGoal", 2, 2, {{"id", JsonValue("trap")}, {"winLevel", JsonValue(false)}}),
        entity("LevelGoal", 2, 1, {{"id", JsonValue("exit")}}),
    }));

    int notified = 0;
    level.addCompletionHandler([&](const LevelCompleteEvent&) { ++notified; });

    level.entityWithID("trap")->touch(level, level.player());
    level.entityWithID("exit")->touch(level, level.player());

    BOOST_REQUIRE(level.getOutcome().has_value());
    BOOST_CHECK_EQUAL(level.getOutcome()->goalId, "trap");
    BOOST_CHECK(!level.getOutcome()->won);
    BOOST_CHECK_EQUAL(notified, 1);
}

BOOST_AUTO_TEST_CASE(ButtonCanFireGoal) {
    Level level(fromRows(kRoom, {
        entity("Button", 1, 1, {{"id", JsonValue("b1")}, {"trigger", ids({"exit"})}}),
        entity("LevelGoal", 2, 1, {{"id", JsonValue("exit")}}),
    }));

    // The button is the activator, so the goal ignores it
    level.entityWithID("b1")->trigger(level, &level.player());
    BOOST_CHECK(!level.isComplete());
}

BOOST_AUTO_TEST_SUITE_END()
