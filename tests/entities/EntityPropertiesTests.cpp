/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE EntityPropertiesTests
#include <boost/test/unit_test.hpp>

#include "core/GameErrors.hpp"
#include "core/Logger.hpp"
#include "entities/EntityRegistry.hpp"
#include "managers/SettingsManager.hpp"
#include <stdexcept>
#include <string>

using namespace SneakEngine;

namespace {

struct PropertiesFixture {
    PropertiesFixture() {
        SNEAK_ENABLE_QUIET_MODE();
        SettingsManager::Instance().clearAll();
    }
    ~PropertiesFixture() { SettingsManager::Instance().clearAll(); }
};

// True when the thrown message mentions `fragment`
auto messageContains(const std::string& fragment) {
    return [fragment](const EntityConfigError& e) {
        return std::string(e.what()).find(fragment) != std::string::npos;
    };
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(PropertyBuildTests, PropertiesFixture)

BOOST_AUTO_TEST_CASE(OverridesReplaceDefaults) {
    PropertyDefaults defaults = {
        {"open", JsonValue(true)},
        {"openTime", JsonValue(-1)},
    };
    JsonObject overrides = {{"open", JsonValue(false)}, {"extra", JsonValue("kept")}};

    EntityProperties props = EntityProperties::build(defaults, overrides);
    BOOST_CHECK_EQUAL(props.size(), 3u);
    BOOST_CHECK_EQUAL(props.getBool("open", true), false);
    BOOST_CHECK_EQUAL(props.getInt("openTime"), -1);
    BOOST_CHECK_EQUAL(props.getString("extra"), "kept");
}

BOOST_AUTO_TEST_CASE(FactoriesRunOnlyWhenUsed) {
    int calls = 0;
    PropertyDefaults defaults = {
        {"id", PropertyFactory([&calls]() { ++calls; return JsonValue("generated"); })},
    };

    EntityProperties overridden = EntityProperties::build(defaults, {{"id", JsonValue("mine")}});
    BOOST_CHECK_EQUAL(calls, 0);
    BOOST_CHECK_EQUAL(overridden.getString("id"), "mine");

    EntityProperties generated = EntityProperties::build(defaults, {});
    BOOST_CHECK_EQUAL(calls, 1);
    BOOST_CHECK_EQUAL(generated.getString("id"), "generated");
}

BOOST_AUTO_TEST_CASE(LaterDefaultsShadowEarlierOnes) {
    int calls = 0;
    PropertyDefaults defaults = {
        {"id", PropertyFactory([&calls]() { ++calls; return JsonValue("common"); })},
        {"id", JsonValue("specific")},
    };

    EntityProperties props = EntityProperties::build(defaults, {});
    BOOST_CHECK_EQUAL(props.getString("id"), "specific");
    BOOST_CHECK_EQUAL(calls, 0);
}

BOOST_AUTO_TEST_CASE(SingleStringBecomesArray) {
    EntityProperties props = EntityProperties::build({}, {{"trigger", JsonValue("door1")},
                                                          {"count", JsonValue(3)}});
    props.normalizeToArray("trigger");
    props.normalizeToArray("count");
    props.normalizeToArray("absent");

    const JsonValue* trigger = props.find("trigger");
    BOOST_REQUIRE(trigger != nullptr);
    BOOST_REQUIRE(trigger->isArray());
    BOOST_CHECK_EQUAL(trigger->size(), 1u);
    BOOST_CHECK(props.find("count")->isNumber());
    BOOST_CHECK(!props.has("absent"));

    auto list = props.getStringList("trigger");
    BOOST_REQUIRE_EQUAL(list.size(), 1u);
    BOOST_CHECK_EQUAL(list[0], "door1");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(PropertyValidationTests, PropertiesFixture)

BOOST_AUTO_TEST_CASE(RequiredPropertiesMustBePresent) {
    PropertyRules rules = {{"spawn", PropertyType::String, true}};

    EntityProperties empty;
    BOOST_CHECK_EXCEPTION(empty.validate("guard1", rules), EntityConfigError,
                          messageContains("missing required property 'spawn'"));

    EntityProperties nulled = EntityProperties::build({}, {{"spawn", JsonValue()}});
    BOOST_CHECK_THROW(nulled.validate("guard1", rules), EntityConfigError);

    EntityProperties present = EntityProperties::build({}, {{"spawn", JsonValue("w1")}});
    BOOST_CHECK_NO_THROW(present.validate("guard1", rules));
}

BOOST_AUTO_TEST_CASE(OptionalPropertiesMayBeMissing) {
    PropertyRules rules = {{"patrol", PropertyType::StringArray, false}};
    EntityProperties empty;
    BOOST_CHECK_NO_THROW(empty.validate("guard1", rules));
}

BOOST_AUTO_TEST_CASE(TypeMismatchesAreReported) {
    PropertyRules rules = {
        {"open", PropertyType::Boolean, true},
        {"openTime", PropertyType::Number, false},
    };

    EntityProperties badBool = EntityProperties::build({}, {{"open", JsonValue("yes")}});
    BOOST_CHECK_EXCEPTION(badBool.validate("door1", rules), EntityConfigError,
                          messageContains("property 'open' must be a boolean, got string"));

    EntityProperties badNumber = EntityProperties::build(
        {}, {{"open", JsonValue(true)}, {"openTime", JsonValue(false)}});
    BOOST_CHECK_THROW(badNumber.validate("door1", rules), EntityConfigError);

    try {
        badBool.validate("door1", rules);
        BOOST_FAIL("expected EntityConfigError");
    } catch (const EntityConfigError& e) {
        BOOST_CHECK_EQUAL(e.entityId(), "door1");
    }
}

BOOST_AUTO_TEST_CASE(StringArraysMustHoldOnlyStrings) {
    PropertyRules rules = {{"trigger", PropertyType::StringArray, false}};

    JsonArray mixed;
    mixed.emplace_back("door1");
    mixed.emplace_back(4);
    EntityProperties props = EntityProperties::build({}, {{"trigger", JsonValue(mixed)}});
    BOOST_CHECK_THROW(props.validate("button1", rules), EntityConfigError);
}

BOOST_AUTO_TEST_CASE(EnumeratedStringsAreChecked) {
    PropertyRules rules = {{"facing", PropertyType::String, true, {"up", "down", "left", "right"}}};

    EntityProperties good = EntityProperties::build({}, {{"facing", JsonValue("left")}});
    BOOST_CHECK_NO_THROW(good.validate("guard1", rules));

    EntityProperties bad = EntityProperties::build({}, {{"facing", JsonValue("north")}});
    BOOST_CHECK_EXCEPTION(bad.validate("guard1", rules), EntityConfigError,
                          messageContains("has value 'north', expected one of: up, down, left, right"));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(EntityRegistryTests, PropertiesFixture)

BOOST_AUTO_TEST_CASE(BuiltInTypesAreRegistered) {
    const auto& registry = EntityRegistry::builtIn();
    for (const char* tag : {"Player", "PlayerStart", "PlayerStartEntity", "Waypoint", "Door",
                            "Button", "LevelGoal", "Guard", "GuardBase"}) {
        BOOST_CHECK_MESSAGE(registry.hasType(tag), "missing type " << tag);
    }
    BOOST_CHECK(!registry.hasType("Dragon"));
    BOOST_CHECK(registry.findType("Dragon") == nullptr);
    BOOST_CHECK_EQUAL(registry.getTypeNames().size(), 9u);
}

BOOST_AUTO_TEST_CASE(CreateAppliesDefaults) {
    auto door = EntityRegistry::builtIn().create("Door", Point(3, 4), {{"id", JsonValue("d1")}});
    BOOST_REQUIRE(door);
    BOOST_CHECK(door->is(EntityKind::Door));
    BOOST_CHECK_EQUAL(door->getID(), "d1");
    BOOST_CHECK(door->getMapPosition() == Point(3, 4));
    BOOST_CHECK(door->getWorldPosition() == Point(96, 128));
    BOOST_CHECK(door->getWorldCenter() == Point(112, 144));
    BOOST_CHECK(door->isVisible());
    BOOST_CHECK_EQUAL(door->getFacing(), Facing::RIGHT);
    BOOST_CHECK(door->getHandedness() == Handedness::Right);

    const auto* state = door->stateAs<DoorState>();
    BOOST_REQUIRE(state != nullptr);
    BOOST_CHECK(state->isOpen());
    BOOST_CHECK(!state->isHorizontal());
    BOOST_CHECK_EQUAL(state->getOpenTime(), -1);
    BOOST_CHECK_EQUAL(state->getCloseTime(), -1);
    BOOST_CHECK(door->stateAs<ButtonState>() == nullptr);
}

BOOST_AUTO_TEST_CASE(GeneratedIdsArePrefixedAndUnique) {
    const auto& registry = EntityRegistry::builtIn();
    auto first = registry.create("Door", Point(0, 0), {});
    auto second = registry.create("Door", Point(1, 0), {});

    BOOST_CHECK(first->getID().starts_with("Door_"));
    BOOST_CHECK(second->getID().starts_with("Door_"));
    BOOST_CHECK_NE(first->getID(), second->getID());

    auto player = registry.create("Player", Point(0, 0), {});
    BOOST_CHECK_EQUAL(player->getID(), "player");
}

BOOST_AUTO_TEST_CASE(CommonPropertiesAreDecoded) {
    auto button = EntityRegistry::builtIn().create("Button", Point(2, 2), {
        {"id", JsonValue("b1")},
        {"facing", JsonValue("up")},
        {"handedness", JsonValue("left")},
        {"visible", JsonValue(false)},
        {"trigger", JsonValue("d1")},
        {"orientation", JsonValue("vertical")},
    });

    BOOST_CHECK_EQUAL(button->getFacing(), Facing::UP);
    BOOST_CHECK(button->getHandedness() == Handedness::Left);
    BOOST_CHECK(!button->isVisible());
    BOOST_REQUIRE_EQUAL(button->getTriggerIDs().size(), 1u);
    BOOST_CHECK_EQUAL(button->getTriggerIDs()[0], "d1");
    BOOST_CHECK_EQUAL(button->getZOrder(), 100);
    // Unknown properties are carried along untouched
    BOOST_CHECK_EQUAL(button->getProperties().getString("orientation"), "vertical");
    BOOST_CHECK_EQUAL(button->toString(), "Button(b1) at [2, 2]");
    BOOST_CHECK(button->describe().find("\n  orientation = \"vertical\"") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(InvalidPropertiesAreRejected) {
    const auto& registry = EntityRegistry::builtIn();

    BOOST_CHECK_THROW(registry.create("Door", Point(0, 0), {{"open", JsonValue(1)}}),
                      EntityConfigError);
    BOOST_CHECK_THROW(registry.create("Door", Point(0, 0), {{"facing", JsonValue("sideways")}}),
                      EntityConfigError);
    BOOST_CHECK_THROW(registry.create("Guard", Point(0, 0), {}), EntityConfigError);
    BOOST_CHECK_THROW(registry.create("Guard", Point(0, 0),
                                      {{"spawn", JsonValue("w1")}, {"fov", JsonValue(0)}}),
                      EntityConfigError);
    BOOST_CHECK_THROW(registry.create("Dragon", Point(0, 0), {}), LevelLoadError);
}

BOOST_AUTO_TEST_CASE(GuardFieldOfViewDefaultsFromSettings) {
    const auto& registry = EntityRegistry::builtIn();

    auto standard = registry.create("Guard", Point(0, 0), {{"spawn", JsonValue("w1")}});
    BOOST_CHECK_EQUAL(standard->stateAs<GuardState>()->getFieldOfView(), GuardState::DEFAULT_FOV);

    SettingsManager::Instance().set("vision", "default_fov", 120);
    auto wide = registry.create("Guard", Point(0, 0), {{"spawn", JsonValue("w1")}});
    BOOST_CHECK_EQUAL(wide->stateAs<GuardState>()->getFieldOfView(), 120);

    auto authored = registry.create("Guard", Point(0, 0),
                                    {{"spawn", JsonValue("w1")}, {"fov", JsonValue(45)}});
    BOOST_CHECK_EQUAL(authored->stateAs<GuardState>()->getFieldOfView(), 45);
}

BOOST_AUTO_TEST_CASE(DuplicateRegistrationThrows) {
    EntityRegistry registry;
    EntityTypeInfo info;
    info.kind = EntityKind::Waypoint;
    info.makeState = [](const EntityProperties&, const std::string&) -> Entity::State {
        return MarkerState();
    };

    BOOST_CHECK_NO_THROW(registry.registerType("Beacon", info));
    BOOST_CHECK_THROW(registry.registerType("Beacon", info), std::invalid_argument);
    BOOST_CHECK_THROW(registry.registerType("Broken", EntityTypeInfo{}), std::invalid_argument);

    auto beacon = registry.create("Beacon", Point(1, 1), {});
    BOOST_CHECK(beacon->is(EntityKind::Waypoint));
    BOOST_CHECK(!beacon->blocksActorMovement());
    BOOST_CHECK(beacon->getID().starts_with("Waypoint_"));
}

BOOST_AUTO_TEST_SUITE_END()
