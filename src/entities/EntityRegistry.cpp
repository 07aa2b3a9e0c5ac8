/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/EntityRegistry.hpp"
#include "core/GameErrors.hpp"
#include "core/Logger.hpp"
#include <format>
#include <stdexcept>
#include <type_traits>

namespace SneakEngine {

namespace {
template <typename StateT>
EntityTypeInfo describeKind(EntityKind kind) {
    EntityTypeInfo info;
    info.kind = kind;
    info.defaults = StateT::defaultProperties();
    info.rules = StateT::propertyRules();
    info.makeState = [](const EntityProperties& props, const std::string& entityId) -> Entity::State {
        if constexpr (std::is_constructible_v<StateT, const EntityProperties&, const std::string&>) {
            return StateT(props, entityId);
        } else if constexpr (std::is_constructible_v<StateT, const EntityProperties&>) {
            (void)entityId;
            return StateT(props);
        } else {
            (void)props;
            (void)entityId;
            return StateT();
        }
    };
    return info;
}

EntityRegistry makeBuiltInRegistry() {
    EntityRegistry registry;
    registry.registerType("Player", describeKind<PlayerState>(EntityKind::Player));
    registry.registerType("PlayerStart", describeKind<MarkerState>(EntityKind::PlayerStart));
    registry.registerType("PlayerStartEntity", describeKind<MarkerState>(EntityKind::PlayerStart));
    registry.registerType("Waypoint", describeKind<MarkerState>(EntityKind::Waypoint));
    registry.registerType("Door", describeKind<DoorState>(EntityKind::Door));
    registry.registerType("Button", describeKind<ButtonState>(EntityKind::Button));
    registry.registerType("LevelGoal", describeKind<GoalState>(EntityKind::LevelGoal));
    registry.registerType("Guard", describeKind<GuardState>(EntityKind::Guard));
    registry.registerType("GuardBase", describeKind<GuardState>(EntityKind::Guard));
    return registry;
}
} // namespace

const EntityRegistry& EntityRegistry::builtIn() {
    static const EntityRegistry s_builtIn = makeBuiltInRegistry();
    return s_builtIn;
}

void EntityRegistry::registerType(const std::string& tag, EntityTypeInfo info) {
    if (m_types.count(tag) != 0) {
        ENTITY_ERROR("Entity type already registered: " + tag);
        throw std::invalid_argument("Sneak Engine - Entity type already registered: " + tag);
    }
    if (!info.makeState) {
        throw std::invalid_argument("Sneak Engine - Entity type has no state constructor: " + tag);
    }
    m_types.emplace(tag, std::move(info));
}

bool EntityRegistry::hasType(const std::string& tag) const {
    return m_types.count(tag) != 0;
}

const EntityTypeInfo* EntityRegistry::findType(const std::string& tag) const {
    auto it = m_types.find(tag);
    return it == m_types.end() ? nullptr : &it->second;
}

std::vector<std::string> EntityRegistry::getTypeNames() const {
    std::vector<std::string> names;
    names.reserve(m_types.size());
    for (const auto& [tag, info] : m_types) {
        names.push_back(tag);
    }
    return names;
}

std::unique_ptr<Entity> EntityRegistry::create(const std::string& tag, Point mapPosition,
                                               const JsonObject& properties) const {
    const EntityTypeInfo* info = findType(tag);
    if (info == nullptr) {
        std::string msg = std::format("unknown entity type '{}' at {}", tag, mapPosition.toString());
        ENTITY_ERROR(msg);
        throw LevelLoadError(msg);
    }

    PropertyDefaults defaults = Entity::commonDefaults(info->kind);
    defaults.insert(defaults.end(), info->defaults.begin(), info->defaults.end());

    EntityProperties props = EntityProperties::build(defaults, properties);
    props.normalizeToArray("trigger");
    props.normalizeToArray("patrol");

    // Best available name for error messages before the id is known to be valid
    const JsonValue* idValue = props.find("id");
    std::string label = (idValue != nullptr && idValue->isString())
                            ? idValue->asString()
                            : std::format("{} at {}", tag, mapPosition.toString());

    PropertyRules rules = Entity::commonRules();
    rules.insert(rules.end(), info->rules.begin(), info->rules.end());
    props.validate(label, rules);

    Entity::State state = info->makeState(props, label);
    return std::make_unique<Entity>(info->kind, std::move(props), mapPosition, std::move(state));
}

} // namespace SneakEngine
