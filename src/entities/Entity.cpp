/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Entity.hpp"
#include "core/Logger.hpp"
#include "utils/UniqueID.hpp"
#include "world/Level.hpp"
#include <format>

namespace SneakEngine {

Entity::Entity(EntityKind kind, EntityProperties properties, Point mapPosition, State state)
    : m_kind(kind),
      m_properties(std::move(properties)),
      m_zOrder(EntityTraits::defaultZOrder(kind)),
      m_state(std::move(state)) {
    m_id = m_properties.getString("id", EntityTraits::kindToString(kind));
    m_visible = m_properties.getBool("visible", true);
    m_facing = Facing::fromString(m_properties.getString("facing", "right")).value_or(Facing::RIGHT);
    if (auto hand = Facing::handednessFromString(m_properties.getString("handedness", "right"))) {
        m_handedness = *hand;
    }
    m_triggerIds = m_properties.getStringList("trigger");
    setMapPosition(mapPosition);
}

PropertyDefaults Entity::commonDefaults(EntityKind kind) {
    return {
        {"id", PropertyFactory([kind]() {
             return JsonValue(UniqueID::makeName(EntityTraits::kindToString(kind)));
         })},
        {"visible", JsonValue(true)},
        {"facing", JsonValue("right")},
    };
}

PropertyRules Entity::commonRules() {
    return {
        {"id", PropertyType::String, true},
        {"visible", PropertyType::Boolean, true},
        {"facing", PropertyType::String, true, {"up", "down", "left", "right"}},
        {"handedness", PropertyType::String, false, {"right", "left"}},
        {"trigger", PropertyType::StringArray, false},
    };
}

Point Entity::getWorldCenter() const {
    return m_worldPosition.translated(TILE_SIZE / 2, TILE_SIZE / 2);
}

int Entity::getWidth() const noexcept { return TILE_SIZE; }
int Entity::getHeight() const noexcept { return TILE_SIZE; }

void Entity::setMapPosition(Point mapPosition) {
    m_mapPosition = mapPosition;
    m_worldPosition = mapPosition.scaled(TILE_SIZE);
}

void Entity::setWorldPosition(Point worldPosition) {
    m_worldPosition = worldPosition;
    m_mapPosition = worldPosition.reduced(TILE_SIZE);
}

void Entity::setFacing(int degrees) {
    m_facing = Facing::normalizeFacingAngle(degrees);
}

bool Entity::blocksActorMovement() const {
    return std::visit([](const auto& state) { return state.blocksMovement(); }, m_state);
}

void Entity::step(Level& level) {
    std::visit([&](auto& state) { state.step(*this, level); }, m_state);
}

void Entity::trigger(Level& level, Entity* activator) {
    ENTITY_DEBUG(std::format("{} triggered by {}", toString(),
                             activator != nullptr ? activator->getID() : "nobody"));
    std::visit([&](auto& state) { state.trigger(*this, level, activator); }, m_state);
}

void Entity::touch(Level& level, Entity& toucher) {
    std::visit([&](auto& state) { state.touch(*this, level, toucher); }, m_state);
}

void Entity::triggerLinkedEntities(Level& level) {
    level.triggerEntitiesWithIDs(m_triggerIds, this);
}

std::string Entity::toString() const {
    return std::format("{}({}) at {}", EntityTraits::kindToString(m_kind), m_id,
                       m_mapPosition.toString());
}

std::string Entity::describe() const {
    std::string text = toString();
    for (const auto& [key, value] : m_properties.values()) {
        text += std::format("\n  {} = {}", key, value.toString());
    }
    return text;
}

} // namespace SneakEngine
