/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Door.hpp"
#include "core/Logger.hpp"
#include "entities/Entity.hpp"
#include "world/Level.hpp"
#include <format>

namespace SneakEngine {

DoorState::DoorState(const EntityProperties& props)
    : m_open(props.getBool("open", true)),
      m_horizontal(props.getBool("horizontal", false)),
      m_openTime(props.getInt("openTime", -1)),
      m_closeTime(props.getInt("closeTime", -1)) {
    m_turnsUntilToggle = m_open ? m_openTime : m_closeTime;
}

PropertyDefaults DoorState::defaultProperties() {
    return {
        {"open", JsonValue(true)},
        {"horizontal", JsonValue(false)},
        {"openTime", JsonValue(-1)},
        {"closeTime", JsonValue(-1)},
    };
}

PropertyRules DoorState::propertyRules() {
    return {
        {"open", PropertyType::Boolean, true},
        {"horizontal", PropertyType::Boolean, true},
        {"openTime", PropertyType::Number, true},
        {"closeTime", PropertyType::Number, true},
    };
}

void DoorState::step(Entity& self, Level& level) {
    if (m_turnsUntilToggle > 0) {
        --m_turnsUntilToggle;
    }
    // A refused close leaves the count at 0, so it is retried next step
    if (m_turnsUntilToggle == 0) {
        toggle(self, level);
    }
}

void DoorState::trigger(Entity& self, Level& level, Entity*) {
    toggle(self, level);
}

bool DoorState::toggle(Entity& self, Level& level) {
    if (m_open) {
        for (const Entity* occupant : level.entitiesAt(self.getMapPosition())) {
            if (occupant != &self) {
                TRIGGER_WARN(std::format("Can't close {} this step; doorway occupied by {}",
                                         self.toString(), occupant->toString()));
                return false;
            }
        }
    }

    m_open = !m_open;
    m_turnsUntilToggle = m_open ? m_openTime : m_closeTime;
    TRIGGER_DEBUG(std::format("{} is now {}", self.toString(), m_open ? "open" : "closed"));
    return true;
}

} // namespace SneakEngine
