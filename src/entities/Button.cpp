/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Button.hpp"
#include "core/Logger.hpp"
#include "entities/Entity.hpp"
#include "world/Level.hpp"
#include <format>

namespace SneakEngine {

ButtonState::ButtonState(const EntityProperties& props)
    : m_pressed(props.getBool("pressed", false)),
      m_cycleTime(props.getInt("cycleTime", -1)) {
    m_turnsUntilToggle = m_pressed ? m_cycleTime : -1;
}

PropertyDefaults ButtonState::defaultProperties() {
    return {
        {"pressed", JsonValue(false)},
        {"cycleTime", JsonValue(-1)},
    };
}

PropertyRules ButtonState::propertyRules() {
    return {
        {"pressed", PropertyType::Boolean, true},
        {"cycleTime", PropertyType::Number, true},
    };
}

void ButtonState::step(Entity& self, Level&) {
    if (!m_pressed) {
        return;
    }
    if (m_turnsUntilToggle > 0) {
        --m_turnsUntilToggle;
    }
    if (m_turnsUntilToggle == 0) {
        release(self);
    }
}

void ButtonState::trigger(Entity& self, Level& level, Entity* activator) {
    if (!m_pressed) {
        m_pressed = true;
        m_turnsUntilToggle = m_cycleTime;
        TRIGGER_DEBUG(std::format("{} pressed", self.toString()));
        self.triggerLinkedEntities(level);
        return;
    }

    if (activator == nullptr || !activator->is(EntityKind::Player)) {
        release(self);
    }
}

void ButtonState::release(Entity& self) {
    m_pressed = false;
    m_turnsUntilToggle = -1;
    TRIGGER_DEBUG(std::format("{} released", self.toString()));
}

} // namespace SneakEngine
