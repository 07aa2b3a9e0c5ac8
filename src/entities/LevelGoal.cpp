/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/LevelGoal.hpp"
#include "entities/Entity.hpp"
#include "world/Level.hpp"

namespace SneakEngine {

GoalState::GoalState(const EntityProperties& props)
    : m_winLevel(props.getBool("winLevel", true)) {}

PropertyDefaults GoalState::defaultProperties() {
    return {
        {"winLevel", JsonValue(true)},
    };
}

PropertyRules GoalState::propertyRules() {
    return {
        {"winLevel", PropertyType::Boolean, false},
    };
}

void GoalState::trigger(Entity& self, Level& level, Entity* activator) {
    if (activator == nullptr || !activator->is(EntityKind::Player)) {
        return;
    }
    level.reportCompletion(LevelCompleteEvent{self.getID(), m_winLevel, self.getMapPosition(),
                                              level.turnNumber()});
}

void GoalState::touch(Entity& self, Level& level, Entity& toucher) {
    trigger(self, level, &toucher);
}

} // namespace SneakEngine
