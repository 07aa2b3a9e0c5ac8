/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LEVEL_GOAL_HPP
#define LEVEL_GOAL_HPP

#include "entities/EntityProperties.hpp"

namespace SneakEngine {

class Entity;
class Level;

// Ends the level when the player triggers or walks onto it
class GoalState {
public:
    explicit GoalState(const EntityProperties& props);

    static PropertyDefaults defaultProperties();
    static PropertyRules propertyRules();

    bool blocksMovement() const noexcept { return false; }
    void step(Entity&, Level&) {}
    void trigger(Entity& self, Level& level, Entity* activator);
    void touch(Entity& self, Level& level, Entity& toucher);

    [[nodiscard]] bool winsLevel() const noexcept { return m_winLevel; }

private:
    bool m_winLevel;
};

} // namespace SneakEngine

#endif // LEVEL_GOAL_HPP
