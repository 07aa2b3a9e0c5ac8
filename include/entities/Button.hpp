/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BUTTON_HPP
#define BUTTON_HPP

#include "entities/EntityProperties.hpp"

namespace SneakEngine {

class Entity;
class Level;

/**
 * @brief Pressure button wired to other entities by ID.
 *
 * Pressing fires every entity in the button's trigger list. A button with a
 * cycleTime pops back out after that many steps. Players can press but not
 * release a button; any other activator releases a pressed one.
 */
class ButtonState {
public:
    explicit ButtonState(const EntityProperties& props);

    static PropertyDefaults defaultProperties();
    static PropertyRules propertyRules();

    bool blocksMovement() const noexcept { return false; }
    void step(Entity& self, Level& level);
    void trigger(Entity& self, Level& level, Entity* activator);
    void touch(Entity&, Level&, Entity&) {}

    [[nodiscard]] bool isPressed() const noexcept { return m_pressed; }
    [[nodiscard]] int getCycleTime() const noexcept { return m_cycleTime; }
    [[nodiscard]] int getTurnsUntilToggle() const noexcept { return m_turnsUntilToggle; }

private:
    void release(Entity& self);

    bool m_pressed;
    int m_cycleTime;
    int m_turnsUntilToggle;
};

} // namespace SneakEngine

#endif // BUTTON_HPP
