/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DOOR_HPP
#define DOOR_HPP

#include "entities/EntityProperties.hpp"

namespace SneakEngine {

class Entity;
class Level;

/**
 * @brief Door that flips between open and closed.
 *
 * Every trigger flips the door. When a countdown is configured for the
 * state the door just entered (openTime while open, closeTime while closed)
 * the door flips back by itself after that many steps; -1 means it stays.
 * A door will not close on top of another entity.
 */
class DoorState {
public:
    explicit DoorState(const EntityProperties& props);

    static PropertyDefaults defaultProperties();
    static PropertyRules propertyRules();

    bool blocksMovement() const noexcept { return !m_open; }
    void step(Entity& self, Level& level);
    void trigger(Entity& self, Level& level, Entity* activator);
    void touch(Entity&, Level&, Entity&) {}

    /**
     * @brief Flips the door unless closing is obstructed.
     * @return true if the door changed state
     */
    bool toggle(Entity& self, Level& level);

    [[nodiscard]] bool isOpen() const noexcept { return m_open; }
    [[nodiscard]] bool isHorizontal() const noexcept { return m_horizontal; }
    [[nodiscard]] int getOpenTime() const noexcept { return m_openTime; }
    [[nodiscard]] int getCloseTime() const noexcept { return m_closeTime; }
    [[nodiscard]] int getTurnsUntilToggle() const noexcept { return m_turnsUntilToggle; }

private:
    bool m_open;
    bool m_horizontal;
    int m_openTime;
    int m_closeTime;
    int m_turnsUntilToggle;
};

} // namespace SneakEngine

#endif // DOOR_HPP
