/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GUARD_HPP
#define GUARD_HPP

#include "ai/VisionCone.hpp"
#include "entities/EntityProperties.hpp"
#include <string>
#include <vector>

namespace SneakEngine {

class Entity;
class Level;

/**
 * @brief Patrol state machine and vision for a guard.
 *
 * A guard walks an authored chain of waypoints, one tile per step, turning
 * in place whenever it has to change direction (a turn uses up the step).
 * Consecutive waypoints must share a row or column. Walking into map
 * geometry halts the patrol for good; walking into a closed door opens it;
 * any other obstruction is waited out.
 *
 * Patrol index: -1 before the first target is chosen, -2 once the patrol
 * has ended, otherwise the index of the current target in the patrol list.
 */
class GuardState {
public:
    static constexpr int NOT_STARTED = -1;
    static constexpr int HALTED = -2;
    static constexpr int DEFAULT_FOV = 90;

    GuardState(const EntityProperties& props, const std::string& entityId);

    static PropertyDefaults defaultProperties();
    static PropertyRules propertyRules();

    bool blocksMovement() const noexcept { return true; }
    void step(Entity& self, Level& level);
    void trigger(Entity&, Level&, Entity*) {}
    void touch(Entity&, Level&, Entity&) {}

    /**
     * @brief Resolves waypoints, places the guard on its spawn and picks the first target.
     *
     * Called once by the level after every entity is registered.
     * @throws EntityConfigError for unknown or non-waypoint IDs and diagonal legs
     */
    void spawn(Entity& self, Level& level);

    void refreshVision(const Entity& self, const Level& level);

    [[nodiscard]] bool isSpawned() const noexcept { return m_spawned; }
    [[nodiscard]] bool isHalted() const noexcept { return m_patrolIndex == HALTED; }
    [[nodiscard]] int getPatrolIndex() const noexcept { return m_patrolIndex; }
    [[nodiscard]] const Entity* getTarget() const noexcept { return m_target; }
    [[nodiscard]] const Entity* getSpawnWaypoint() const noexcept { return m_spawnWaypoint; }
    [[nodiscard]] const std::vector<Entity*>& getPatrol() const noexcept { return m_patrol; }
    [[nodiscard]] bool isLooping() const noexcept { return m_loop; }
    [[nodiscard]] int getFieldOfView() const noexcept { return m_fov; }
    [[nodiscard]] const VisionCone& getVisionCone() const noexcept { return m_vision; }

private:
    void selectNextWaypoint();
    void halt();
    void validatePatrol(const std::string& entityId) const;

    std::string m_spawnId;
    std::vector<std::string> m_patrolIds;
    bool m_loop;
    int m_fov;

    bool m_spawned{false};
    Entity* m_spawnWaypoint{nullptr};
    std::vector<Entity*> m_patrol;
    int m_patrolIndex{NOT_STARTED};
    Entity* m_target{nullptr};
    VisionCone m_vision;
};

} // namespace SneakEngine

#endif // GUARD_HPP
