/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Guard.hpp"
#include "core/GameErrors.hpp"
#include "core/Logger.hpp"
#include "entities/Entity.hpp"
#include "managers/SettingsManager.hpp"
#include "world/Level.hpp"
#include <format>

namespace SneakEngine {

namespace {
[[noreturn]] void rejectGuard(const std::string& guardId, const std::string& what) {
    GUARD_ERROR(std::format("{}: {}", guardId, what));
    throw EntityConfigError(guardId, what);
}

Entity& resolveWaypoint(Level& level, const std::string& guardId, const std::string& waypointId,
                        const char* role) {
    Entity* found = level.entityWithID(waypointId);
    if (found == nullptr) {
        rejectGuard(guardId, std::format("{} waypoint '{}' does not exist", role, waypointId));
    }
    if (!found->is(EntityKind::Waypoint)) {
        rejectGuard(guardId, std::format("{} '{}' is a {}, not a Waypoint", role, waypointId,
                                         EntityTraits::kindToString(found->getKind())));
    }
    return *found;
}
} // namespace

GuardState::GuardState(const EntityProperties& props, const std::string& entityId)
    : m_spawnId(props.getString("spawn")),
      m_patrolIds(props.getStringList("patrol")),
      m_loop(props.getBool("patrolLoop", false)),
      m_fov(props.getInt("fov", DEFAULT_FOV)) {
    if (m_fov <= 0 || m_fov > 360) {
        rejectGuard(entityId, std::format("fov must be in (0, 360], got {}", m_fov));
    }
}

PropertyDefaults GuardState::defaultProperties() {
    return {
        {"patrolLoop", JsonValue(false)},
        {"fov", PropertyFactory([]() {
             return JsonValue(SettingsManager::Instance().get<int>("vision", "default_fov", DEFAULT_FOV));
         })},
    };
}

PropertyRules GuardState::propertyRules() {
    return {
        {"spawn", PropertyType::String, true},
        {"patrol", PropertyType::StringArray, false},
        {"patrolLoop", PropertyType::Boolean, false},
        {"fov", PropertyType::Number, true},
    };
}

void GuardState::spawn(Entity& self, Level& level) {
    Entity& spawnPoint = resolveWaypoint(level, self.getID(), m_spawnId, "spawn");

    m_patrol.clear();
    m_patrol.reserve(m_patrolIds.size());
    for (const auto& id : m_patrolIds) {
        m_patrol.push_back(&resolveWaypoint(level, self.getID(), id, "patrol"));
    }

    m_spawnWaypoint = &spawnPoint;
    validatePatrol(self.getID());

    self.setMapPosition(spawnPoint.getMapPosition());
    m_spawned = true;
    m_patrolIndex = NOT_STARTED;
    selectNextWaypoint();
    refreshVision(self, level);

    GUARD_INFO(std::format("{} spawned with {} patrol waypoint(s){}", self.toString(),
                           m_patrol.size(), m_loop ? ", looping" : ""));
}

void GuardState::validatePatrol(const std::string& entityId) const {
    auto checkLeg = [&](const Entity* from, const Entity* to) {
        Point a = from->getMapPosition();
        Point b = to->getMapPosition();
        if (a.getX() != b.getX() && a.getY() != b.getY()) {
            rejectGuard(entityId, std::format("waypoints '{}' {} and '{}' {} are not properly aligned",
                                              from->getID(), a.toString(), to->getID(), b.toString()));
        }
    };

    const Entity* previous = m_spawnWaypoint;
    for (const Entity* waypoint : m_patrol) {
        checkLeg(previous, waypoint);
        previous = waypoint;
    }
    if (m_loop && !m_patrol.empty()) {
        checkLeg(m_patrol.back(), m_patrol.front());
    }
}

void GuardState::selectNextWaypoint() {
    if (m_patrol.empty() || m_patrolIndex == HALTED) {
        m_target = nullptr;
        return;
    }

    ++m_patrolIndex;
    if (m_patrolIndex >= static_cast<int>(m_patrol.size())) {
        if (!m_loop) {
            halt();
            return;
        }
        m_patrolIndex = 0;
    }
    m_target = m_patrol[static_cast<size_t>(m_patrolIndex)];
}

void GuardState::halt() {
    m_patrolIndex = HALTED;
    m_target = nullptr;
}

void GuardState::refreshVision(const Entity& self, const Level& level) {
    int stepDegrees = SettingsManager::Instance().get<int>("vision", "step_degrees",
                                                           VisionCone::DEFAULT_STEP_DEGREES);
    m_vision = VisionCone::cast(level, self.getMapPosition(), self.getFacing(), m_fov, stepDegrees);
}

void GuardState::step(Entity& self, Level& level) {
    if (m_target == nullptr) {
        return;
    }

    // Consecutive waypoints on the same tile are passed over without spending the step
    for (size_t skipped = 0;
         m_target != nullptr && m_target->getMapPosition() == self.getMapPosition() &&
         skipped <= m_patrol.size();
         ++skipped) {
        selectNextWaypoint();
    }
    if (m_target == nullptr || m_target->getMapPosition() == self.getMapPosition()) {
        return;
    }

    const Point position = self.getMapPosition();
    const Point goal = m_target->getMapPosition();
    int dx = 0;
    int dy = 0;
    if (position.getX() == goal.getX()) {
        dy = goal.getY() > position.getY() ? 1 : -1;
    } else {
        dx = goal.getX() > position.getX() ? 1 : -1;
    }
    const int heading = Facing::fromDelta(dx, dy).value_or(self.getFacing());

    if (self.getFacing() != heading) {
        self.setFacing(Facing::turnToward(self.getFacing(), heading, self.getHandedness()));
        refreshVision(self, level);
        return;
    }

    const Point destination = position.translated(dx, dy);
    const Tile* tile = level.tileAt(destination);
    if (tile == nullptr || tile->blocksMovement) {
        GUARD_WARN(std::format("{}: halting patrol; move to {} is blocked by map geometry or is out of world",
                               self.toString(), destination.toString()));
        halt();
        return;
    }

    // Closed doors get one trigger to open before the path is judged
    bool blocked = false;
    for (Entity* other : level.entitiesAt(destination)) {
        if (!other->blocksActorMovement()) {
            continue;
        }
        if (EntityTraits::opensWhenTriggered(other->getKind())) {
            other->trigger(level, &self);
            if (!other->blocksActorMovement()) {
                continue;
            }
        }
        blocked = true;
    }
    if (blocked) {
        GUARD_WARN(std::format("{}: patrol blocked by one or more entities at {}; skipping this step",
                               self.toString(), destination.toString()));
        return;
    }

    self.setMapPosition(destination);
    refreshVision(self, level);

    if (destination == goal) {
        selectNextWaypoint();
    }
}

} // namespace SneakEngine
