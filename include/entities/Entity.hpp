/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_HPP
#define ENTITY_HPP

#include "entities/Button.hpp"
#include "entities/Door.hpp"
#include "entities/EntityKind.hpp"
#include "entities/EntityProperties.hpp"
#include "entities/Facing.hpp"
#include "entities/Guard.hpp"
#include "entities/LevelGoal.hpp"
#include "entities/Markers.hpp"
#include "utils/Point.hpp"
#include <string>
#include <variant>
#include <vector>

namespace SneakEngine {

class Level;

/**
 * @brief Anything that lives on the map besides tiles.
 *
 * An Entity is a kind tag, a validated property record, a map position and
 * one per-kind state object. Common properties (id, facing, handedness,
 * visibility, trigger list) are decoded here; everything kind-specific is
 * decoded by the state. Entities are created by the EntityRegistry and owned
 * by their Level for its whole lifetime.
 */
class Entity {
public:
    using State = std::variant<MarkerState, PlayerState, DoorState, ButtonState,
                               GoalState, GuardState>;

    /**
     * @param properties Already merged and validated against commonRules()
     *        and the kind's own rules
     */
    Entity(EntityKind kind, EntityProperties properties, Point mapPosition, State state);

    Entity(const Entity&) = delete;
    Entity& operator=(const Entity&) = delete;

    // Defaults and rules every kind shares
    static PropertyDefaults commonDefaults(EntityKind kind);
    static PropertyRules commonRules();

    [[nodiscard]] const std::string& getID() const noexcept { return m_id; }
    [[nodiscard]] EntityKind getKind() const noexcept { return m_kind; }
    [[nodiscard]] bool is(EntityKind kind) const noexcept { return m_kind == kind; }
    [[nodiscard]] const EntityProperties& getProperties() const noexcept { return m_properties; }

    [[nodiscard]] Point getMapPosition() const noexcept { return m_mapPosition; }
    [[nodiscard]] Point getWorldPosition() const noexcept { return m_worldPosition; }
    // World-space centre of the entity's tile
    Point getWorldCenter() const;
    [[nodiscard]] int getWidth() const noexcept;
    [[nodiscard]] int getHeight() const noexcept;

    // Keep map and world positions in step with each other
    void setMapPosition(Point mapPosition);
    void setWorldPosition(Point worldPosition);

    [[nodiscard]] int getFacing() const noexcept { return m_facing; }
    void setFacing(int degrees);
    [[nodiscard]] Handedness getHandedness() const noexcept { return m_handedness; }
    [[nodiscard]] int getZOrder() const noexcept { return m_zOrder; }
    [[nodiscard]] bool isVisible() const noexcept { return m_visible; }
    [[nodiscard]] const std::vector<std::string>& getTriggerIDs() const noexcept { return m_triggerIds; }

    bool blocksActorMovement() const;

    // Advance one turn
    void step(Level& level);

    // activator may be null for triggers with no originating entity
    void trigger(Level& level, Entity* activator);

    // Called when `toucher` moves onto this entity's tile
    void touch(Level& level, Entity& toucher);

    // Fires every entity named in this entity's trigger list
    void triggerLinkedEntities(Level& level);

    template <typename T>
    T* stateAs() noexcept { return std::get_if<T>(&m_state); }

    template <typename T>
    const T* stateAs() const noexcept { return std::get_if<T>(&m_state); }

    // e.g. "Door(exitDoor) at [4, 8]"
    std::string toString() const;
    // toString() plus every property, one per line
    std::string describe() const;

private:
    EntityKind m_kind;
    EntityProperties m_properties;
    std::string m_id;
    Point m_mapPosition;
    Point m_worldPosition;
    int m_facing{Facing::RIGHT};
    Handedness m_handedness{Handedness::Right};
    int m_zOrder{0};
    bool m_visible{true};
    std::vector<std::string> m_triggerIds;
    State m_state;
};

} // namespace SneakEngine

#endif // ENTITY_HPP
