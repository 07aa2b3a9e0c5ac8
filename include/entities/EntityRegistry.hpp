/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_REGISTRY_HPP
#define ENTITY_REGISTRY_HPP

#include "entities/Entity.hpp"
#include <boost/container/flat_map.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace SneakEngine {

/**
 * @brief How to build one entity type from authored properties.
 */
struct EntityTypeInfo {
    EntityKind kind{EntityKind::Waypoint};
    PropertyDefaults defaults;
    PropertyRules rules;
    // Decodes validated properties into the kind's state; may throw EntityConfigError
    std::function<Entity::State(const EntityProperties&, const std::string& entityId)> makeState;
};

/**
 * @brief Maps level-file type tags ("Door", "Guard", ...) to constructors.
 *
 * builtIn() holds every kind the engine ships with, including the legacy
 * aliases "PlayerStartEntity" and "GuardBase". Custom registries can be
 * built for tests or tools by copying builtIn() and adding types.
 */
class EntityRegistry {
public:
    EntityRegistry() = default;

    static const EntityRegistry& builtIn();

    /**
     * @throws std::invalid_argument if the tag is already registered
     */
    void registerType(const std::string& tag, EntityTypeInfo info);

    [[nodiscard]] bool hasType(const std::string& tag) const;
    [[nodiscard]] const EntityTypeInfo* findType(const std::string& tag) const;
    std::vector<std::string> getTypeNames() const;

    /**
     * @brief Merges, normalises and validates properties, then builds the entity.
     * @throws LevelLoadError for an unknown tag
     * @throws EntityConfigError for invalid properties
     */
    std::unique_ptr<Entity> create(const std::string& tag, Point mapPosition,
                                   const JsonObject& properties) const;

private:
    boost::container::flat_map<std::string, EntityTypeInfo> m_types;
};

} // namespace SneakEngine

#endif // ENTITY_REGISTRY_HPP
