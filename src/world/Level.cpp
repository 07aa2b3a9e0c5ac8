/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/Level.hpp"
#include "core/GameErrors.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>

namespace SneakEngine {

Level::Level(const LevelDescriptor& descriptor, const EntityRegistry& registry)
    : m_name(descriptor.name.empty() ? "unnamed" : descriptor.name),
      m_width(descriptor.width),
      m_height(descriptor.height),
      m_tileset(descriptor.tileset ? descriptor.tileset : Tileset::standard()),
      m_tiles(descriptor.tiles) {
    validateGrid();
    createEntities(descriptor, registry);
    locatePlayerStart();

    auto player = registry.create("Player", m_playerStart, JsonObject{});
    registerEntity(std::move(player));
    m_player = m_entities.back().get();

    spawnGuards();

    LEVEL_INFO(std::format("Level '{}' loaded: {}x{}, {} entities, player at {}", m_name, m_width,
                           m_height, m_entities.size(), m_playerStart.toString()));
}

void Level::fail(const std::string& what) const {
    std::string msg = std::format("level '{}': {}", m_name, what);
    LEVEL_ERROR(msg);
    throw LevelLoadError(msg);
}

void Level::validateGrid() const {
    if (m_width <= 0 || m_height <= 0) {
        fail(std::format("dimensions must be positive, got {}x{}", m_width, m_height));
    }

    const size_t expected = static_cast<size_t>(m_width) * static_cast<size_t>(m_height);
    if (m_tiles.size() != expected) {
        fail(std::format("tile grid has {} entries, expected {} ({}x{})", m_tiles.size(), expected,
                         m_width, m_height));
    }

    for (size_t i = 0; i < m_tiles.size(); ++i) {
        if (!m_tileset->isValidTileID(m_tiles[i])) {
            fail(std::format("tile ID {} at {} is not in tileset '{}'", m_tiles[i],
                             Point(static_cast<int>(i % static_cast<size_t>(m_width)),
                                   static_cast<int>(i / static_cast<size_t>(m_width))).toString(),
                             m_tileset->getName()));
        }
    }
}

void Level::createEntities(const LevelDescriptor& descriptor, const EntityRegistry& registry) {
    m_entities.reserve(descriptor.entities.size() + 1);

    for (const auto& entry : descriptor.entities) {
        const EntityTypeInfo* info = registry.findType(entry.type);
        if (info == nullptr) {
            fail(std::format("unknown entity type '{}'", entry.type));
        }
        if (info->kind == EntityKind::Player) {
            fail("the player is placed from the player start marker and cannot be authored");
        }

        // Guards are moved onto their spawn waypoint later
        Point position = entry.position.value_or(Point(0, 0));
        if (!entry.position && info->kind != EntityKind::Guard) {
            fail(std::format("{} entity has no position", entry.type));
        }
        if (entry.position && !isInBounds(position)) {
            fail(std::format("{} entity at {} lies outside the map", entry.type, position.toString()));
        }

        registerEntity(registry.create(entry.type, position, entry.properties));
    }
}

void Level::registerEntity(std::unique_ptr<Entity> entity) {
    const std::string& id = entity->getID();
    if (!m_entitiesById.emplace(id, entity.get()).second) {
        fail(std::format("duplicate entity ID '{}'", id));
    }
    m_entities.push_back(std::move(entity));
}

void Level::locatePlayerStart() {
    std::vector<Point> markers;

    for (int y = 0; y < m_height; ++y) {
        for (int x = 0; x < m_width; ++x) {
            const Tile* tile = tileAt(Point(x, y));
            if (tile != nullptr && tile->playerStart) {
                markers.emplace_back(x, y);
            }
        }
    }
    for (const auto& entity : m_entities) {
        if (entity->is(EntityKind::PlayerStart)) {
            markers.push_back(entity->getMapPosition());
        }
    }

    if (markers.size() != 1) {
        fail(std::format("expected exactly one player start marker, found {}", markers.size()));
    }
    m_playerStart = markers.front();
}

void Level::spawnGuards() {
    for (const auto& entity : m_entities) {
        if (GuardState* guard = entity->stateAs<GuardState>()) {
            guard->spawn(*entity, *this);
        }
    }
}

bool Level::isInBounds(Point mapPosition) const noexcept {
    return mapPosition.getX() >= 0 && mapPosition.getX() < m_width &&
           mapPosition.getY() >= 0 && mapPosition.getY() < m_height;
}

const Tile* Level::tileAt(Point mapPosition) const {
    if (!isInBounds(mapPosition)) {
        return nullptr;
    }
    const size_t index = static_cast<size_t>(mapPosition.getY()) * static_cast<size_t>(m_width) +
                         static_cast<size_t>(mapPosition.getX());
    return m_tileset->tileForID(m_tiles[index]);
}

EntityList Level::entitiesAt(Point mapPosition) const {
    EntityList result;
    if (!isInBounds(mapPosition)) {
        return result;
    }
    const Point world = mapPosition.scaled(TILE_SIZE);
    for (const auto& entity : m_entities) {
        if (entity->getWorldPosition() == world) {
            result.push_back(entity.get());
        }
    }
    return result;
}

bool Level::isBlockedAt(Point mapPosition) const {
    const Tile* tile = tileAt(mapPosition);
    if (tile == nullptr || tile->blocksMovement) {
        return true;
    }
    const EntityList here = entitiesAt(mapPosition);
    return std::any_of(here.begin(), here.end(),
                       [](const Entity* e) { return e->blocksActorMovement(); });
}

Entity* Level::entityWithID(const std::string& id) const {
    auto it = m_entitiesById.find(id);
    return it == m_entitiesById.end() ? nullptr : it->second;
}

EntityList Level::entitiesWithIDs(std::span<const std::string> ids) const {
    EntityList result;
    for (const auto& id : ids) {
        if (Entity* entity = entityWithID(id)) {
            result.push_back(entity);
        }
    }
    if (result.size() != ids.size()) {
        std::string missing;
        for (const auto& id : ids) {
            if (entityWithID(id) == nullptr) {
                missing += missing.empty() ? id : ", " + id;
            }
        }
        LEVEL_WARN(std::format("Entity lookup returned {} of {} requested; missing: {}",
                               result.size(), ids.size(), missing));
    }
    return result;
}

EntityList Level::entitiesOfKind(EntityKind kind) const {
    EntityList result;
    for (const auto& entity : m_entities) {
        if (entity->is(kind)) {
            result.push_back(entity.get());
        }
    }
    return result;
}

void Level::triggerEntitiesWithIDs(std::span<const std::string> ids, Entity* activator) {
    if (ids.empty()) {
        return;
    }
    for (Entity* target : entitiesWithIDs(ids)) {
        target->trigger(*this, activator);
    }
}

bool Level::stepAllEntities() {
    if (m_stepping) {
        LEVEL_ERROR(std::format("Level '{}': stepAllEntities called during a step; ignored", m_name));
        return false;
    }

    m_stepping = true;
    for (size_t i = 0; i < m_entities.size(); ++i) {
        m_entities[i]->step(*this);
    }
    m_stepping = false;

    ++m_turn;
    LEVEL_DEBUG(std::format("Level '{}' completed turn {}", m_name, m_turn));
    return true;
}

CompletionHandlerId Level::addCompletionHandler(LevelCompleteHandler handler) {
    CompletionHandlerId id = m_nextHandlerId++;
    m_completionListeners.push_back({id, std::move(handler)});
    return id;
}

bool Level::removeCompletionHandler(CompletionHandlerId id) {
    auto it = std::find_if(m_completionListeners.begin(), m_completionListeners.end(),
                           [id](const CompletionListener& l) { return l.id == id; });
    if (it == m_completionListeners.end()) {
        return false;
    }
    m_completionListeners.erase(it);
    return true;
}

void Level::reportCompletion(const LevelCompleteEvent& event) {
    if (m_outcome) {
        LEVEL_WARN(std::format("Level '{}' already completed by '{}'; ignoring goal '{}'", m_name,
                               m_outcome->goalId, event.goalId));
        return;
    }

    m_outcome = event;
    LEVEL_INFO(std::format("Level '{}' {} at goal '{}' on turn {}", m_name,
                           event.won ? "won" : "lost", event.goalId, event.turn));

    // Handlers may remove themselves while being notified
    auto listeners = m_completionListeners;
    for (const auto& listener : listeners) {
        listener.handler(event);
    }
}

std::string Level::describeEntitiesAt(Point mapPosition) const {
    const EntityList here = entitiesAt(mapPosition);
    if (here.empty()) {
        return std::format("No entities at {}", mapPosition.toString());
    }
    std::string text;
    for (const Entity* entity : here) {
        if (!text.empty()) {
            text += '\n';
        }
        text += entity->describe();
    }
    return text;
}

std::vector<Vector2D> Level::triggerLinksFor(const Entity& entity) const {
    std::vector<Vector2D> points;
    const auto& ids = entity.getTriggerIDs();
    if (ids.empty()) {
        return points;
    }

    auto centreOf = [](const Entity& e) {
        Point c = e.getWorldCenter();
        return Vector2D(static_cast<float>(c.getX()), static_cast<float>(c.getY()));
    };

    points.push_back(centreOf(entity));
    for (const Entity* target : entitiesWithIDs(ids)) {
        points.push_back(centreOf(*target));
    }
    return points;
}

} // namespace SneakEngine
