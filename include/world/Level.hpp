/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LEVEL_HPP
#define LEVEL_HPP

#include "entities/Entity.hpp"
#include "entities/EntityRegistry.hpp"
#include "events/LevelEvents.hpp"
#include "utils/Vector2D.hpp"
#include "world/LevelData.hpp"
#include <boost/container/small_vector.hpp>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace SneakEngine {

// Most tiles hold at most a couple of entities
using EntityList = boost::container::small_vector<Entity*, 4>;

/**
 * @brief A validated, playable level: tile grid plus every entity on it.
 *
 * The constructor checks the whole descriptor and either produces a complete
 * level or throws; there is no partially loaded state. Entities are stepped
 * in registration order (authored order, player last). Everything is
 * single-threaded and synchronous: a trigger fired during a step runs to
 * completion before the next entity steps.
 *
 * Usage:
 *   Level level(LevelLoader::loadFromFile("res/levels/level1.json"));
 *   if (!level.isBlockedAt(target)) { ... }
 *   level.stepAllEntities();
 */
class Level {
public:
    /**
     * @throws LevelLoadError for malformed grids, tile IDs, player start
     *         markers, duplicate IDs, unknown types or out-of-map entities
     * @throws EntityConfigError for invalid entity properties or guard patrols
     */
    explicit Level(const LevelDescriptor& descriptor,
                   const EntityRegistry& registry = EntityRegistry::builtIn());

    Level(const Level&) = delete;
    Level& operator=(const Level&) = delete;

    [[nodiscard]] const std::string& getName() const noexcept { return m_name; }
    [[nodiscard]] int getWidth() const noexcept { return m_width; }
    [[nodiscard]] int getHeight() const noexcept { return m_height; }
    [[nodiscard]] const Tileset& getTileset() const noexcept { return *m_tileset; }

    // ---- Spatial queries --------------------------------------------------

    [[nodiscard]] bool isInBounds(Point mapPosition) const noexcept;

    // nullptr outside the map; callers treat that as solid
    const Tile* tileAt(Point mapPosition) const;

    // Entities standing on the tile, in registration order
    EntityList entitiesAt(Point mapPosition) const;

    // Off-map tiles, blocking tiles and tiles holding a blocking entity
    bool isBlockedAt(Point mapPosition) const;

    // ---- Lookup -------------------------------------------------------------

    Entity* entityWithID(const std::string& id) const;

    // Missing IDs are logged and skipped
    EntityList entitiesWithIDs(std::span<const std::string> ids) const;
    EntityList entitiesOfKind(EntityKind kind) const;

    [[nodiscard]] const std::vector<std::unique_ptr<Entity>>& getEntities() const noexcept { return m_entities; }
    [[nodiscard]] Entity& player() const noexcept { return *m_player; }
    [[nodiscard]] Point getPlayerStartPosition() const noexcept { return m_playerStart; }

    // ---- Turns and triggers -------------------------------------------------

    // Triggers every entity in `ids` with `activator`; an empty list does nothing
    void triggerEntitiesWithIDs(std::span<const std::string> ids, Entity* activator);

    /**
     * @brief Advances the level by one turn.
     * @return false (and does nothing) if called from inside a step
     */
    bool stepAllEntities();

    [[nodiscard]] size_t turnNumber() const noexcept { return m_turn; }

    // ---- Completion ---------------------------------------------------------

    CompletionHandlerId addCompletionHandler(LevelCompleteHandler handler);
    bool removeCompletionHandler(CompletionHandlerId id);

    // Called by goals; records the outcome and notifies handlers
    void reportCompletion(const LevelCompleteEvent& event);

    [[nodiscard]] bool isComplete() const noexcept { return m_outcome.has_value(); }
    [[nodiscard]] const std::optional<LevelCompleteEvent>& getOutcome() const noexcept { return m_outcome; }

    // True while stepAllEntities is running
    [[nodiscard]] bool isStepping() const noexcept { return m_stepping; }

    // ---- Debug introspection ------------------------------------------------

    // Every entity on the tile with all of its properties
    std::string describeEntitiesAt(Point mapPosition) const;

    /**
     * @brief Tile centres for drawing trigger links.
     *
     * First the entity's own centre, then the centre of every entity its
     * trigger list resolves to. Empty when the entity triggers nothing.
     */
    std::vector<Vector2D> triggerLinksFor(const Entity& entity) const;

private:
    void validateGrid() const;
    void createEntities(const LevelDescriptor& descriptor, const EntityRegistry& registry);
    void registerEntity(std::unique_ptr<Entity> entity);
    void locatePlayerStart();
    void spawnGuards();

    [[noreturn]] void fail(const std::string& what) const;

    std::string m_name;
    int m_width;
    int m_height;
    std::shared_ptr<const Tileset> m_tileset;
    std::vector<TileID> m_tiles;

    std::vector<std::unique_ptr<Entity>> m_entities;
    std::unordered_map<std::string, Entity*> m_entitiesById;
    Entity* m_player{nullptr};
    Point m_playerStart;

    size_t m_turn{0};
    bool m_stepping{false};

    struct CompletionListener {
        CompletionHandlerId id;
        LevelCompleteHandler handler;
    };
    std::vector<CompletionListener> m_completionListeners;
    CompletionHandlerId m_nextHandlerId{1};
    std::optional<LevelCompleteEvent> m_outcome;
};

} // namespace SneakEngine

#endif // LEVEL_HPP
