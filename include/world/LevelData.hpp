/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LEVEL_DATA_HPP
#define LEVEL_DATA_HPP

#include "utils/JsonReader.hpp"
#include "utils/Point.hpp"
#include "world/Tileset.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace SneakEngine {

// Edge length of one map cell in world units
constexpr int TILE_SIZE = 32;

/**
 * @brief One authored entity before construction.
 *
 * `type` selects the kind through the EntityRegistry. `position` may only be
 * left empty for guards, which are placed on their spawn waypoint.
 */
struct EntityDescriptor {
    std::string type;
    std::optional<Point> position;
    JsonObject properties;
};

/**
 * @brief Everything needed to build a Level.
 *
 * `tiles` is row-major: the tile at (x, y) is tiles[y * width + x].
 */
struct LevelDescriptor {
    std::string name;
    int width{0};
    int height{0};
    std::vector<TileID> tiles;
    std::vector<EntityDescriptor> entities;
    std::shared_ptr<const Tileset> tileset;
};

} // namespace SneakEngine

#endif // LEVEL_DATA_HPP
