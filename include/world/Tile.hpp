/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TILE_HPP
#define TILE_HPP

#include <cstdint>
#include <string>

namespace SneakEngine {

using TileID = int;

/**
 * @brief Immutable geometry descriptor for one kind of map cell.
 *
 * Tiles are created once by their Tileset and shared by every cell that
 * carries the same numeric ID.
 */
struct Tile {
    std::string name;
    TileID id{0};
    bool blocksMovement{false};
    bool playerStart{false};
};

} // namespace SneakEngine

#endif // TILE_HPP
