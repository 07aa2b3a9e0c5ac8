/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TILESET_HPP
#define TILESET_HPP

#include "world/Tile.hpp"
#include <boost/container/flat_map.hpp>
#include <memory>
#include <string>
#include <vector>

namespace SneakEngine {

// Numeric IDs of the standard tileset
namespace StandardTiles {
    constexpr TileID FLOOR = 0;
    constexpr TileID PLAYER_START = 1;
    constexpr TileID WALL = 2;
}

/**
 * @brief Lookup table from tile ID and tile name to Tile.
 *
 * Construction validates that IDs and names are unique; a tileset that
 * exists is always consistent.
 */
class Tileset {
public:
    /**
     * @throws LevelLoadError on a duplicate tile ID or name
     */
    Tileset(std::string name, std::vector<Tile> tiles);

    [[nodiscard]] const std::string& getName() const noexcept { return m_name; }

    [[nodiscard]] bool isValidTileID(TileID id) const { return m_byId.count(id) != 0; }

    // nullptr when the ID is unknown
    [[nodiscard]] const Tile* tileForID(TileID id) const;
    [[nodiscard]] const Tile* tileForName(const std::string& name) const;

    [[nodiscard]] size_t size() const noexcept { return m_tiles.size(); }

    /**
     * @brief FLOOR (0), PLAYER_START (1) and WALL (2).
     */
    static std::shared_ptr<const Tileset> standard();

    /**
     * @brief Resolves a tileset by the name a level file uses.
     * @return nullptr when no such tileset is known
     */
    static std::shared_ptr<const Tileset> byName(const std::string& name);

private:
    std::string m_name;
    std::vector<Tile> m_tiles;
    boost::container::flat_map<TileID, size_t> m_byId;
    boost::container::flat_map<std::string, size_t> m_byName;
};

} // namespace SneakEngine

#endif // TILESET_HPP
