/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/Tileset.hpp"
#include "core/GameErrors.hpp"
#include "core/Logger.hpp"
#include <format>

namespace SneakEngine {

Tileset::Tileset(std::string name, std::vector<Tile> tiles)
    : m_name(std::move(name)), m_tiles(std::move(tiles)) {
    m_byId.reserve(m_tiles.size());
    m_byName.reserve(m_tiles.size());

    for (size_t i = 0; i < m_tiles.size(); ++i) {
        const Tile& tile = m_tiles[i];
        if (!m_byId.emplace(tile.id, i).second) {
            std::string msg = std::format("tileset '{}' defines tile ID {} twice", m_name, tile.id);
            TILESET_ERROR(msg);
            throw LevelLoadError(msg);
        }
        if (!m_byName.emplace(tile.name, i).second) {
            std::string msg = std::format("tileset '{}' defines tile name '{}' twice", m_name, tile.name);
            TILESET_ERROR(msg);
            throw LevelLoadError(msg);
        }
    }
}

const Tile* Tileset::tileForID(TileID id) const {
    auto it = m_byId.find(id);
    return it == m_byId.end() ? nullptr : &m_tiles[it->second];
}

const Tile* Tileset::tileForName(const std::string& name) const {
    auto it = m_byName.find(name);
    if (it == m_byName.end()) {
        TILESET_WARN(std::format("tileset '{}' has no tile named '{}'", m_name, name));
        return nullptr;
    }
    return &m_tiles[it->second];
}

std::shared_ptr<const Tileset> Tileset::standard() {
    static const std::shared_ptr<const Tileset> s_standard = std::make_shared<const Tileset>(
        "standard",
        std::vector<Tile>{
            {"FLOOR", StandardTiles::FLOOR, false, false},
            {"PLAYER_START", StandardTiles::PLAYER_START, false, true},
            {"WALL", StandardTiles::WALL, true, false},
        });
    return s_standard;
}

std::shared_ptr<const Tileset> Tileset::byName(const std::string& name) {
    if (name.empty() || name == "standard") {
        return standard();
    }
    return nullptr;
}

} // namespace SneakEngine
