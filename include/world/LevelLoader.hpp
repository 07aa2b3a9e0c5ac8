/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LEVEL_LOADER_HPP
#define LEVEL_LOADER_HPP

#include "world/LevelData.hpp"
#include <string>
#include <string_view>

namespace SneakEngine {

/**
 * @brief Reads level descriptors from JSON.
 *
 * File layout:
 *   { "name": "...", "width": W, "height": H, "tileset": "standard",
 *     "tiles": [ ...W*H tile IDs... ],
 *     "entities": [ { "type": "Door", "position": [x, y], ...properties } ] }
 *
 * Only the file's shape is checked here; grid contents and entity
 * properties are validated when the Level is built.
 */
class LevelLoader {
public:
    /**
     * @throws LevelLoadError if the file cannot be read or has the wrong shape
     */
    static LevelDescriptor loadFromFile(const std::string& path);

    // `sourceName` only appears in error messages
    static LevelDescriptor loadFromString(std::string_view json,
                                          const std::string& sourceName = "<memory>");

    static LevelDescriptor fromJson(const JsonValue& root, const std::string& sourceName);
};

} // namespace SneakEngine

#endif // LEVEL_LOADER_HPP
