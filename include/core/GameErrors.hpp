/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_ERRORS_HPP
#define GAME_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace SneakEngine {

/**
 * @brief Base for every fatal load or configuration failure.
 *
 * Thrown while a level is being built. A level is never left partially
 * constructed: once one of these escapes, the level object does not exist.
 */
class SneakError : public std::runtime_error {
public:
    explicit SneakError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed level data: grid size, tile IDs, player start, duplicate IDs, unknown types
class LevelLoadError : public SneakError {
public:
    explicit LevelLoadError(const std::string& what)
        : SneakError("Sneak Engine - Level load failed: " + what) {}
};

// A single entity's properties or references are invalid
class EntityConfigError : public SneakError {
public:
    EntityConfigError(const std::string& entityId, const std::string& what)
        : SneakError("Sneak Engine - Entity '" + entityId + "': " + what),
          m_entityId(entityId) {}

    const std::string& entityId() const noexcept { return m_entityId; }

private:
    std::string m_entityId;
};

} // namespace SneakEngine

#endif // GAME_ERRORS_HPP
