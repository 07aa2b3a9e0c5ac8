/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TURN_CONTROLLER_HPP
#define TURN_CONTROLLER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>

namespace SneakEngine {

class Level;

enum class Direction : uint8_t { Up, Down, Left, Right };

enum class ActionType : uint8_t { Move, Interact, Wait };

std::ostream& operator<<(std::ostream& os, Direction direction);
std::ostream& operator<<(std::ostream& os, ActionType type);

struct PlayerAction {
    ActionType type{ActionType::Wait};
    Direction direction{Direction::Right};

    static PlayerAction move(Direction d) { return {ActionType::Move, d}; }
    static PlayerAction interact() { return {ActionType::Interact, Direction::Right}; }
    static PlayerAction wait() { return {ActionType::Wait, Direction::Right}; }
};

/**
 * @brief Turns one player action into one level turn.
 *
 * - Move: refused without consuming a turn if the target tile is blocked.
 *   Otherwise the player moves, every entity steps, then the entities on
 *   the new tile are touched by the player.
 * - Interact: every entity steps, then everything on the player's tile is
 *   triggered by the player.
 * - Wait: every entity steps.
 *
 * Once the level has been completed no further actions are accepted.
 */
class TurnController {
public:
    explicit TurnController(Level& level) : m_level(level) {}

    // @return true if a turn was consumed
    bool perform(const PlayerAction& action);

    bool move(Direction direction);
    bool interact();
    bool wait();

    [[nodiscard]] size_t getTurnsTaken() const noexcept { return m_turnsTaken; }

    /**
     * @brief Keyboard-style mapping used by scripted replays.
     *
     * w/a/s/d move; space or q interacts; e, '.' or newline waits.
     */
    static std::optional<PlayerAction> actionForKey(char key);

private:
    bool acceptsInput() const;
    bool advance();

    Level& m_level;
    size_t m_turnsTaken{0};
};

} // namespace SneakEngine

#endif // TURN_CONTROLLER_HPP
