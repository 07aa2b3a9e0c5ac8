/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/TurnController.hpp"
#include "core/Logger.hpp"
#include "entities/Facing.hpp"
#include "world/Level.hpp"
#include <format>

namespace SneakEngine {

namespace {
int facingFor(Direction direction) {
    switch (direction) {
        case Direction::Up:    return Facing::UP;
        case Direction::Down:  return Facing::DOWN;
        case Direction::Left:  return Facing::LEFT;
        case Direction::Right: return Facing::RIGHT;
    }
    return Facing::RIGHT;
}
} // namespace

std::ostream& operator<<(std::ostream& os, Direction direction) {
    return os << Facing::toString(facingFor(direction));
}

std::ostream& operator<<(std::ostream& os, ActionType type) {
    switch (type) {
        case ActionType::Move:     return os << "Move";
        case ActionType::Interact: return os << "Interact";
        case ActionType::Wait:     return os << "Wait";
    }
    return os << "Unknown";
}

bool TurnController::perform(const PlayerAction& action) {
    switch (action.type) {
        case ActionType::Move:     return move(action.direction);
        case ActionType::Interact: return interact();
        case ActionType::Wait:     return wait();
    }
    return false;
}

bool TurnController::acceptsInput() const {
    if (m_level.isComplete()) {
        TURN_DEBUG("Level already complete; action ignored");
        return false;
    }
    if (m_level.isStepping()) {
        TURN_WARN("Action requested while entities are stepping; ignored");
        return false;
    }
    return true;
}

bool TurnController::advance() {
    if (!m_level.stepAllEntities()) {
        return false;
    }
    ++m_turnsTaken;
    return true;
}

bool TurnController::move(Direction direction) {
    if (!acceptsInput()) {
        return false;
    }

    Entity& player = m_level.player();
    const int facing = facingFor(direction);
    const Point delta = Facing::delta(facing);
    const Point target = player.getMapPosition().translated(delta.getX(), delta.getY());

    if (m_level.isBlockedAt(target)) {
        TURN_DEBUG(std::format("Move {} to {} blocked", Facing::toString(facing), target.toString()));
        return false;
    }

    const Point from = player.getMapPosition();
    const int previousFacing = player.getFacing();
    player.setFacing(facing);
    player.setMapPosition(target);
    if (!advance()) {
        player.setMapPosition(from);
        player.setFacing(previousFacing);
        return false;
    }

    for (Entity* other : m_level.entitiesAt(target)) {
        if (other != &player) {
            other->touch(m_level, player);
        }
    }
    return true;
}

bool TurnController::interact() {
    if (!acceptsInput() || !advance()) {
        return false;
    }

    Entity& player = m_level.player();
    for (Entity* other : m_level.entitiesAt(player.getMapPosition())) {
        if (other != &player) {
            other->trigger(m_level, &player);
        }
    }
    return true;
}

bool TurnController::wait() {
    if (!acceptsInput()) {
        return false;
    }
    return advance();
}

std::optional<PlayerAction> TurnController::actionForKey(char key) {
    switch (key) {
        case 'w': case 'W': return PlayerAction::move(Direction::Up);
        case 's': case 'S': return PlayerAction::move(Direction::Down);
        case 'a': case 'A': return PlayerAction::move(Direction::Left);
        case 'd': case 'D': return PlayerAction::move(Direction::Right);
        case ' ': case 'q': case 'Q': return PlayerAction::interact();
        case 'e': case 'E': case '.': case '\n': return PlayerAction::wait();
        default: return std::nullopt;
    }
}

} // namespace SneakEngine
